#include "core/state/EventJournalJsonl.h"

#include <filesystem>
#include <fstream>
#include <cstdint>
#include <iostream>

int main() {
    const auto path = std::filesystem::temp_directory_path() / "zenith_test_event_journal.jsonl";
    std::error_code ec;
    std::filesystem::remove(path, ec);

    zenith::core::EventJournalJsonl journal(path);

    zenith::core::JournalEvent first;
    first.ts_ms = 1000;
    first.type = zenith::core::JournalEventType::ORDER_SUBMITTED;
    first.symbol = "BTCUSDT";
    first.entity_id = "BTCUSDT-1000-1";
    first.payload["quantity"] = "0.004";

    zenith::core::JournalEvent second;
    second.ts_ms = 2000;
    second.type = zenith::core::JournalEventType::ORDER_FILLED;
    second.symbol = "BTCUSDT";
    second.entity_id = "8389765";
    second.payload["avgPrice"] = 65000.5;

    if (!journal.append(first)) {
        std::cerr << "[TEST] append(first) failed\n";
        return 1;
    }
    if (!journal.append(second)) {
        std::cerr << "[TEST] append(second) failed\n";
        return 1;
    }

    if (journal.lastSeq() != 2) {
        std::cerr << "[TEST] lastSeq should be 2, got " << journal.lastSeq() << "\n";
        return 1;
    }

    // 깨진 줄은 건너뛰어야 함
    {
        std::ofstream out(path, std::ios::binary | std::ios::app);
        out << "{\"seq\": 3, \"type\": \"ORDER_REJ\n";
    }

    const auto rows = journal.readFrom(2);
    if (rows.size() != 1) {
        std::cerr << "[TEST] readFrom(2) should return 1 row, got " << rows.size() << "\n";
        return 1;
    }
    if (journal.skippedRows() != 1) {
        std::cerr << "[TEST] corrupted row should be counted, got " << journal.skippedRows() << "\n";
        return 1;
    }
    if (rows.front().seq != 2 || rows.front().symbol != "BTCUSDT" ||
        rows.front().type != zenith::core::JournalEventType::ORDER_FILLED) {
        std::cerr << "[TEST] unexpected row: " << rows.front().symbol << "\n";
        return 1;
    }

    // 재시작 후에도 seq 는 이어짐
    zenith::core::EventJournalJsonl reopened(path);
    if (reopened.lastSeq() != 2) {
        std::cerr << "[TEST] reopened lastSeq should be 2, got " << reopened.lastSeq() << "\n";
        return 1;
    }

    if (!reopened.record(zenith::core::JournalEventType::SYMBOL_BLOCKED, 3000, "FOOUSDT", "FOOUSDT",
                         {{"reason", "Invalid symbol."}}) ||
        reopened.lastSeq() != 3) {
        std::cerr << "[TEST] append after reopen failed\n";
        return 1;
    }

    const auto tail = reopened.readFrom(3);
    if (tail.size() != 1 || tail[0].payload.value("reason", "") != "Invalid symbol.") {
        std::cerr << "[TEST] recorded event should round trip\n";
        return 1;
    }

    // 모르는 type / seq 없는 줄은 거부
    if (zenith::core::journalEventFromJson({{"seq", std::uint64_t{4}}, {"type", "ORDER_LOST"}}).has_value() ||
        zenith::core::journalEventFromJson({{"type", "ORDER_FILLED"}}).has_value()) {
        std::cerr << "[TEST] invalid journal rows must be rejected\n";
        return 1;
    }

    std::filesystem::remove(path, ec);
    std::cout << "[TEST] EventJournal PASSED\n";
    return 0;
}
