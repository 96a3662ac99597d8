#include "core/state/EventJournalJsonl.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <fstream>

namespace zenith {
namespace core {

EventJournalJsonl::EventJournalJsonl(const std::filesystem::path& file_path)
    : file_path_(utils::PathUtils::resolveRelativePath(file_path.string())) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto existing = scan(1);
    for (const auto& event : existing) {
        last_seq_ = std::max(last_seq_, event.seq);
    }
    if (!existing.empty()) {
        LOG_INFO("저널 복구: {} (마지막 seq {}, 손상 줄 {})", file_path_.string(), last_seq_, skipped_rows_);
    }
}

bool EventJournalJsonl::append(const JournalEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!utils::PathUtils::ensureParentDir(file_path_)) {
        return false;
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        return false;
    }

    JournalEvent stamped = event;
    stamped.seq = last_seq_ + 1;
    out << toJson(stamped).dump() << "\n";
    out.flush();
    if (!out.good()) {
        return false;
    }
    last_seq_ = stamped.seq;
    return true;
}

std::vector<JournalEvent> EventJournalJsonl::readFrom(std::uint64_t seq_inclusive) {
    std::lock_guard<std::mutex> lock(mutex_);
    return scan(seq_inclusive);
}

std::uint64_t EventJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

std::size_t EventJournalJsonl::skippedRows() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return skipped_rows_;
}

// mutex_ 잡은 상태에서 호출
std::vector<JournalEvent> EventJournalJsonl::scan(std::uint64_t seq_inclusive) {
    std::vector<JournalEvent> out;
    skipped_rows_ = 0;

    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        std::optional<JournalEvent> event;
        try {
            event = journalEventFromJson(nlohmann::json::parse(row));
        } catch (const nlohmann::json::parse_error&) {
            // 쓰기 도중 종료된 줄
            event.reset();
        }
        if (!event) {
            ++skipped_rows_;
            continue;
        }
        if (event->seq >= seq_inclusive) {
            out.push_back(std::move(*event));
        }
    }
    return out;
}

} // namespace core
} // namespace zenith
