#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace zenith {
namespace core {

// 결정/주문 감사 기록 종류
enum class JournalEventType {
    DECISION_RECORDED,
    ORDER_SUBMITTED,
    ORDER_REJECTED,
    ORDER_FILLED,
    POSITION_CLOSED,
    SYMBOL_BLOCKED
};

struct JournalEvent {
    std::uint64_t seq = 0;              // 저널이 부여 (1부터)
    long long ts_ms = 0;
    JournalEventType type = JournalEventType::DECISION_RECORDED;
    std::string symbol;
    std::string entity_id;              // orderId 또는 symbol-ts
    nlohmann::json payload = nlohmann::json::object();
};

const char* toString(JournalEventType type);
std::optional<JournalEventType> journalEventTypeFromString(const std::string& value);

// JSONL 한 줄 코덱
nlohmann::json toJson(const JournalEvent& event);

// seq 가 없거나 0, type 을 모르면 std::nullopt
std::optional<JournalEvent> journalEventFromJson(const nlohmann::json& line);

} // namespace core
} // namespace zenith
