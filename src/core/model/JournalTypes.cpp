#include "core/model/JournalTypes.h"

namespace zenith {
namespace core {

const char* toString(JournalEventType type) {
    switch (type) {
        case JournalEventType::DECISION_RECORDED: return "DECISION_RECORDED";
        case JournalEventType::ORDER_SUBMITTED: return "ORDER_SUBMITTED";
        case JournalEventType::ORDER_REJECTED: return "ORDER_REJECTED";
        case JournalEventType::ORDER_FILLED: return "ORDER_FILLED";
        case JournalEventType::POSITION_CLOSED: return "POSITION_CLOSED";
        case JournalEventType::SYMBOL_BLOCKED: return "SYMBOL_BLOCKED";
    }
    return "DECISION_RECORDED";
}

std::optional<JournalEventType> journalEventTypeFromString(const std::string& value) {
    if (value == "DECISION_RECORDED") return JournalEventType::DECISION_RECORDED;
    if (value == "ORDER_SUBMITTED") return JournalEventType::ORDER_SUBMITTED;
    if (value == "ORDER_REJECTED") return JournalEventType::ORDER_REJECTED;
    if (value == "ORDER_FILLED") return JournalEventType::ORDER_FILLED;
    if (value == "POSITION_CLOSED") return JournalEventType::POSITION_CLOSED;
    if (value == "SYMBOL_BLOCKED") return JournalEventType::SYMBOL_BLOCKED;
    return std::nullopt;
}

nlohmann::json toJson(const JournalEvent& event) {
    return {
        {"seq", event.seq},
        {"ts_ms", event.ts_ms},
        {"type", toString(event.type)},
        {"symbol", event.symbol},
        {"entity_id", event.entity_id},
        {"payload", event.payload}
    };
}

std::optional<JournalEvent> journalEventFromJson(const nlohmann::json& line) {
    if (!line.is_object()) {
        return std::nullopt;
    }
    const auto seq_it = line.find("seq");
    if (seq_it == line.end() || !seq_it->is_number_unsigned() || seq_it->get<std::uint64_t>() == 0) {
        return std::nullopt;
    }
    const auto type_it = line.find("type");
    if (type_it == line.end() || !type_it->is_string()) {
        return std::nullopt;
    }
    const auto type = journalEventTypeFromString(type_it->get<std::string>());
    if (!type) {
        return std::nullopt;
    }

    JournalEvent event;
    event.seq = seq_it->get<std::uint64_t>();
    event.type = *type;
    event.ts_ms = line.value("ts_ms", 0LL);
    event.symbol = line.value("symbol", std::string());
    event.entity_id = line.value("entity_id", std::string());
    event.payload = line.value("payload", nlohmann::json::object());
    return event;
}

} // namespace core
} // namespace zenith
