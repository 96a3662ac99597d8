#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "core/model/JournalTypes.h"

namespace zenith {
namespace core {

// 결정/주문 감사 저널 (append-only). 기록 실패가 거래를 멈추지는 않음
class IEventJournal {
public:
    virtual ~IEventJournal() = default;

    // event.seq 는 무시하고 저널이 다음 번호 부여. 쓰기 실패 시 false
    virtual bool append(const JournalEvent& event) = 0;
    virtual std::vector<JournalEvent> readFrom(std::uint64_t seq_inclusive) = 0;
    virtual std::uint64_t lastSeq() const = 0;

    bool record(JournalEventType type, long long ts_ms, const std::string& symbol,
                const std::string& entity_id, nlohmann::json payload) {
        JournalEvent event;
        event.ts_ms = ts_ms;
        event.type = type;
        event.symbol = symbol;
        event.entity_id = entity_id;
        event.payload = std::move(payload);
        return append(event);
    }
};

} // namespace core
} // namespace zenith
