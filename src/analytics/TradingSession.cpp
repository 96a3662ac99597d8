#include "analytics/TradingSession.h"

namespace zenith {
namespace analytics {

TradingSession sessionOf(long long ts_ms) {
    constexpr long long kMsPerHour = 3600LL * 1000LL;
    long long hour = (ts_ms / kMsPerHour) % 24;
    if (hour < 0) hour += 24;

    if (hour < 7) return TradingSession::ASIA;
    if (hour < 11) return TradingSession::BRIDGE;
    if (hour < 16) return TradingSession::LONDON;
    return TradingSession::NY;
}

const char* toString(TradingSession session) {
    switch (session) {
        case TradingSession::ASIA: return "ASIA";
        case TradingSession::LONDON: return "LONDON";
        case TradingSession::NY: return "NY";
        case TradingSession::BRIDGE: return "BRIDGE";
    }
    return "ASIA";
}

} // namespace analytics
} // namespace zenith
