#pragma once

#include <string>

namespace zenith {
namespace analytics {

// UTC 시간대 기준 세션
enum class TradingSession { ASIA, LONDON, NY, BRIDGE };

// [0,7) ASIA, [7,11) BRIDGE, [11,16) LONDON, 나머지 NY
TradingSession sessionOf(long long ts_ms);

const char* toString(TradingSession session);

} // namespace analytics
} // namespace zenith
