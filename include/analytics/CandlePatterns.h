#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"

namespace zenith {
namespace analytics {

enum class TweezerType { TOP, BOTTOM };

// 단일/2봉 캔들 패턴. idx 범위 밖이면 false
class CandlePatterns {
public:
    // long: 양봉이 직전 음봉 몸통을 감쌈 (몸통 >= 직전 몸통). short 는 반대
    static bool isEngulfing(const std::vector<Candle>& candles, size_t idx, bool long_side);
    static bool isHammer(const std::vector<Candle>& candles, size_t idx);
    static bool isShootingStar(const std::vector<Candle>& candles, size_t idx);
    static bool isDoji(const std::vector<Candle>& candles, size_t idx);
    static std::optional<TweezerType> tweezer(const std::vector<Candle>& candles, size_t idx);
    static bool isMarubozu(const std::vector<Candle>& candles, size_t idx, bool long_side);

    // 방향에 맞는 패턴 이름 목록 (hammer 는 long, shooting star 는 short 만)
    static std::vector<std::string> confirmingPatterns(
        const std::vector<Candle>& candles, size_t idx, bool long_side);
};

} // namespace analytics
} // namespace zenith
