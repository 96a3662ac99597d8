#pragma once
// ===================================================================
// 선물 거래소 수량/호가 단위 (stepSize / tickSize) 헬퍼
//
// 거래소는 stepSize 의 정수배가 아닌 수량, tickSize 에 맞지 않는 가격을
// 거절한다. 주문 전송 문자열은 여기서 만든 값을 그대로 사용한다.
// ===================================================================

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <optional>

namespace zenith {
namespace common {

// 소수점 d 자리 반올림
inline double roundTo(double value, int decimals) {
    const double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

// stepSize 가 의미하는 소수 자릿수 (0.001 -> 3), 최대 8
inline int decimalsForStep(double step) {
    if (!(step > 0.0)) return 0;
    const int digits = static_cast<int>(std::lround(-std::log10(step)));
    return std::min(8, std::max(0, digits));
}

// stepSize 배수로 내림. step <= 0 이면 소수 6자리 반올림
inline double quantizeDown(double value, double step) {
    if (!std::isfinite(value) || value <= 0.0) return 0.0;
    if (!std::isfinite(step) || step <= 0.0) {
        return roundTo(value, 6);
    }
    // 1e-9 : 이미 정렬된 값이 부동소수 오차로 한 step 내려가지 않도록
    const double steps = std::floor(value / step + 1e-9);
    return roundTo(steps * step, decimalsForStep(step));
}

// "0.00100000" -> 3, "1" -> 0
inline std::optional<int> precisionFromText(const std::string& raw) {
    if (raw.empty()) return std::nullopt;
    const auto dot = raw.find('.');
    if (dot == std::string::npos) return 0;
    std::string fractional = raw.substr(dot + 1);
    while (!fractional.empty() && fractional.back() == '0') {
        fractional.pop_back();
    }
    return static_cast<int>(fractional.size());
}

// 주문 전송용 고정 소수 문자열
inline std::string formatFixed(double value, int decimals) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", std::min(std::max(decimals, 0), 8), value);
    return std::string(buf);
}

// 표시용: 소수 d 자리 반올림 후 뒤쪽 0 제거 ("1.50" -> "1.5", "2.00" -> "2")
inline std::string formatCompact(double value, int decimals) {
    std::string text = formatFixed(roundTo(value, decimals), decimals);
    if (text.find('.') != std::string::npos) {
        while (!text.empty() && text.back() == '0') text.pop_back();
        if (!text.empty() && text.back() == '.') text.pop_back();
    }
    if (text == "-0") text = "0";
    return text;
}

inline double parseDouble(const std::string& text) {
    return std::strtod(text.c_str(), nullptr);
}

// tickSize 정수배로 반올림 (지정가 주문용)
inline double roundToTick(double price, double tick) {
    if (!(tick > 0.0)) return price;
    return roundTo(std::round(price / tick) * tick, decimalsForStep(tick));
}

// 가격 거리 -> tick 수 (최소 1)
inline int distanceTicks(double distance, double tick) {
    if (!(tick > 0.0)) return 1;
    return std::max(1, static_cast<int>(std::lround(distance / tick)));
}

} // namespace common
} // namespace zenith
