#pragma once

#include <string>
#include <vector>

#include "analytics/TradingSession.h"
#include "strategy/ScalpConfig.h"
#include "strategy/ScalpTypes.h"

namespace zenith {
namespace strategy {

struct MicroInputs {
    Side side = Side::LONG;
    double spread_bp = 0.0;
    double expected_slip_bp = 0.0;
    double latency_ms = 0.0;
    double quote_age_ms = 0.0;
    double depth_bias = 1.0;
};

struct MicroCaps {
    double spread_bp = 0.0;
    double slippage_bp = 0.0;
    double latency_ms = 0.0;
    double quote_age_ms = 0.0;
    double depth_baseline = 0.0;
};

// 스프레드/슬리피지/지연/호가 나이/잔량 비율 중 하나라도 위반하면 불허
class MicrostructureGate {
public:
    explicit MicrostructureGate(const MicroFilterCaps& caps);

    // High 등급이면 spread/slippage 캡 강화
    MicroCaps effectiveCaps(Side side, RiskGrade grade) const;

    bool passes(const MicroInputs& inputs, RiskGrade grade) const;

    // 세션 하드 게이트까지 포함한 최종 허용 여부
    bool admit(const MicroInputs& inputs, analytics::TradingSession session, RiskGrade grade) const;

    // 위반 항목 이름 (로그용)
    std::vector<std::string> breaches(const MicroInputs& inputs, RiskGrade grade) const;

private:
    MicroFilterCaps caps_;
};

} // namespace strategy
} // namespace zenith
