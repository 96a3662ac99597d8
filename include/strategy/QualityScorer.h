#pragma once

#include "analytics/TradingSession.h"
#include "strategy/ScalpConfig.h"
#include "strategy/ScalpTypes.h"

namespace zenith {
namespace strategy {

struct QualityInputs {
    bool regime_ok = false;
    double orderflow_ratio = 0.0;
    int pattern_count = 0;
    bool rsi_ok = false;
    bool fvg_ok = false;
    bool vp_near_ok = false;
};

// 후보 품질 점수 [0,1]
//   0.30 regime + 0.25 orderflow + 0.15 pattern + 0.10 rsi + 0.10 fvg + 0.10 vp
//   x 세션 가중치, High x0.8 / Critical x0.7
//   NY/BRIDGE 세션 + High/Critical 등급이면 0
class QualityScorer {
public:
    explicit QualityScorer(const ScalpConfig& config);

    double score(const QualityInputs& inputs, analytics::TradingSession session, RiskGrade grade) const;
    double thresholdFor(Model model) const;
    double sessionWeight(analytics::TradingSession session) const;

    static double orderFlowScore(double ratio);
    static double patternScore(int pattern_count);
    static bool sessionHardGate(analytics::TradingSession session, RiskGrade grade);

private:
    const ScalpConfig& config_;
};

} // namespace strategy
} // namespace zenith
