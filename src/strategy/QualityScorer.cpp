#include "strategy/QualityScorer.h"

#include <algorithm>

namespace zenith {
namespace strategy {

QualityScorer::QualityScorer(const ScalpConfig& config)
    : config_(config) {}

double QualityScorer::orderFlowScore(double ratio) {
    if (ratio >= 3.0) return 1.0;
    if (ratio >= 2.0) return 0.8;
    if (ratio >= 1.5) return 0.5;
    return 0.0;
}

double QualityScorer::patternScore(int pattern_count) {
    if (pattern_count >= 3) return 1.0;
    if (pattern_count == 2) return 0.66;
    if (pattern_count == 1) return 0.33;
    return 0.0;
}

bool QualityScorer::sessionHardGate(analytics::TradingSession session, RiskGrade grade) {
    const bool late_session = session == analytics::TradingSession::NY ||
                              session == analytics::TradingSession::BRIDGE;
    const bool severe = grade == RiskGrade::HIGH || grade == RiskGrade::CRITICAL;
    return late_session && severe;
}

double QualityScorer::sessionWeight(analytics::TradingSession session) const {
    switch (session) {
        case analytics::TradingSession::ASIA: return config_.sessions.asia;
        case analytics::TradingSession::LONDON: return config_.sessions.london;
        case analytics::TradingSession::NY: return config_.sessions.ny;
        case analytics::TradingSession::BRIDGE: return config_.sessions.bridge;
    }
    return 1.0;
}

double QualityScorer::thresholdFor(Model model) const {
    switch (model) {
        case Model::BREAKOUT: return config_.breakout_threshold;
        case Model::MEAN: return config_.mean_threshold;
        case Model::EMA50: return config_.ema50_threshold;
        case Model::NONE: return config_.quality_threshold;
    }
    return config_.quality_threshold;
}

double QualityScorer::score(const QualityInputs& in, analytics::TradingSession session, RiskGrade grade) const {
    if (sessionHardGate(session, grade)) {
        return 0.0;
    }

    double base =
        0.30 * (in.regime_ok ? 1.0 : 0.0) +
        0.25 * orderFlowScore(in.orderflow_ratio) +
        0.15 * patternScore(in.pattern_count) +
        0.10 * (in.rsi_ok ? 1.0 : 0.0) +
        0.10 * (in.fvg_ok ? 1.0 : 0.0) +
        0.10 * (in.vp_near_ok ? 1.0 : 0.0);

    base *= sessionWeight(session);

    if (grade == RiskGrade::HIGH) base *= 0.8;
    if (grade == RiskGrade::CRITICAL) base *= 0.7;

    return std::max(0.0, std::min(base, 1.0));
}

} // namespace strategy
} // namespace zenith
