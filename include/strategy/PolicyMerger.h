#pragma once

#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/contracts/IPolicyOracle.h"
#include "strategy/ScalpConfig.h"
#include "strategy/ScalpTypes.h"

namespace zenith {
namespace strategy {

struct MergedPolicy {
    std::vector<Candidate> candidates;    // 채택 후보가 있으면 맨 앞
    bool allowed = false;
    analytics::TradingSession session = analytics::TradingSession::ASIA;
    MarketRegime regime = MarketRegime::RANGE;
    double quality_threshold = 0.0;

    // signal 이 있고 전역 임계값 이상인 첫 후보
    std::optional<Candidate> best() const;
};

// 상위 5개 후보를 정책 오라클에 보내 최종 후보 확정
class PolicyMerger {
public:
    static constexpr size_t kMaxCandidates = 5;
    static constexpr size_t kMaxReasons = 6;
    static constexpr size_t kMaxNotes = 3;

    PolicyMerger(core::IPolicyOracle& oracle, const ScalpConfig& config);

    MergedPolicy merge(
        const ScalpFeatures& features,
        const ShockRisk& risk,
        const std::vector<Candidate>& candidates
    );

    static nlohmann::json buildPayload(
        const ScalpFeatures& features,
        const ShockRisk& risk,
        const std::vector<Candidate>& candidates
    );

private:
    core::IPolicyOracle& oracle_;
    const ScalpConfig& config_;
};

} // namespace strategy
} // namespace zenith
