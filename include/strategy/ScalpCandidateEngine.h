#pragma once

#include <memory>
#include <vector>

#include "strategy/IScalpModel.h"
#include "strategy/MicrostructureGate.h"
#include "strategy/QualityScorer.h"
#include "strategy/ScalpConfig.h"
#include "strategy/ScalpTypes.h"

namespace zenith {
namespace strategy {

// 3개 모델(BREAKOUT/MEAN/EMA50)을 돌려 후보 목록 생성.
// 후보가 하나도 없으면 signal=NONE 자리표시 후보 1개를 반환
class ScalpCandidateEngine {
public:
    explicit ScalpCandidateEngine(const ScalpConfig& config);

    ScalpCandidateEngine(const ScalpCandidateEngine&) = delete;
    ScalpCandidateEngine& operator=(const ScalpCandidateEngine&) = delete;

    std::vector<Candidate> buildCandidates(
        const ScalpFeatures& features,
        const ShockRisk& risk,
        long long now_ms
    ) const;

    const ScalpConfig& config() const { return config_; }
    const QualityScorer& scorer() const { return scorer_; }
    const MicrostructureGate& gate() const { return gate_; }

private:
    Candidate placeholder(const ScalpContext& ctx) const;

    ScalpConfig config_;
    QualityScorer scorer_;
    MicrostructureGate gate_;
    std::vector<std::unique_ptr<IScalpModel>> models_;
};

} // namespace strategy
} // namespace zenith
