#pragma once

#include <string>
#include <vector>

#include "strategy/MicrostructureGate.h"
#include "strategy/QualityScorer.h"
#include "strategy/ScalpConfig.h"
#include "strategy/ScalpTypes.h"

namespace zenith {
namespace strategy {

// 한 틱의 후보 평가 입력 (모델 간 공유, 읽기 전용)
struct ScalpContext {
    const ScalpFeatures& features;
    const ShockRisk& risk;
    const ScalpConfig& config;
    const QualityScorer& scorer;
    const MicrostructureGate& gate;

    long long now_ms = 0;
    double signal_fresh_sec = 0.0;
    bool signal_fresh = false;
    bool session_restricted = false;
    double expected_slip_bp = 0.0;

    ScalpContext(const ScalpFeatures& f, const ShockRisk& r, const ScalpConfig& c,
                 const QualityScorer& s, const MicrostructureGate& g)
        : features(f), risk(r), config(c), scorer(s), gate(g) {}
};

// 스캘핑 전략 모델 인터페이스
class IScalpModel {
public:
    virtual ~IScalpModel() = default;

    virtual Model model() const = 0;

    // 조건을 만족한 방향별 후보 (없으면 빈 벡터)
    virtual std::vector<Candidate> evaluate(const ScalpContext& ctx) const = 0;

protected:
    // 미시구조/신선도/임계값을 적용해 signal 확정.
    // reasons 끝에 signalFresh, microOk 를 덧붙임
    static Candidate finalizeCandidate(
        const ScalpContext& ctx,
        Model model,
        Side side,
        double quality,
        EntryLevel entry_hint,
        double tp1_rr,
        TpTarget target,
        std::vector<std::string> reasons
    );

    static StopHint swingStop(const ScalpContext& ctx);
    static std::string formatFixed(double value, int decimals);
    static std::string joinNames(const std::vector<std::string>& names);
};

} // namespace strategy
} // namespace zenith
