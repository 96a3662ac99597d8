#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "analytics/MarketSnapshot.h"
#include "common/Types.h"
#include "core/contracts/IStrategyOracle.h"

namespace zenith {
namespace strategy {

struct DecisionCacheEntry {
    Decision decision;
    double reference_price = 0.0;
    long long timestamp_ms = 0;
    nlohmann::json context;            // 당시 스냅샷 context (비교 기준)
    DecisionSource source = DecisionSource::FALLBACK;
    std::string model;
};

// 오라클 요청 부가정보 (프롬프트의 account 섹션)
struct OracleHints {
    int leverage = 1;
    double allocation_pct = 10.0;
    double estimated_notional = 0.0;
};

// 심볼별 오라클 결정 캐시.
// 재사용: 캐시 출처가 oracle, contextShift < 0.12, 로컬 bias 불변이고
//   (drift < 0.12% 그리고 age < 240s) 또는 (age < 45s 그리고 drift < 0.25%)
// 오라클 실패: 포지션 있으면 exit, 없으면 hold (fallback 은 재사용 안 됨)
class DecisionCache {
public:
    static constexpr double kContextShiftThreshold = 0.12;
    static constexpr double kStalePriceDrift = 0.0012;
    static constexpr double kCooldownPriceDrift = 0.0025;
    static constexpr long long kDefaultCooldownMs = 45000;
    static constexpr long long kDefaultRevalidationMs = 240000;

    // conviction gate
    static constexpr double kMinConfidenceToExecute = 0.62;
    static constexpr double kMinLocalEdge = 0.4;
    static constexpr double kMinLocalConfidence = 0.55;

    explicit DecisionCache(
        core::IStrategyOracle& oracle,
        long long cooldown_ms = kDefaultCooldownMs,
        long long revalidation_ms = kDefaultRevalidationMs
    );

    Decision resolve(
        const analytics::MarketSnapshot& snapshot,
        const std::optional<Position>& position,
        const OracleHints& hints,
        long long now_ms
    );

    std::optional<DecisionCacheEntry> entry(const std::string& symbol) const;
    void invalidate(const std::string& symbol);

    // ===== 순수 함수 =====

    // bias 변화 시 무한대, 스냅샷 누락 시 0
    static double computeContextShift(const nlohmann::json& previous, const nlohmann::json& next);

    static nlohmann::json condensePromptContext(
        const nlohmann::json& context,
        bool emphasise_local,
        const std::optional<Position>& position,
        double price
    );

    static nlohmann::json summarizePosition(const std::optional<Position>& position, double price);
    static std::string trimReasoning(const std::string& text, size_t word_limit = 18);
    static Decision applyPositionContext(Decision decision, const std::optional<Position>& position);
    static bool isStrongLocal(const analytics::LocalSignal& local);
    static bool passesConvictionGate(const Decision& decision);

private:
    core::IStrategyOracle& oracle_;
    long long cooldown_ms_;
    long long revalidation_ms_;

    std::map<std::string, DecisionCacheEntry> entries_;
    mutable std::mutex mutex_;
};

} // namespace strategy
} // namespace zenith
