#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "common/Types.h"
#include "core/contracts/IEventJournal.h"
#include "core/contracts/IExchangeAdapter.h"
#include "core/contracts/IMarketDataProvider.h"
#include "core/contracts/IPolicyOracle.h"
#include "core/contracts/IStrategyOracle.h"
#include "engine/EngineConfig.h"
#include "execution/OrderExecutor.h"
#include "execution/PositionLedger.h"
#include "execution/QuantityNormalizer.h"
#include "risk/CooldownTracker.h"
#include "risk/ExitPlanner.h"
#include "risk/MarginGuard.h"
#include "risk/StopTracker.h"
#include "strategy/DecisionCache.h"
#include "strategy/PolicyMerger.h"
#include "strategy/ScalpCandidateEngine.h"
#include "strategy/ScalpConfig.h"

namespace zenith {
namespace engine {

// 외부 협력 객체 (엔진보다 오래 살아야 함)
struct EngineDependencies {
    core::IExchangeAdapter& exchange;
    core::IMarketDataProvider& market_data;
    core::IStrategyOracle& strategy_oracle;
    core::IPolicyOracle* policy_oracle = nullptr;     // scalp 모드 필수
    core::IShockRiskSource* shock_risk = nullptr;     // 없으면 None 등급
    core::IEventJournal* journal = nullptr;
    std::function<long long()> clock;                 // 비어 있으면 시스템 시각(ms)
};

// Trading Engine - 심볼별 결정/주문 스케줄러
class TradingEngine {
public:
    // 오라클 요청 전 예상 notional 계산용 신뢰도
    static constexpr double kDefaultConfidenceGuess = 0.75;
    static constexpr long long kStopPollMs = 200;

    // scalp 모드인데 policy_oracle 이 없으면 std::invalid_argument
    TradingEngine(
        const EngineConfig& config,
        const strategy::ScalpConfig& scalp_config,
        EngineDependencies deps
    );

    ~TradingEngine();

    TradingEngine(const TradingEngine&) = delete;
    TradingEngine& operator=(const TradingEngine&) = delete;

    // ===== 엔진 제어 =====

    bool start();
    void stop();
    bool isRunning() const { return running_; }

    // 한 주기 실행. 이전 주기가 진행 중이면 false
    bool tick();

    // ===== 사용자 설정 =====

    void setUserLeverage(int leverage);
    void setAllocationPercent(double pct);
    int getUserLeverage() const;
    double getAllocationPercent() const;

    // 거래 불가 심볼을 활성 목록에서 제외
    void blockSymbol(const std::string& symbol, const std::string& reason);

    // ===== 상태 조회 =====

    std::vector<std::string> activeSymbols() const;
    bool isSymbolBlocked(const std::string& symbol) const;
    bool isCoolingDown(const std::string& symbol);
    std::vector<Position> getPositions();
    std::optional<Decision> lastDecision(const std::string& symbol) const;
    std::optional<risk::TrackedStop> trackedStop(const std::string& symbol) const;
    size_t cooldownEventCount(const std::string& symbol, risk::CooldownEvent type);
    long long tickCount() const { return tick_count_; }

private:
    void run();

    void evaluateSymbol(const std::string& symbol, long long now_ms);
    void evaluateOracle(const std::string& symbol, long long now_ms);
    void evaluateScalp(const std::string& symbol, long long now_ms);

    // 추적 중 포지션 손절/강제청산 처리
    void manageTrackedPosition(
        const std::string& symbol,
        const strategy::ScalpFeatures& features,
        long long now_ms
    );

    void onScalpFill(
        const std::string& symbol,
        const strategy::Candidate& candidate,
        const strategy::ScalpFeatures& features,
        const strategy::ShockRisk& risk,
        const execution::ExecutionReport& report,
        long long now_ms
    );

    strategy::ShockRisk fetchShockRisk(const std::string& symbol);
    double tickSizeFor(const std::string& symbol);
    execution::SizingParams sizing() const;
    void recordDecision(const Decision& decision, long long now_ms);

    long long nowMs() const;

    static bool isUnknownSymbolError(const std::string& message);

    EngineConfig config_;
    strategy::ScalpConfig scalp_config_;
    EngineDependencies deps_;

    execution::QuantityNormalizer normalizer_;
    risk::MarginGuard margin_guard_;
    execution::PositionLedger ledger_;
    execution::OrderExecutor executor_;
    strategy::DecisionCache decision_cache_;
    risk::CooldownTracker cooldown_;

    strategy::ScalpCandidateEngine candidate_engine_;
    std::unique_ptr<strategy::PolicyMerger> policy_merger_;
    risk::ExitPlanner exit_planner_;
    risk::StopTracker stop_tracker_;

    // 스레드 제어
    std::atomic<bool> running_;
    std::atomic<bool> tick_in_flight_;
    std::atomic<long long> tick_count_;
    std::unique_ptr<std::thread> worker_thread_;

    mutable std::mutex mutex_;
    std::vector<std::string> symbols_;
    std::set<std::string> blocked_symbols_;
    std::map<std::string, Decision> last_decisions_;
    int leverage_;
    double allocation_pct_;
};

} // namespace engine
} // namespace zenith
