#include "engine/TradingEngine.h"
#include "common/Logger.h"
#include "common/StepSizeHelper.h"
#include "strategy/ScalpFeatureBuilder.h"
#include "strategy/ScalpHelpers.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>

namespace zenith {
namespace engine {

namespace {

// tick 종료 시 in-flight 플래그 해제
class InFlightGuard {
public:
    explicit InFlightGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~InFlightGuard() { flag_ = false; }

private:
    std::atomic<bool>& flag_;
};

std::string joinReasons(const std::vector<std::string>& reasons) {
    std::string joined;
    for (const auto& reason : reasons) {
        if (!joined.empty()) {
            joined += " · ";
        }
        joined += reason;
    }
    return joined;
}

} // namespace

TradingEngine::TradingEngine(
    const EngineConfig& config,
    const strategy::ScalpConfig& scalp_config,
    EngineDependencies deps
)
    : config_(config)
    , scalp_config_(scalp_config)
    , deps_(deps)
    , normalizer_(deps_.exchange)
    , margin_guard_(deps_.exchange, normalizer_)
    , ledger_(deps_.exchange, config_.position_ttl_ms)
    , executor_(deps_.exchange, normalizer_, margin_guard_, ledger_, deps_.journal)
    , decision_cache_(deps_.strategy_oracle, config_.decision_cooldown_ms, config_.decision_revalidation_ms)
    , cooldown_(scalp_config_.cooldown_window_ms, scalp_config_.cooldown_ms)
    , candidate_engine_(scalp_config_)
    , exit_planner_(scalp_config_)
    , running_(false)
    , tick_in_flight_(false)
    , tick_count_(0)
    , symbols_(config_.symbols)
    , leverage_(std::max(1, std::min(config_.leverage, std::max(1, config_.max_leverage))))
    , allocation_pct_(std::max(1.0, std::min(config_.allocation_pct, 100.0)))
{
    if (deps_.policy_oracle) {
        policy_merger_ = std::make_unique<strategy::PolicyMerger>(*deps_.policy_oracle, scalp_config_);
    }
    if (config_.mode == StrategyMode::SCALP && !policy_merger_) {
        throw std::invalid_argument("Scalp mode requires a policy oracle");
    }

    LOG_INFO("TradingEngine 생성 (모드: {}, 심볼 {}개, 레버리지 {}x, 배분 {:.1f}%)",
             toString(config_.mode), symbols_.size(), leverage_, allocation_pct_);
}

TradingEngine::~TradingEngine() {
    stop();
}

// ===== 엔진 제어 =====

bool TradingEngine::start() {
    if (running_) {
        LOG_WARN("엔진이 이미 실행 중입니다");
        return false;
    }

    if (activeSymbols().empty()) {
        LOG_ERROR("거래 가능한 심볼이 없어 엔진을 시작할 수 없습니다");
        return false;
    }

    LOG_INFO("========================================");
    LOG_INFO("거래 엔진 시작 ({}, 주기 {}초)", toString(config_.mode), config_.loop_interval_seconds);
    LOG_INFO("========================================");

    running_ = true;
    worker_thread_ = std::make_unique<std::thread>(&TradingEngine::run, this);
    return true;
}

void TradingEngine::stop() {
    if (!running_ && !(worker_thread_ && worker_thread_->joinable())) {
        return;
    }

    LOG_INFO("========================================");
    LOG_INFO("거래 엔진 중지 (진행 중 주기 완료 대기)");
    LOG_INFO("========================================");

    running_ = false;

    if (worker_thread_ && worker_thread_->joinable()) {
        worker_thread_->join();
    }
    worker_thread_.reset();
}

// ===== 메인 루프 =====

void TradingEngine::run() {
    LOG_INFO("메인 거래 루프 시작");

    const auto interval = std::chrono::seconds(std::max(1, config_.loop_interval_seconds));
    const auto poll = std::chrono::milliseconds(kStopPollMs);

    while (running_) {
        const auto tick_start = std::chrono::steady_clock::now();

        try {
            tick();
        } catch (const std::exception& e) {
            LOG_ERROR("메인 루프 에러: {}", e.what());
        }

        // 다음 주기까지 대기 (stop 플래그 주기적 확인)
        const auto next_tick = tick_start + interval;
        while (running_) {
            const auto now = std::chrono::steady_clock::now();
            if (now >= next_tick) {
                break;
            }
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(next_tick - now);
            std::this_thread::sleep_for(std::min(remaining, poll));
        }
    }

    LOG_INFO("메인 거래 루프 종료");
}

bool TradingEngine::tick() {
    bool expected = false;
    if (!tick_in_flight_.compare_exchange_strong(expected, true)) {
        LOG_WARN("이전 주기가 아직 실행 중입니다. 이번 주기는 건너뜁니다");
        return false;
    }
    InFlightGuard guard(tick_in_flight_);

    const auto symbols = activeSymbols();
    for (const auto& symbol : symbols) {
        try {
            evaluateSymbol(symbol, nowMs());
        } catch (const std::exception& e) {
            LOG_ERROR("[{}] 심볼 평가 실패: {}", symbol, e.what());
            if (isUnknownSymbolError(e.what())) {
                blockSymbol(symbol, e.what());
            }
        }
    }

    ++tick_count_;
    return true;
}

// ===== 사용자 설정 =====

void TradingEngine::setUserLeverage(int leverage) {
    std::lock_guard<std::mutex> lock(mutex_);
    const int max_leverage = std::max(1, config_.max_leverage);
    leverage_ = std::max(1, std::min(leverage, max_leverage));
    LOG_INFO("사용자 레버리지 설정: {}x (요청 {}x, 최대 {}x)", leverage_, leverage, max_leverage);
}

void TradingEngine::setAllocationPercent(double pct) {
    std::lock_guard<std::mutex> lock(mutex_);
    allocation_pct_ = std::isfinite(pct) ? std::max(1.0, std::min(pct, 100.0)) : allocation_pct_;
    LOG_INFO("배분 비율 설정: {:.1f}%", allocation_pct_);
}

int TradingEngine::getUserLeverage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return leverage_;
}

double TradingEngine::getAllocationPercent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return allocation_pct_;
}

void TradingEngine::blockSymbol(const std::string& symbol, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!blocked_symbols_.insert(symbol).second) {
            return;
        }
        symbols_.erase(std::remove(symbols_.begin(), symbols_.end(), symbol), symbols_.end());
    }

    decision_cache_.invalidate(symbol);
    LOG_WARN("[{}] 거래 불가 심볼 차단: {}", symbol, reason);

    if (deps_.journal &&
        !deps_.journal->record(core::JournalEventType::SYMBOL_BLOCKED, nowMs(), symbol, symbol,
                               {{"reason", reason}})) {
        LOG_WARN("[{}] journal append failed: SYMBOL_BLOCKED", symbol);
    }
}

// ===== 상태 조회 =====

std::vector<std::string> TradingEngine::activeSymbols() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return symbols_;
}

bool TradingEngine::isSymbolBlocked(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return blocked_symbols_.count(symbol) > 0;
}

bool TradingEngine::isCoolingDown(const std::string& symbol) {
    return cooldown_.isBlocked(symbol, nowMs());
}

std::vector<Position> TradingEngine::getPositions() {
    return ledger_.allPositions(nowMs());
}

std::optional<risk::TrackedStop> TradingEngine::trackedStop(const std::string& symbol) const {
    return stop_tracker_.get(symbol);
}

size_t TradingEngine::cooldownEventCount(const std::string& symbol, risk::CooldownEvent type) {
    return cooldown_.eventCount(symbol, type, nowMs());
}

std::optional<Decision> TradingEngine::lastDecision(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_decisions_.find(symbol);
    if (it == last_decisions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ===== 심볼 평가 =====

void TradingEngine::evaluateSymbol(const std::string& symbol, long long now_ms) {
    if (config_.mode == StrategyMode::SCALP) {
        evaluateScalp(symbol, now_ms);
    } else {
        evaluateOracle(symbol, now_ms);
    }
}

void TradingEngine::evaluateOracle(const std::string& symbol, long long now_ms) {
    const auto snapshot = deps_.market_data.getSnapshot(symbol, config_.kline_interval, config_.kline_limit);
    const auto position = ledger_.getPosition(symbol, now_ms);
    const auto params = sizing();

    strategy::OracleHints hints;
    hints.leverage = params.leverage;
    hints.allocation_pct = params.allocation_pct;
    hints.estimated_notional = execution::OrderExecutor::estimateTargetNotional(
        params.leverage,
        kDefaultConfidenceGuess,
        ledger_.getCachedAvailableMargin(now_ms),
        params.allocation_pct,
        params.initial_balance
    );

    const Decision decision = decision_cache_.resolve(snapshot, position, hints, now_ms);
    recordDecision(decision, now_ms);

    const auto result = executor_.execute(decision, params, now_ms);
    LOG_INFO("[{}] {} {} (신뢰도 {:.2f}, {}) -> {}",
             symbol, toString(decision.bias), toString(decision.action), decision.confidence,
             toString(decision.source), core::execution::toString(result.transition.kind));

    if (result.entry) {
        LOG_INFO("[{}] 진입 결과: {} {}", symbol,
                 execution::toString(result.entry->status), result.entry->message);
    }
}

void TradingEngine::evaluateScalp(const std::string& symbol, long long now_ms) {
    const bool tracking = stop_tracker_.isTracking(symbol);
    if (!tracking && cooldown_.isBlocked(symbol, now_ms)) {
        const auto until = cooldown_.blockedUntil(symbol);
        LOG_INFO("[{}] 쿨다운 중 (해제까지 {}ms)", symbol, until ? *until - now_ms : 0);
        return;
    }

    // ===== 피처 =====
    strategy::ScalpFeatureBuilder::Inputs inputs;
    inputs.symbol = symbol;
    inputs.now_ms = now_ms;
    inputs.candles = deps_.market_data.fetchKlines(symbol, config_.kline_interval, config_.kline_limit);

    const auto book_start = std::chrono::steady_clock::now();
    inputs.order_book = deps_.market_data.fetchOrderBook(symbol, config_.order_book_depth);
    inputs.latency_ms = static_cast<double>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - book_start).count());

    inputs.trades = deps_.market_data.fetchRecentTrades(symbol, config_.trade_lookback);
    inputs.tick_size = tickSizeFor(symbol);
    inputs.available_usdt = ledger_.getAvailableMargin(now_ms);

    const auto features = strategy::ScalpFeatureBuilder::build(inputs);

    if (tracking) {
        manageTrackedPosition(symbol, features, now_ms);
        return;
    }

    // ===== 후보 -> 정책 병합 =====
    const auto risk = fetchShockRisk(symbol);
    const auto candidates = candidate_engine_.buildCandidates(features, risk, now_ms);
    const auto merged = policy_merger_->merge(features, risk, candidates);
    const auto best = merged.best();
    if (!best) {
        LOG_DEBUG("[{}] 스캘핑 후보 없음 (allowed={}, 세션 {}, 임계값 {:.2f})",
                  symbol, merged.allowed, analytics::toString(merged.session), merged.quality_threshold);
        return;
    }

    Decision decision;
    decision.symbol = symbol;
    decision.bias = strategy::toBias(best->signal);
    decision.action = DecisionAction::ENTRY;
    decision.confidence = best->quality;
    decision.local_edge = best->quality;
    decision.local_confidence = best->quality;
    decision.local_bias = decision.bias;
    decision.entry_price = features.close;
    decision.source = DecisionSource::STRATEGY;
    decision.model = strategy::toString(best->model);
    decision.reasoning = joinReasons(best->reasons);
    if (decision.reasoning.empty()) {
        decision.reasoning = std::string("Scalp ") + strategy::toString(best->model);
    }
    decision.timestamp_ms = now_ms;

    recordDecision(decision, now_ms);

    const auto result = executor_.execute(decision, sizing(), now_ms);
    LOG_INFO("[{}] 스캘핑 {} {} (품질 {:.2f}) -> {}",
             symbol, decision.model, strategy::toString(best->signal), best->quality,
             core::execution::toString(result.transition.kind));

    if (result.entry && result.entry->status == execution::ExecutionStatus::FILLED) {
        onScalpFill(symbol, *best, features, risk, *result.entry, now_ms);
    }
}

void TradingEngine::manageTrackedPosition(
    const std::string& symbol,
    const strategy::ScalpFeatures& features,
    long long now_ms
) {
    const auto position = ledger_.getPosition(symbol, now_ms);
    if (!position) {
        LOG_INFO("[{}] 추적 포지션이 사라져 손절 추적 해제", symbol);
        stop_tracker_.release(symbol);
        return;
    }

    const Candle& last = features.candles.back();
    const auto update = stop_tracker_.update(symbol, last, features.atr22, now_ms);
    if (!update) {
        return;
    }

    if (update->action == risk::StopAction::TP1_HIT) {
        LOG_INFO("[{}] TP1 도달, 손절 {:.4f} 로 이동", symbol, update->stop);
    }

    const bool stop_hit = update->action == risk::StopAction::STOP_HIT;
    std::string reason;
    if (stop_hit) {
        reason = "Stop hit at " + common::formatCompact(update->stop, 8);
    } else if (strategy::helpers::shouldForceFlat(update->hold_sec, update->bars_held, scalp_config_)) {
        reason = "Time stop after " + std::to_string(static_cast<long long>(update->hold_sec)) +
                 "s / " + std::to_string(update->bars_held) + " bars";
    }
    if (reason.empty()) {
        return;
    }

    Decision exit;
    exit.symbol = symbol;
    exit.bias = Bias::FLAT;
    exit.action = DecisionAction::EXIT;
    exit.exit_price = last.close;
    exit.source = DecisionSource::STRATEGY;
    exit.model = position->strategy_model;
    exit.reasoning = reason;
    exit.timestamp_ms = now_ms;

    recordDecision(exit, now_ms);
    const auto report = executor_.executeExit(exit, now_ms, execution::ExitTiming::IMMEDIATE);
    LOG_INFO("[{}] 스캘핑 청산: {} -> {}", symbol, reason, execution::toString(report.status));

    // 잔량이 남으면 추적 유지, 다음 주기에 남은 수량으로 재시도
    if (report.status == execution::ExecutionStatus::EXIT_INCOMPLETE) {
        return;
    }
    stop_tracker_.release(symbol);
    if (stop_hit && report.status == execution::ExecutionStatus::CLOSED) {
        cooldown_.registerEvent(symbol, risk::CooldownEvent::STOP, now_ms);
    }
}

void TradingEngine::onScalpFill(
    const std::string& symbol,
    const strategy::Candidate& candidate,
    const strategy::ScalpFeatures& features,
    const strategy::ShockRisk& risk,
    const execution::ExecutionReport& report,
    long long now_ms
) {
    const double reference = report.reference_price.value_or(features.close);
    const double fill_price = (report.fill && report.fill->avg_price > 0.0) ? report.fill->avg_price : reference;

    if (reference > 0.0 && fill_price > 0.0) {
        const double slip_bp = std::abs(fill_price - reference) / reference * 10000.0;
        const double cap_bp = risk.grade == strategy::RiskGrade::HIGH
            ? scalp_config_.micro.slippage_high_bp
            : scalp_config_.micro.slippage_bp;
        if (slip_bp > cap_bp) {
            LOG_WARN("[{}] 슬리피지 {:.2f}bp > 한도 {:.2f}bp", symbol, slip_bp, cap_bp);
            cooldown_.registerEvent(symbol, risk::CooldownEvent::SLIP, now_ms);
        }
    }

    const auto plan = exit_planner_.build(candidate.signal, fill_price, candidate, features.atr22, features.tick_size);
    stop_tracker_.track(symbol, plan, now_ms, features.candles.back().open_time);

    double move_pct = 0.0;
    if (features.candles.size() >= 2) {
        const double prev_close = features.candles[features.candles.size() - 2].close;
        if (prev_close > 0.0) {
            move_pct = (features.close - prev_close) / prev_close * 100.0;
        }
    }
    ledger_.setStrategyMeta(symbol, strategy::toString(candidate.model), move_pct, now_ms);

    LOG_INFO("[{}] 손절 추적 시작: 진입 {:.4f}, 손절 {:.4f}, TP1 {:.4f}",
             symbol, plan.entry, plan.stop, plan.tp1.value_or(0.0));
}

// ===== 헬퍼 =====

strategy::ShockRisk TradingEngine::fetchShockRisk(const std::string& symbol) {
    if (!deps_.shock_risk) {
        return strategy::ShockRisk{};
    }
    try {
        return deps_.shock_risk->fetch(symbol);
    } catch (const std::exception& e) {
        LOG_WARN("[{}] 쇼크 리스크 조회 실패, None 등급 사용: {}", symbol, e.what());
        return strategy::ShockRisk{};
    }
}

double TradingEngine::tickSizeFor(const std::string& symbol) {
    try {
        const auto filters = deps_.exchange.fetchTradingFilters(symbol);
        if (filters.tick_size > 0.0) {
            return filters.tick_size;
        }
    } catch (const std::exception& e) {
        LOG_WARN("[{}] tickSize 조회 실패, 설정값 사용: {}", symbol, e.what());
    }

    auto it = scalp_config_.tick_sizes.find(symbol);
    if (it != scalp_config_.tick_sizes.end() && it->second > 0.0) {
        return it->second;
    }
    return scalp_config_.default_tick_size;
}

execution::SizingParams TradingEngine::sizing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    execution::SizingParams params;
    params.leverage = leverage_;
    params.allocation_pct = allocation_pct_;
    params.initial_balance = config_.initial_balance;
    return params;
}

void TradingEngine::recordDecision(const Decision& decision, long long now_ms) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_decisions_[decision.symbol] = decision;
    }

    if (!deps_.journal) {
        return;
    }

    nlohmann::json payload = {
        {"bias", toString(decision.bias)},
        {"action", toString(decision.action)},
        {"confidence", decision.confidence},
        {"source", toString(decision.source)},
        {"model", decision.model},
        {"reasoning", decision.reasoning}
    };
    if (decision.entry_price) {
        payload["entryPrice"] = *decision.entry_price;
    }
    if (decision.exit_price) {
        payload["exitPrice"] = *decision.exit_price;
    }
    if (!deps_.journal->record(core::JournalEventType::DECISION_RECORDED, now_ms, decision.symbol,
                               decision.symbol + "-" + std::to_string(now_ms), std::move(payload))) {
        LOG_WARN("[{}] journal append failed: DECISION_RECORDED", decision.symbol);
    }
}

long long TradingEngine::nowMs() const {
    return deps_.clock ? deps_.clock() : currentTimeMs();
}

bool TradingEngine::isUnknownSymbolError(const std::string& message) {
    return message.find("not available on Binance") != std::string::npos ||
           message.find("Invalid symbol") != std::string::npos;
}

} // namespace engine
} // namespace zenith
