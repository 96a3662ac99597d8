#include "execution/PositionLedger.h"
#include "common/Logger.h"

#include <cmath>
#include <stdexcept>

namespace zenith {
namespace execution {

PositionLedger::PositionLedger(core::IExchangeAdapter& exchange, long long ttl_ms)
    : exchange_(exchange)
    , ttl_ms_(ttl_ms) {}

std::optional<Position> PositionLedger::project(const core::RawPosition& raw) {
    if (!std::isfinite(raw.position_amt) || std::abs(raw.position_amt) < POSITION_EPSILON) {
        return std::nullopt;
    }

    Position position;
    position.symbol = raw.symbol;
    position.side = raw.position_amt > 0.0 ? PositionSide::LONG : PositionSide::SHORT;
    position.quantity = std::abs(raw.position_amt);
    position.entry_price = raw.entry_price;
    position.mark_price = raw.mark_price;
    position.unrealized_pnl = raw.unrealized_pnl;
    return position;
}

void PositionLedger::refreshPositionsLocked(long long now_ms) {
    std::vector<core::RawPosition> raw;
    try {
        raw = exchange_.fetchPositions();
    } catch (const std::exception& e) {
        // 마지막 스냅샷도 더 이상 믿지 않음
        positions_valid_ = false;
        throw std::runtime_error(std::string("Failed to refresh positions: ") + e.what());
    }

    std::map<std::string, core::RawPosition> next;
    for (auto& p : raw) {
        next[p.symbol] = p;
    }
    positions_.swap(next);
    positions_ts_ = now_ms;
    positions_valid_ = true;

    // 청산된 심볼 메타데이터 정리
    for (auto it = meta_.begin(); it != meta_.end();) {
        auto found = positions_.find(it->first);
        if (found == positions_.end() || !project(found->second)) {
            it = meta_.erase(it);
        } else {
            ++it;
        }
    }
}

std::optional<Position> PositionLedger::lookupLocked(const std::string& symbol) const {
    auto it = positions_.find(symbol);
    if (it == positions_.end()) {
        return std::nullopt;
    }
    auto position = project(it->second);
    if (!position) {
        return std::nullopt;
    }
    auto meta = meta_.find(symbol);
    if (meta != meta_.end()) {
        position->strategy_model = meta->second.model;
        position->entry_move_pct = meta->second.entry_move_pct;
        position->entry_time_ms = meta->second.entry_time_ms;
    }
    return position;
}

std::optional<Position> PositionLedger::getPosition(const std::string& symbol, long long now_ms, bool force_refresh) {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool fresh = positions_valid_ && now_ms - positions_ts_ < ttl_ms_;
    if (force_refresh || !fresh) {
        refreshPositionsLocked(now_ms);
    }
    return lookupLocked(symbol);
}

std::vector<Position> PositionLedger::allPositions(long long now_ms, bool force_refresh) {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool fresh = positions_valid_ && now_ms - positions_ts_ < ttl_ms_;
    if (force_refresh || !fresh) {
        refreshPositionsLocked(now_ms);
    }
    std::vector<Position> out;
    for (const auto& entry : positions_) {
        auto position = lookupLocked(entry.first);
        if (position) {
            out.push_back(*position);
        }
    }
    return out;
}

double PositionLedger::getAvailableMargin(long long now_ms, bool force_refresh) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!force_refresh && balance_valid_ && now_ms - balance_ts_ < ttl_ms_) {
        return available_;
    }

    try {
        const auto balances = exchange_.fetchAccountBalance();
        double available = 0.0;
        for (const auto& b : balances) {
            if (b.asset == "USDT") {
                available = std::isfinite(b.available) ? b.available : b.balance;
                break;
            }
        }
        if (!std::isfinite(available)) {
            throw std::runtime_error("Invalid available balance for USDT");
        }
        available_ = available;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to refresh available margin: {}", e.what());
        available_ = 0.0;
    }
    balance_ts_ = now_ms;
    balance_valid_ = true;
    return available_;
}

std::optional<double> PositionLedger::getCachedAvailableMargin(long long now_ms) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (balance_valid_ && now_ms - balance_ts_ <= ttl_ms_) {
        return available_;
    }
    return std::nullopt;
}

void PositionLedger::setStrategyMeta(const std::string& symbol, const std::string& model,
                                     double entry_move_pct, long long entry_time_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    meta_[symbol] = StrategyMeta{model, entry_move_pct, entry_time_ms};
}

void PositionLedger::invalidatePositions() {
    std::lock_guard<std::mutex> lock(mutex_);
    positions_valid_ = false;
    positions_ts_ = 0;
}

void PositionLedger::invalidateBalance() {
    std::lock_guard<std::mutex> lock(mutex_);
    balance_valid_ = false;
    balance_ts_ = 0;
}

void PositionLedger::invalidate() {
    invalidatePositions();
    invalidateBalance();
}

} // namespace execution
} // namespace zenith
