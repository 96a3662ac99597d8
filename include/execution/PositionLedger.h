#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"
#include "core/contracts/IExchangeAdapter.h"

namespace zenith {
namespace execution {

// 거래소 포지션/가용 증거금 짧은 TTL 캐시 (기본 3초).
// 체결 후에는 invalidate 로 즉시 무효화
class PositionLedger {
public:
    static constexpr long long kDefaultTtlMs = 3000;

    explicit PositionLedger(core::IExchangeAdapter& exchange, long long ttl_ms = kDefaultTtlMs);

    // 조회 실패는 std::runtime_error 로 전파 (포지션 없음으로 보지 않음)
    std::optional<Position> getPosition(const std::string& symbol, long long now_ms, bool force_refresh = false);
    std::vector<Position> allPositions(long long now_ms, bool force_refresh = false);

    // USDT 가용 증거금. 조회 실패 시 0 을 캐시
    double getAvailableMargin(long long now_ms, bool force_refresh = false);
    std::optional<double> getCachedAvailableMargin(long long now_ms) const;

    // 스캘핑 진입 메타데이터 (포지션이 사라지면 함께 제거)
    void setStrategyMeta(const std::string& symbol, const std::string& model,
                         double entry_move_pct, long long entry_time_ms);

    void invalidatePositions();
    void invalidateBalance();
    void invalidate();

    static std::optional<Position> project(const core::RawPosition& raw);

private:
    struct StrategyMeta {
        std::string model;
        double entry_move_pct = 0.0;
        long long entry_time_ms = 0;
    };

    void refreshPositionsLocked(long long now_ms);
    std::optional<Position> lookupLocked(const std::string& symbol) const;

    core::IExchangeAdapter& exchange_;
    long long ttl_ms_;

    std::map<std::string, core::RawPosition> positions_;
    long long positions_ts_ = 0;
    bool positions_valid_ = false;

    double available_ = 0.0;
    long long balance_ts_ = 0;
    bool balance_valid_ = false;

    std::map<std::string, StrategyMeta> meta_;
    mutable std::mutex mutex_;
};

} // namespace execution
} // namespace zenith
