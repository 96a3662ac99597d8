#pragma once

#include <string>
#include <vector>

#include "analytics/MarketSnapshot.h"

namespace zenith {
namespace strategy {

// 지표별 가중치(driver)를 long/short 로 모아 로컬 방향성 산출
class SignalGenerator {
public:
    struct Driver {
        double weight;
        std::string reason;
    };

    static analytics::LocalSignal derive(const analytics::SnapshotMetrics& metrics);

    // 테스트/로그용: 가중치 후보 목록
    static void collectDrivers(
        const analytics::SnapshotMetrics& metrics,
        std::vector<Driver>& long_drivers,
        std::vector<Driver>& short_drivers
    );
};

} // namespace strategy
} // namespace zenith
