#include "risk/CooldownTracker.h"

#include <cassert>
#include <iostream>

using zenith::risk::CooldownEvent;
using zenith::risk::CooldownTracker;

int main() {
    // 1. 윈도우 내 손절 2회 -> 쿨다운 동안 차단
    {
        CooldownTracker tracker(120000, 60000);
        tracker.registerEvent("BTCUSDT", CooldownEvent::STOP, 0);
        assert(!tracker.isBlocked("BTCUSDT", 1000));

        tracker.registerEvent("BTCUSDT", CooldownEvent::STOP, 30000);
        if (!tracker.isBlocked("BTCUSDT", 30001)) {
            std::cerr << "[TEST] two stop events inside window should block\n";
            return 1;
        }
        assert(tracker.blockedUntil("BTCUSDT").value() == 90000);
        assert(tracker.isBlocked("BTCUSDT", 89999));
        assert(!tracker.isBlocked("BTCUSDT", 90000));
        // 만료된 차단은 조회 시 해제
        assert(!tracker.blockedUntil("BTCUSDT").has_value());
        assert(!tracker.isBlocked("ETHUSDT", 30001));
    }

    // 2. 윈도우 밖 이벤트는 누적되지 않음
    {
        CooldownTracker tracker(120000, 60000);
        tracker.registerEvent("ETHUSDT", CooldownEvent::STOP, 0);
        tracker.registerEvent("ETHUSDT", CooldownEvent::STOP, 121000);
        assert(!tracker.isBlocked("ETHUSDT", 121001));
        assert(tracker.eventCount("ETHUSDT", CooldownEvent::STOP, 121001) == 1);
    }

    // 3. 손절/슬리피지는 별도 집계
    {
        CooldownTracker tracker;
        tracker.registerEvent("SOLUSDT", CooldownEvent::STOP, 0);
        tracker.registerEvent("SOLUSDT", CooldownEvent::SLIP, 1000);
        assert(!tracker.isBlocked("SOLUSDT", 2000));

        tracker.registerEvent("SOLUSDT", CooldownEvent::SLIP, 5000);
        assert(tracker.isBlocked("SOLUSDT", 6000));
        assert(tracker.eventCount("SOLUSDT", CooldownEvent::SLIP, 6000) == 2);
    }

    // 4. clear 는 이벤트와 차단 상태 모두 제거
    {
        CooldownTracker tracker;
        tracker.registerEvent("BTCUSDT", CooldownEvent::STOP, 0);
        tracker.registerEvent("BTCUSDT", CooldownEvent::STOP, 100);
        assert(tracker.isBlocked("BTCUSDT", 200));
        tracker.clear("BTCUSDT");
        assert(!tracker.isBlocked("BTCUSDT", 200));
        assert(tracker.eventCount("BTCUSDT", CooldownEvent::STOP, 200) == 0);
    }

    // 5. isBlocked 조회만으로도 만료 이벤트 정리
    {
        CooldownTracker tracker(120000, 60000);
        tracker.registerEvent("BTCUSDT", CooldownEvent::STOP, 0);
        tracker.registerEvent("ETHUSDT", CooldownEvent::SLIP, 0);
        assert(tracker.trackedSymbolCount() == 2);

        assert(!tracker.isBlocked("BTCUSDT", 60000));
        assert(tracker.trackedSymbolCount() == 2);

        assert(!tracker.isBlocked("BTCUSDT", 130000));
        if (tracker.trackedSymbolCount() != 1) {
            std::cerr << "[TEST] expired events should be pruned on isBlocked\n";
            return 1;
        }

        // 만료된 차단 + 만료된 이벤트 -> 상태 제거
        tracker.registerEvent("SOLUSDT", CooldownEvent::STOP, 200000);
        tracker.registerEvent("SOLUSDT", CooldownEvent::STOP, 200100);
        assert(tracker.isBlocked("SOLUSDT", 200200));
        assert(!tracker.isBlocked("SOLUSDT", 400000));
        assert(tracker.trackedSymbolCount() == 1);
        assert(tracker.eventCount("SOLUSDT", CooldownEvent::STOP, 400000) == 0);
    }

    std::cout << "[TEST] CooldownTracker PASSED\n";
    return 0;
}
