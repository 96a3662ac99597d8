#include "risk/MarginGuard.h"
#include "TestFakes.h"

#include <cassert>
#include <cmath>
#include <iostream>

using zenith::execution::QuantityNormalizer;
using zenith::risk::MarginCapSource;
using zenith::risk::MarginGuard;

int main() {
    // 1. 한도 단조성
    {
        double previous = 0.0;
        for (int lev = 0; lev <= 125; ++lev) {
            const double cap = MarginGuard::marginCap(1000.0, lev);
            if (cap + 1e-9 < previous) {
                std::cerr << "[TEST] cap decreased at leverage " << lev << "\n";
                return 1;
            }
            previous = cap;
        }
        for (double margin = 1000.0; margin > 1.0; margin *= 0.7) {
            assert(MarginGuard::marginCap(margin * 0.7, 10) <= MarginGuard::marginCap(margin, 10));
        }
        assert(MarginGuard::marginCap(100.0, 0) == MarginGuard::marginCap(100.0, 1));
        assert(std::abs(MarginGuard::marginCap(100.0, 5) - 450.0) < 1e-9);
        assert(MarginGuard::marginCap(-5.0, 5) == 0.0);
    }

    zenith::test::FakeExchangeAdapter exchange;
    exchange.filters["BTCUSDT"] = zenith::test::makeFilters(0.001, 0.001, 1000.0, 5.0);
    QuantityNormalizer normalizer(exchange);
    MarginGuard guard(exchange, normalizer);

    const auto order = normalizer.normalize("BTCUSDT", 1.0, 100.0);   // 100 USDT
    assert(order.tradable());

    // 2. 한도 이내 -> 그대로
    {
        auto check = guard.enforce("BTCUSDT", 5, 100.0, order, 1.0, 100.0);
        assert(check.allowed);
        assert(!check.reduced);
        assert(check.order.quantity == order.quantity);
    }

    // 3. 증거금 한도로 축소: 10 x 5 x 0.9 = 45 USDT -> 0.45
    {
        auto check = guard.enforce("BTCUSDT", 5, 100.0, order, 1.0, 10.0);
        assert(check.allowed);
        assert(check.reduced);
        assert(check.cap_source == MarginCapSource::MARGIN);
        assert(std::abs(check.order.quantity - 0.45) < 1e-9);
    }

    // 4. 레버리지 구간 한도가 더 작으면 대체
    {
        exchange.max_notional = 20.0;
        auto check = guard.enforce("BTCUSDT", 5, 100.0, order, 1.0, 10.0);
        assert(check.allowed);
        assert(check.cap_source == MarginCapSource::LEVERAGE_BRACKET);
        assert(std::abs(check.order.quantity - 0.2) < 1e-9);
        exchange.max_notional.reset();
    }

    // 5. 한도 < 최소 명목 -> 거절
    {
        auto check = guard.enforce("BTCUSDT", 1, 100.0, order, 1.0, 1.0);
        if (check.allowed || check.order.tradable()) {
            std::cerr << "[TEST] cap below min notional should reject\n";
            return 1;
        }
    }

    // 6. 증거금 0 -> 거절
    {
        auto check = guard.enforce("BTCUSDT", 5, 100.0, order, 1.0, 0.0);
        assert(!check.allowed);
    }

    std::cout << "[TEST] MarginGuard PASSED\n";
    return 0;
}
