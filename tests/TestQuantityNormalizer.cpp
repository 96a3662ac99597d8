#include "execution/QuantityNormalizer.h"
#include "TestFakes.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <random>

using zenith::execution::QuantityNormalizer;
using zenith::test::makeFilters;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}
} // namespace

int main() {
    const auto filters = makeFilters(0.001, 0.01, 100.0, 5.0);

    // 1. 최소 명목 보정 경로: 0.0123 -> 0.012 (4.8 USDT) -> 5/400=0.0125 -> 0.012 -> 여전히 미달
    {
        auto r = QuantityNormalizer::normalize(filters, 0.0123, 400.0);
        if (!r.bumped_to_min_notional) {
            std::cerr << "[TEST] min-notional bump path was not exercised\n";
            return 1;
        }
        if (r.tradable() || r.quantity != 0.0) {
            std::cerr << "[TEST] unsatisfiable notional should yield zero, got " << r.quantity << "\n";
            return 1;
        }
    }

    // 2. 같은 입력, 가격 250: 3 USDT -> 5/250 = 0.02
    {
        auto r = QuantityNormalizer::normalize(filters, 0.0123, 250.0);
        assert(r.bumped_to_min_notional);
        assert(near(r.quantity, 0.02));
        assert(r.quantity_text == "0.020");
    }

    // 3. 멱등성
    {
        auto first = QuantityNormalizer::normalize(filters, 0.5371, 400.0);
        auto second = QuantityNormalizer::normalize(filters, first.quantity, 400.0);
        assert(near(first.quantity, 0.537));
        assert(first.quantity == second.quantity);
        assert(first.quantity_text == second.quantity_text);
    }

    // 4. minQty 올림 / maxQty 클램프
    {
        auto raised = QuantityNormalizer::normalize(filters, 0.004, std::nullopt);
        assert(near(raised.quantity, 0.01));

        auto clamped = QuantityNormalizer::normalize(filters, 150.0, 1.0);
        assert(near(clamped.quantity, 100.0));
    }

    // 5. 명목 보정 결과가 maxQty 초과 -> 0
    {
        auto tight = makeFilters(0.001, 0.001, 0.01, 5.0);
        auto r = QuantityNormalizer::normalize(tight, 0.005, 100.0);
        assert(!r.tradable());
        assert(r.bumped_to_min_notional);
    }

    // 6. 잘못된 입력
    {
        assert(!QuantityNormalizer::normalize(filters, 0.0, 100.0).tradable());
        assert(!QuantityNormalizer::normalize(filters, -1.0, 100.0).tradable());
        assert(!QuantityNormalizer::normalize(filters, std::nan(""), 100.0).tradable());
    }

    // 7. precision 캡과 표시 자릿수
    {
        auto f = makeFilters(0.001, 0.001, 1000.0, 0.0);
        f.quantity_precision = 2;
        auto r = QuantityNormalizer::normalize(f, 1.23456, 10.0);
        assert(near(r.quantity, 1.23));
        assert(r.quantity_text == "1.23");
        assert(QuantityNormalizer::displayPrecision(f) == 2);

        auto no_step = makeFilters(0.0, 0.0, 1000.0, 0.0);
        auto s = QuantityNormalizer::normalize(no_step, 0.12345678, std::nullopt);
        assert(s.quantity_text == "0.123457");
        assert(QuantityNormalizer::displayPrecision(no_step) == 6);
    }

    // 8. 경계 불변식 (무작위 필터)
    {
        std::mt19937 rng(20240917);
        const double steps[] = {0.001, 0.01, 0.1, 1.0};
        std::uniform_int_distribution<int> step_pick(0, 3);
        std::uniform_int_distribution<int> min_mult(1, 20);
        std::uniform_int_distribution<int> max_mult(1000, 100000);
        std::uniform_real_distribution<double> notional_dist(0.0, 20.0);
        std::uniform_real_distribution<double> price_dist(0.5, 50000.0);
        std::uniform_real_distribution<double> qty_dist(0.0001, 500.0);

        for (int i = 0; i < 2000; ++i) {
            const double step = steps[step_pick(rng)];
            auto f = makeFilters(step, step * min_mult(rng), step * max_mult(rng), notional_dist(rng));
            const double price = price_dist(rng);
            const double desired = qty_dist(rng);

            auto r = QuantityNormalizer::normalize(f, desired, price);
            if (!r.tradable()) {
                continue;
            }
            const double units = r.quantity / step;
            const bool on_step = std::abs(units - std::round(units)) < 1e-6;
            const bool within_qty = r.quantity + 1e-9 >= f.min_qty && r.quantity <= f.max_qty + 1e-9;
            const bool within_notional = r.quantity * price + 1e-6 >= f.min_notional;
            if (!on_step || !within_qty || !within_notional) {
                std::cerr << "[TEST] bounds violated: step=" << step << " qty=" << r.quantity
                          << " price=" << price << " minN=" << f.min_notional << "\n";
                return 1;
            }
        }
    }

    // 9. 필터 조회 실패 -> 0
    {
        zenith::test::FakeExchangeAdapter exchange;
        exchange.filters["BTCUSDT"] = filters;
        QuantityNormalizer normalizer(exchange);
        assert(near(normalizer.normalize("BTCUSDT", 0.5371, 400.0).quantity, 0.537));
        assert(!normalizer.normalize("DOGEUSDT", 10.0, 0.1).tradable());
    }

    std::cout << "[TEST] QuantityNormalizer PASSED\n";
    return 0;
}
