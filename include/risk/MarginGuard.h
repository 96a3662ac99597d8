#pragma once

#include <optional>
#include <string>

#include "core/contracts/IExchangeAdapter.h"
#include "execution/QuantityNormalizer.h"

namespace zenith {
namespace risk {

enum class MarginCapSource { MARGIN, LEVERAGE_BRACKET };

struct MarginCheck {
    bool allowed = false;
    execution::NormalizedQuantity order;
    bool reduced = false;
    double effective_cap = 0.0;
    MarginCapSource cap_source = MarginCapSource::MARGIN;
};

// 가용 증거금 x 레버리지 x 0.9 와 레버리지 구간 한도 중 작은 값으로 명목 제한
class MarginGuard {
public:
    static constexpr double kMarginUsageBuffer = 0.9;

    MarginGuard(core::IExchangeAdapter& exchange, const execution::QuantityNormalizer& normalizer);

    MarginCheck enforce(
        const std::string& symbol,
        int leverage,
        std::optional<double> reference_price,
        const execution::NormalizedQuantity& order,
        double raw_qty,
        double available_margin
    ) const;

    static double marginCap(double available_margin, int leverage);

private:
    core::IExchangeAdapter& exchange_;
    const execution::QuantityNormalizer& normalizer_;
};

} // namespace risk
} // namespace zenith
