#include "execution/ExchangeRejection.h"

#include <algorithm>
#include <cctype>

namespace zenith {
namespace execution {

namespace {
std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}
} // namespace

core::OrderRejectKind ExchangeRejection::classify(const std::string& message) {
    const std::string text = lower(message);
    if (text.find("percent_price") != std::string::npos) {
        return core::OrderRejectKind::PERCENT_PRICE;
    }
    if (text.find("maximum allowable position") != std::string::npos) {
        return core::OrderRejectKind::LEVERAGE_BRACKET;
    }
    if (text.find("margin is insufficient") != std::string::npos) {
        return core::OrderRejectKind::INSUFFICIENT_MARGIN;
    }
    return core::OrderRejectKind::OTHER;
}

bool ExchangeRejection::isRetryable(core::OrderRejectKind kind) {
    return kind == core::OrderRejectKind::PERCENT_PRICE ||
           kind == core::OrderRejectKind::LEVERAGE_BRACKET;
}

} // namespace execution
} // namespace zenith
