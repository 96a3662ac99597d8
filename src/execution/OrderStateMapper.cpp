#include "execution/OrderStateMapper.h"

#include "common/StepSizeHelper.h"
#include "core/execution/OrderLifecycleStateMachine.h"

#include <cmath>

namespace zenith {
namespace execution {

namespace {
double numberField(const nlohmann::json& obj, const char* key) {
    const auto it = obj.find(key);
    if (it == obj.end()) return 0.0;
    double value = 0.0;
    if (it->is_string()) {
        value = common::parseDouble(it->get<std::string>());
    } else if (it->is_number()) {
        value = it->get<double>();
    }
    return std::isfinite(value) ? value : 0.0;
}
} // namespace

OrderFill OrderStateMapper::toFill(const nlohmann::json& response) {
    OrderFill fill;
    if (!response.is_object()) {
        return fill;
    }

    const auto id = response.find("orderId");
    if (id != response.end() && !id->is_null()) {
        fill.order_id = id->is_string() ? id->get<std::string>() : id->dump();
    }
    fill.raw_status = response.value("status", std::string("NEW"));

    core::execution::FillProgress progress;
    progress.orig_qty = numberField(response, "origQty");
    progress.executed_qty = numberField(response, "executedQty");
    const auto state = core::execution::OrderLifecycleStateMachine::transition(fill.raw_status, progress);

    fill.status = state.status;
    fill.executed_qty = state.filled_qty;
    fill.avg_price = numberField(response, "avgPrice");
    if (fill.avg_price <= 0.0) {
        fill.avg_price = numberField(response, "price");
    }
    return fill;
}

} // namespace execution
} // namespace zenith
