#include "analytics/OrderbookAnalyzer.h"
#include "common/StepSizeHelper.h"
#include <algorithm>
#include <cmath>

namespace zenith {
namespace analytics {

namespace {

const nlohmann::json& levelsOf(const nlohmann::json& depth, bool bids) {
    static const nlohmann::json kEmpty = nlohmann::json::array();
    const char* key = bids ? "bids" : "asks";
    if (!depth.is_object() || !depth.contains(key) || !depth[key].is_array()) {
        return kEmpty;
    }
    return depth[key];
}

// ["price","qty"] 또는 숫자 배열
double levelValue(const nlohmann::json& level, size_t idx) {
    if (!level.is_array() || level.size() <= idx) return 0.0;
    const auto& v = level[idx];
    if (v.is_string()) return common::parseDouble(v.get<std::string>());
    if (v.is_number()) return v.get<double>();
    return 0.0;
}

}

OrderbookSnapshot OrderbookAnalyzer::analyze(const nlohmann::json& depth, int depth_limit) {
    OrderbookSnapshot snapshot;

    const auto& bids = levelsOf(depth, true);
    const auto& asks = levelsOf(depth, false);
    if (bids.empty() || asks.empty()) {
        return snapshot;
    }

    snapshot.best_bid = levelValue(bids[0], 0);
    snapshot.best_ask = levelValue(asks[0], 0);

    if (snapshot.best_bid > 0.0 && snapshot.best_ask > 0.0) {
        snapshot.mid_price = (snapshot.best_bid + snapshot.best_ask) * 0.5;
        snapshot.spread_bp = (snapshot.best_ask - snapshot.best_bid) / snapshot.mid_price * 1e4;
    }

    const int bid_depth = std::min(depth_limit, static_cast<int>(bids.size()));
    const int ask_depth = std::min(depth_limit, static_cast<int>(asks.size()));
    for (int i = 0; i < bid_depth; ++i) {
        snapshot.bid_qty += levelValue(bids[i], 1);
    }
    for (int i = 0; i < ask_depth; ++i) {
        snapshot.ask_qty += levelValue(asks[i], 1);
    }

    const double total = snapshot.bid_qty + snapshot.ask_qty;
    if (total > 0.0) {
        snapshot.imbalance = (snapshot.bid_qty - snapshot.ask_qty) / total;
    }

    if (depth.contains("E") && depth["E"].is_number()) {
        snapshot.event_time_ms = depth["E"].get<long long>();
    } else if (depth.contains("T") && depth["T"].is_number()) {
        snapshot.event_time_ms = depth["T"].get<long long>();
    }

    snapshot.valid = snapshot.mid_price > 0.0;
    return snapshot;
}

} // namespace analytics
} // namespace zenith
