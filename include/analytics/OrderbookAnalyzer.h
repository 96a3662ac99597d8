#pragma once

#include <nlohmann/json.hpp>

namespace zenith {
namespace analytics {

// 선물 depth 응답 ({"bids":[["p","q"],...], "asks":[...], "E":ms}) 요약
struct OrderbookSnapshot {
    double best_bid;
    double best_ask;
    double mid_price;
    double spread_bp;
    double bid_qty;
    double ask_qty;
    double imbalance;
    long long event_time_ms;
    bool valid;

    OrderbookSnapshot()
        : best_bid(0.0)
        , best_ask(0.0)
        , mid_price(0.0)
        , spread_bp(0.0)
        , bid_qty(0.0)
        , ask_qty(0.0)
        , imbalance(0.0)
        , event_time_ms(0)
        , valid(false)
    {}
};

class OrderbookAnalyzer {
public:
    static OrderbookSnapshot analyze(const nlohmann::json& depth, int depth_limit = 10);
};

} // namespace analytics
} // namespace zenith
