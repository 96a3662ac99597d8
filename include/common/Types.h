#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <algorithm>
#include <cctype>

namespace zenith {

using Timestamp = std::chrono::system_clock::time_point;
using Price = double;
using Quantity = double;
using Amount = double;

constexpr double POSITION_EPSILON = 1e-8;

inline long long currentTimeMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

enum class OrderSide { BUY, SELL };
enum class OrderType { LIMIT, MARKET };
enum class OrderStatus { PENDING, SUBMITTED, FILLED, PARTIALLY_FILLED, CANCELLED, REJECTED };

// 방향성: 로컬 신호/오라클/결정이 공유
enum class Bias { LONG, SHORT, FLAT };
enum class PositionSide { LONG, SHORT };

// 포지션 전이 액션
enum class DecisionAction { ENTRY, HOLD, FLIP, EXIT };

// 결정 출처 (oracle 결과만 캐시 재사용 대상)
enum class DecisionSource { ORACLE, FALLBACK, STRATEGY };

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long open_time;
    long long close_time;

    Candle() : open(0), high(0), low(0), close(0), volume(0), open_time(0), close_time(0) {}

    Candle(double o, double h, double l, double c, double v, long long t, long long ct = 0)
        : open(o), high(h), low(l), close(c), volume(v), open_time(t), close_time(ct) {}
};

struct Position {
    std::string symbol;
    PositionSide side = PositionSide::LONG;
    Quantity quantity = 0.0;          // 항상 양수 (방향은 side)
    Price entry_price = 0.0;
    Price mark_price = 0.0;
    Amount unrealized_pnl = 0.0;

    // 전략 메타데이터 (scalp 진입 시)
    std::string strategy_model;
    double entry_move_pct = 0.0;
    long long entry_time_ms = 0;
};

struct Decision {
    std::string symbol;
    Bias bias = Bias::FLAT;
    DecisionAction action = DecisionAction::HOLD;
    double confidence = 0.0;
    std::optional<Price> entry_price;
    std::optional<Price> exit_price;
    std::string reasoning;
    DecisionSource source = DecisionSource::FALLBACK;
    std::string model;

    // 로컬 신호 에코 (conviction gate 용)
    std::optional<double> local_edge;
    std::optional<double> local_confidence;
    Bias local_bias = Bias::FLAT;

    long long timestamp_ms = 0;
};

// 거래소 체결 결과
struct OrderFill {
    std::string order_id;
    OrderStatus status = OrderStatus::PENDING;
    std::string raw_status;
    Price avg_price = 0.0;
    Quantity executed_qty = 0.0;
};

inline const char* toString(Bias bias) {
    switch (bias) {
        case Bias::LONG: return "long";
        case Bias::SHORT: return "short";
        case Bias::FLAT: return "flat";
    }
    return "flat";
}

inline const char* toString(PositionSide side) {
    return side == PositionSide::LONG ? "long" : "short";
}

inline const char* toString(OrderSide side) {
    return side == OrderSide::BUY ? "BUY" : "SELL";
}

inline const char* toString(DecisionAction action) {
    switch (action) {
        case DecisionAction::ENTRY: return "entry";
        case DecisionAction::HOLD: return "hold";
        case DecisionAction::FLIP: return "flip";
        case DecisionAction::EXIT: return "exit";
    }
    return "hold";
}

inline const char* toString(DecisionSource source) {
    switch (source) {
        case DecisionSource::ORACLE: return "oracle";
        case DecisionSource::FALLBACK: return "fallback";
        case DecisionSource::STRATEGY: return "strategy";
    }
    return "fallback";
}

inline const char* toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING: return "PENDING";
        case OrderStatus::SUBMITTED: return "SUBMITTED";
        case OrderStatus::FILLED: return "FILLED";
        case OrderStatus::PARTIALLY_FILLED: return "PARTIALLY_FILLED";
        case OrderStatus::CANCELLED: return "CANCELLED";
        case OrderStatus::REJECTED: return "REJECTED";
    }
    return "PENDING";
}

inline std::optional<Bias> parseBias(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (text == "long") return Bias::LONG;
    if (text == "short") return Bias::SHORT;
    if (text == "flat") return Bias::FLAT;
    return std::nullopt;
}

inline std::optional<DecisionAction> parseDecisionAction(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (text == "entry") return DecisionAction::ENTRY;
    if (text == "hold") return DecisionAction::HOLD;
    if (text == "flip") return DecisionAction::FLIP;
    if (text == "exit") return DecisionAction::EXIT;
    return std::nullopt;
}

inline Bias toBias(PositionSide side) {
    return side == PositionSide::LONG ? Bias::LONG : Bias::SHORT;
}

// 진입 방향의 주문 side
inline OrderSide entrySide(Bias bias) {
    return bias == Bias::SHORT ? OrderSide::SELL : OrderSide::BUY;
}

// 청산 주문 side (포지션 반대)
inline OrderSide closingSide(PositionSide side) {
    return side == PositionSide::LONG ? OrderSide::SELL : OrderSide::BUY;
}

} // namespace zenith
