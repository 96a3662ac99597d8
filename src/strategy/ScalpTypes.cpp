#include "strategy/ScalpTypes.h"

namespace zenith {
namespace strategy {

const char* toString(Side side) {
    switch (side) {
        case Side::LONG: return "LONG";
        case Side::SHORT: return "SHORT";
        case Side::NONE: return "NONE";
    }
    return "NONE";
}

const char* toString(Model model) {
    switch (model) {
        case Model::BREAKOUT: return "BREAKOUT";
        case Model::MEAN: return "MEAN";
        case Model::EMA50: return "EMA50";
        case Model::NONE: return "NONE";
    }
    return "NONE";
}

const char* toString(EntryLevel level) {
    switch (level) {
        case EntryLevel::LVN: return "lvn";
        case EntryLevel::VAH: return "vah";
        case EntryLevel::VAL: return "val";
        case EntryLevel::EMA25: return "ema25";
        case EntryLevel::EMA50: return "ema50";
        case EntryLevel::FVG_EDGE: return "fvg_edge";
        case EntryLevel::POC: return "poc";
        case EntryLevel::NEXT_VA: return "next_va";
        case EntryLevel::NA: return "na";
    }
    return "na";
}

const char* toString(TpTarget target) {
    switch (target) {
        case TpTarget::POC: return "poc";
        case TpTarget::NEXT_VA: return "next_va";
        case TpTarget::NA: return "na";
    }
    return "na";
}

const char* toString(RiskGrade grade) {
    switch (grade) {
        case RiskGrade::NONE: return "None";
        case RiskGrade::NOTICE: return "Notice";
        case RiskGrade::HIGH: return "High";
        case RiskGrade::CRITICAL: return "Critical";
    }
    return "None";
}

const char* toString(MarketRegime regime) {
    switch (regime) {
        case MarketRegime::BULLISH: return "BULLISH";
        case MarketRegime::BEARISH: return "BEARISH";
        case MarketRegime::RANGE: return "RANGE";
    }
    return "RANGE";
}

std::optional<Side> parseSide(const std::string& text) {
    if (text == "LONG") return Side::LONG;
    if (text == "SHORT") return Side::SHORT;
    if (text == "NONE") return Side::NONE;
    return std::nullopt;
}

std::optional<Model> parseModel(const std::string& text) {
    if (text == "BREAKOUT") return Model::BREAKOUT;
    if (text == "MEAN") return Model::MEAN;
    if (text == "EMA50") return Model::EMA50;
    if (text == "NONE") return Model::NONE;
    return std::nullopt;
}

std::optional<EntryLevel> parseEntryLevel(const std::string& text) {
    static const EntryLevel kAll[] = {
        EntryLevel::LVN, EntryLevel::VAH, EntryLevel::VAL, EntryLevel::EMA25, EntryLevel::EMA50,
        EntryLevel::FVG_EDGE, EntryLevel::POC, EntryLevel::NEXT_VA, EntryLevel::NA
    };
    for (auto level : kAll) {
        if (text == toString(level)) return level;
    }
    return std::nullopt;
}

std::optional<RiskGrade> parseRiskGrade(const std::string& text) {
    if (text == "None") return RiskGrade::NONE;
    if (text == "Notice") return RiskGrade::NOTICE;
    if (text == "High") return RiskGrade::HIGH;
    if (text == "Critical") return RiskGrade::CRITICAL;
    return std::nullopt;
}

} // namespace strategy
} // namespace zenith
