#include "strategy/DecisionCache.h"
#include "common/Logger.h"
#include "common/StepSizeHelper.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <sstream>
#include <vector>

namespace zenith {
namespace strategy {

using common::formatCompact;
using common::roundTo;

namespace {

double clampUnit(double value) {
    return std::max(0.0, std::min(1.0, value));
}

// 값이 없으면 fallback 을 [0,1] 로 제한해 사용
double clampConfidence(std::optional<double> value, double fallback) {
    if (!value || !std::isfinite(*value)) {
        return clampUnit(fallback);
    }
    return clampUnit(*value);
}

std::optional<double> numberAt(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object() || !obj.contains(key) || !obj[key].is_number()) {
        return std::nullopt;
    }
    const double v = obj[key].get<double>();
    if (!std::isfinite(v)) return std::nullopt;
    return v;
}

std::optional<std::string> stringAt(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object() || !obj.contains(key) || !obj[key].is_string()) {
        return std::nullopt;
    }
    return obj[key].get<std::string>();
}

void copyRounded(nlohmann::json& out, const nlohmann::json& src, const char* key, int digits) {
    if (auto v = numberAt(src, key)) {
        out[key] = roundTo(*v, digits);
    }
}

bool containsIgnoreCase(const std::string& text, const std::string& needle) {
    auto it = std::search(text.begin(), text.end(), needle.begin(), needle.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    return it != text.end();
}

std::string appendNote(const std::string& reasoning, const std::string& note) {
    std::string out = reasoning + " · " + note;
    const auto first = out.find_first_not_of(' ');
    return first == std::string::npos ? std::string() : out.substr(first);
}

std::optional<std::string> localBiasOf(const nlohmann::json& context) {
    if (!context.is_object() || !context.contains("local_signal")) return std::nullopt;
    return stringAt(context["local_signal"], "bias");
}

} // namespace

DecisionCache::DecisionCache(core::IStrategyOracle& oracle, long long cooldown_ms, long long revalidation_ms)
    : oracle_(oracle)
    , cooldown_ms_(cooldown_ms)
    , revalidation_ms_(revalidation_ms) {}

// ===== 순수 함수 =====

double DecisionCache::computeContextShift(const nlohmann::json& previous, const nlohmann::json& next) {
    if (!previous.is_object() || !next.is_object()) {
        return 0.0;
    }

    const auto prev_bias = localBiasOf(previous);
    const auto next_bias = localBiasOf(next);
    if (prev_bias && next_bias && *prev_bias != *next_bias) {
        return std::numeric_limits<double>::infinity();
    }

    static const std::pair<const char*, double> kFields[] = {
        {"change_5m_pct", 6.0},
        {"change_15m_pct", 10.0},
        {"rsi_14", 100.0},
        {"vol_ratio", 5.0},
        {"edge_score", 1.0},
        {"atr_pct", 5.0},
    };

    double max_shift = 0.0;
    for (const auto& field : kFields) {
        const auto a = numberAt(previous, field.first);
        const auto b = numberAt(next, field.first);
        if (!a || !b) continue;
        max_shift = std::max(max_shift, std::abs(*b - *a) / field.second);
    }

    if (previous.contains("local_signal") && next.contains("local_signal")) {
        const auto a = numberAt(previous["local_signal"], "confidence");
        const auto b = numberAt(next["local_signal"], "confidence");
        if (a && b) {
            max_shift = std::max(max_shift, std::abs(*b - *a));
        }
    }
    return max_shift;
}

std::string DecisionCache::trimReasoning(const std::string& text, size_t word_limit) {
    std::istringstream iss(text);
    std::vector<std::string> words;
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }

    std::string out;
    const size_t count = std::min(words.size(), word_limit);
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) out += " ";
        out += words[i];
    }
    if (words.size() > word_limit) {
        out += "...";
    }
    return out;
}

nlohmann::json DecisionCache::summarizePosition(const std::optional<Position>& position, double price) {
    if (!position) {
        return {{"side", "flat"}};
    }

    nlohmann::json summary = {
        {"side", toString(position->side)},
        {"quantity", roundTo(position->quantity, 4)},
        {"entryPrice", roundTo(position->entry_price, 2)}
    };
    if (position->entry_price > 0.0 && price > 0.0) {
        const double delta = position->side == PositionSide::LONG
            ? price - position->entry_price
            : position->entry_price - price;
        summary["unrealizedPct"] = roundTo(delta / position->entry_price * 100.0, 2);
    }
    return summary;
}

nlohmann::json DecisionCache::condensePromptContext(
    const nlohmann::json& context,
    bool emphasise_local,
    const std::optional<Position>& position,
    double price
) {
    if (!context.is_object()) {
        return nullptr;
    }

    const nlohmann::json local = context.contains("local_signal") && context["local_signal"].is_object()
        ? context["local_signal"]
        : nlohmann::json::object();

    nlohmann::json local_summary = nlohmann::json::object();
    local_summary["bias"] = local.contains("bias") ? local["bias"] : nlohmann::json(nullptr);
    if (auto v = numberAt(local, "confidence")) local_summary["confidence"] = roundTo(*v, 2);
    if (auto v = numberAt(local, "edgeScore")) local_summary["edge"] = roundTo(*v, 2);
    if (auto r = stringAt(local, "reasoning")) {
        local_summary["reasoning"] = trimReasoning(*r, emphasise_local ? 12 : 18);
    }

    nlohmann::json base = nlohmann::json::object();
    if (context.contains("symbol")) base["symbol"] = context["symbol"];
    copyRounded(base, context, "price", 2);
    copyRounded(base, context, "change_1m_pct", 2);
    copyRounded(base, context, "change_5m_pct", 2);
    copyRounded(base, context, "change_15m_pct", 2);
    copyRounded(base, context, "rsi_14", 2);
    copyRounded(base, context, "vol_ratio", 2);
    copyRounded(base, context, "atr_pct", 3);
    copyRounded(base, context, "edge_score", 2);
    base["local_signal"] = local_summary;

    if (!emphasise_local) {
        copyRounded(base, context, "volatility_pct", 3);
        copyRounded(base, context, "vol_change_pct", 2);
        copyRounded(base, context, "vol_accel_pct", 2);
        copyRounded(base, context, "mfi_14", 2);
        copyRounded(base, context, "obv_slope_pct", 2);
        copyRounded(base, context, "support", 2);
        copyRounded(base, context, "resistance", 2);
    }

    if (context.contains("ticker_24h") && context["ticker_24h"].is_object()) {
        nlohmann::json ticker = nlohmann::json::object();
        copyRounded(ticker, context["ticker_24h"], "change_pct", 2);
        copyRounded(ticker, context["ticker_24h"], "high", 2);
        copyRounded(ticker, context["ticker_24h"], "low", 2);
        base["ticker_24h"] = ticker;
    }

    const double ref = numberAt(context, "price").value_or(price);
    base["active_position"] = summarizePosition(position, ref);
    return base;
}

Decision DecisionCache::applyPositionContext(Decision decision, const std::optional<Position>& position) {
    if (!position) {
        // flat 관망은 hold 유지
        if (decision.action == DecisionAction::HOLD && decision.bias != Bias::FLAT) {
            decision.action = DecisionAction::ENTRY;
        }
        return decision;
    }

    const std::string side = toString(position->side);
    if (decision.bias == Bias::FLAT || decision.action == DecisionAction::EXIT) {
        decision.action = DecisionAction::EXIT;
        if (!containsIgnoreCase(decision.reasoning, "Closing")) {
            decision.reasoning = appendNote(decision.reasoning, "Closing " + side + " exposure");
        }
    } else if (decision.bias == toBias(position->side)) {
        decision.action = DecisionAction::HOLD;
        if (!containsIgnoreCase(decision.reasoning, "Maintaining")) {
            decision.reasoning = appendNote(decision.reasoning, "Maintaining " + side + " position");
        }
    } else {
        decision.action = DecisionAction::FLIP;
        if (!containsIgnoreCase(decision.reasoning, "Flip")) {
            decision.reasoning = appendNote(
                decision.reasoning, "Flip " + side + "→" + toString(decision.bias));
        }
    }
    return decision;
}

bool DecisionCache::isStrongLocal(const analytics::LocalSignal& local) {
    if (local.bias == Bias::FLAT) return false;
    return (local.confidence >= 0.68 && local.edge_score >= 0.48) ||
           local.confidence >= 0.82 ||
           local.edge_score >= 0.62;
}

bool DecisionCache::passesConvictionGate(const Decision& decision) {
    if (!std::isfinite(decision.confidence) || decision.confidence < kMinConfidenceToExecute) {
        return false;
    }
    const double edge = decision.local_edge.value_or(0.0);
    if (!std::isfinite(edge) || edge < kMinLocalEdge) {
        return false;
    }
    if (decision.local_confidence && *decision.local_confidence < kMinLocalConfidence) {
        return false;
    }
    return true;
}

// ===== 캐시 =====

std::optional<DecisionCacheEntry> DecisionCache::entry(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(symbol);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void DecisionCache::invalidate(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(symbol);
}

Decision DecisionCache::resolve(
    const analytics::MarketSnapshot& snapshot,
    const std::optional<Position>& position,
    const OracleHints& hints,
    long long now_ms
) {
    const std::string& symbol = snapshot.symbol;
    const double price = snapshot.metrics.last_price;
    const auto& local = snapshot.local;
    const double local_edge = std::isfinite(local.edge_score) ? local.edge_score : 0.0;
    const double local_confidence = clampUnit(std::isfinite(local.confidence) ? local.confidence : 0.0);
    const nlohmann::json& context = snapshot.context;

    auto echoLocal = [&](Decision& d) {
        d.local_edge = local_edge;
        d.local_confidence = local_confidence;
        d.local_bias = local.bias;
    };

    std::optional<DecisionCacheEntry> cached = entry(symbol);

    const double drift = (cached && cached->reference_price > 0.0)
        ? std::abs((price - cached->reference_price) / cached->reference_price)
        : std::numeric_limits<double>::infinity();
    const long long age_ms = cached ? now_ms - cached->timestamp_ms : std::numeric_limits<long long>::max();

    const bool has_snapshots = cached && cached->context.is_object() && context.is_object();
    const double shift = has_snapshots ? computeContextShift(cached->context, context) : 0.0;
    const bool context_stable = has_snapshots ? (std::isfinite(shift) && shift < kContextShiftThreshold) : true;
    bool bias_changed = false;
    if (has_snapshots) {
        const auto a = localBiasOf(cached->context);
        const auto b = localBiasOf(context);
        bias_changed = a && b && *a != *b;
    }

    const bool stale_price = !std::isfinite(drift) || drift >= kStalePriceDrift;
    const bool stale_time = age_ms >= revalidation_ms_;

    std::string reuse_reason;
    if (cached && cached->source == DecisionSource::ORACLE && context_stable && !bias_changed) {
        if (!stale_price && !stale_time) {
            reuse_reason = "Maintaining stance";
        } else if (age_ms < cooldown_ms_ && drift < kCooldownPriceDrift) {
            reuse_reason = "Cooldown reuse";
        }
    }

    if (!reuse_reason.empty()) {
        const double drift_pct = drift * 100.0;
        Decision reused = cached->decision;
        reused.reasoning = reused.reasoning + " · " + reuse_reason +
                           " (price drift " + formatCompact(drift_pct, 3) + "%)";
        echoLocal(reused);
        reused.entry_price = price;
        reused.confidence = clampConfidence(reused.confidence, local_confidence);
        reused.timestamp_ms = now_ms;
        reused = applyPositionContext(std::move(reused), position);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& slot = entries_[symbol];
            slot = *cached;
            slot.decision = reused;
            slot.reference_price = price;
            slot.timestamp_ms = now_ms;
            if (context.is_object()) {
                slot.context = context;
            }
        }
        LOG_DEBUG("[{}] reusing cached oracle decision (drift={}%, shift={})",
                  symbol, formatCompact(drift_pct, 3),
                  std::isfinite(shift) ? formatCompact(shift, 3) : std::string("inf"));
        return reused;
    }

    const bool strong_local = isStrongLocal(local);
    nlohmann::json prompt = condensePromptContext(context, strong_local, position, price);
    if (prompt.is_null()) {
        prompt = {{"symbol", symbol}, {"active_position", summarizePosition(position, price)}};
    }
    prompt["account"] = {
        {"leverage", hints.leverage},
        {"allocation_pct", hints.allocation_pct},
        {"estimated_notional", roundTo(hints.estimated_notional, 2)}
    };

    core::OracleDecision answer;
    try {
        answer = oracle_.request(symbol, prompt);
    } catch (const std::exception& e) {
        LOG_ERROR("[{}] strategy oracle failed, applying fallback: {}", symbol, e.what());

        Decision fallback;
        fallback.symbol = symbol;
        fallback.bias = Bias::FLAT;
        fallback.source = DecisionSource::FALLBACK;
        fallback.model = "fallback";
        fallback.timestamp_ms = now_ms;
        if (position) {
            fallback.action = DecisionAction::EXIT;
            fallback.confidence = clampUnit(std::max(local_confidence, 0.8));
            fallback.reasoning = "LLM decision unavailable, flattening via limit exit";
            fallback.entry_price = position->entry_price;
        } else {
            fallback.action = DecisionAction::HOLD;
            fallback.confidence = clampConfidence(local_confidence, 0.2);
            fallback.reasoning = "LLM decision unavailable, standing aside";
        }
        echoLocal(fallback);
        fallback = applyPositionContext(std::move(fallback), position);

        std::lock_guard<std::mutex> lock(mutex_);
        DecisionCacheEntry slot;
        slot.decision = fallback;
        slot.reference_price = price;
        slot.timestamp_ms = now_ms;
        slot.context = context;
        slot.source = DecisionSource::FALLBACK;
        slot.model = fallback.model;
        entries_[symbol] = slot;
        return fallback;
    }

    Decision decision;
    decision.symbol = symbol;
    decision.bias = answer.bias.value_or(local.bias);
    decision.confidence = clampConfidence(answer.confidence, local_confidence > 0.0 ? local_confidence : 0.5);
    decision.action = answer.action.value_or(DecisionAction::ENTRY);
    decision.exit_price = answer.exit_price;
    decision.entry_price = price;
    decision.source = DecisionSource::ORACLE;
    decision.model = answer.model.empty() ? "oracle" : answer.model;
    decision.timestamp_ms = now_ms;
    decision.reasoning = answer.reasoning +
        " · Δ5m " + formatCompact(snapshot.metrics.change_5m_pct, 2) +
        "%, RSI " + formatCompact(snapshot.metrics.rsi14, 1) +
        " · Vol " + formatCompact(snapshot.metrics.volume_ratio, 2) +
        " · MFI " + formatCompact(snapshot.metrics.mfi14, 1);
    echoLocal(decision);

    if (strong_local) {
        std::vector<std::string> parts;
        const std::string snippet = trimReasoning(local.reasoning, 12);
        if (!snippet.empty()) parts.push_back(snippet);
        parts.push_back("edge " + std::to_string(static_cast<long long>(std::llround(local_edge * 100.0))) + "%");
        parts.push_back("confidence " +
                        std::to_string(static_cast<long long>(std::llround(local_confidence * 100.0))) + "%");
        std::string joined;
        for (const auto& p : parts) {
            if (!joined.empty()) joined += " · ";
            joined += p;
        }
        decision.reasoning += " · Local confirms: " + joined;
        decision.confidence = clampUnit(std::max(decision.confidence, local_confidence));
    }

    decision = applyPositionContext(std::move(decision), position);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        DecisionCacheEntry slot;
        slot.decision = decision;
        slot.reference_price = price;
        slot.timestamp_ms = now_ms;
        slot.context = context;
        slot.source = DecisionSource::ORACLE;
        slot.model = decision.model;
        entries_[symbol] = slot;
    }
    return decision;
}

} // namespace strategy
} // namespace zenith
