#include "network/OraclePayloadParser.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace zenith {
namespace network {

namespace {
std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

std::string upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::optional<double> strictNumber(const std::string& raw) {
    const std::string text = trim(raw);
    if (text.empty()) return std::nullopt;
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end == nullptr || *end != '\0' || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

double requireNumber(const nlohmann::json& node, const char* key, const char* what) {
    if (!node.contains(key) || !node[key].is_number()) {
        throw std::runtime_error(std::string(what) + ": " + key + " must be a number");
    }
    const double value = node[key].get<double>();
    if (!std::isfinite(value)) {
        throw std::runtime_error(std::string(what) + ": " + key + " must be finite");
    }
    return value;
}

bool requireBool(const nlohmann::json& node, const char* key, const char* what) {
    if (!node.contains(key) || !node[key].is_boolean()) {
        throw std::runtime_error(std::string(what) + ": " + key + " must be a boolean");
    }
    return node[key].get<bool>();
}

std::string requireString(const nlohmann::json& node, const char* key, const char* what) {
    if (!node.contains(key) || !node[key].is_string()) {
        throw std::runtime_error(std::string(what) + ": " + key + " must be a string");
    }
    return node[key].get<std::string>();
}

// 후보 모델은 BREAKOUT/MEAN/EMA50 만
strategy::Model requireCandidateModel(const std::string& text, const char* what) {
    auto model = strategy::parseModel(text);
    if (!model || *model == strategy::Model::NONE) {
        throw std::runtime_error(std::string(what) + ": invalid model " + text);
    }
    return *model;
}
} // namespace

std::string OraclePayloadParser::stripCodeFences(const std::string& content) {
    std::string cleaned = trim(content);
    if (cleaned.rfind("```", 0) == 0) {
        size_t pos = 3;
        if (cleaned.compare(pos, 4, "json") == 0) {
            pos += 4;
        }
        while (pos < cleaned.size() && std::isspace(static_cast<unsigned char>(cleaned[pos]))) {
            ++pos;
        }
        cleaned = cleaned.substr(pos);
    }
    const std::string trimmed = trim(cleaned);
    if (trimmed.size() >= 3 && trimmed.compare(trimmed.size() - 3, 3, "```") == 0) {
        cleaned = trimmed.substr(0, trimmed.size() - 3);
    }
    return trim(cleaned);
}

std::string OraclePayloadParser::sanitizeReasoning(const nlohmann::json& value) {
    if (!value.is_string()) {
        return "No reasoning provided";
    }
    std::istringstream stream(value.get<std::string>());
    std::vector<std::string> words;
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    if (words.empty()) {
        return "No reasoning provided";
    }

    const size_t count = std::min(words.size(), kReasoningWordLimit);
    std::string result;
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) result += " ";
        result += words[i];
    }
    if (words.size() > kReasoningWordLimit) {
        result += "...";
    }
    return result;
}

std::optional<double> OraclePayloadParser::parseConfidence(const nlohmann::json& value) {
    if (value.is_number()) {
        const double number = value.get<double>();
        return std::isfinite(number) ? std::optional<double>(number) : std::nullopt;
    }
    if (!value.is_string()) {
        return std::nullopt;
    }
    const std::string raw = trim(value.get<std::string>());
    if (!raw.empty() && raw.back() == '%') {
        auto percent = strictNumber(raw.substr(0, raw.size() - 1));
        if (percent) return *percent / 100.0;
        return std::nullopt;
    }
    return strictNumber(raw);
}

core::OracleDecision OraclePayloadParser::parseStrategy(const std::string& content, const std::string& fallback_symbol) {
    const std::string cleaned = stripCodeFences(content);
    if (cleaned.empty()) {
        throw std::runtime_error("Strategy payload was empty");
    }
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(cleaned);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::string("Failed to parse strategy JSON: ") + e.what());
    }
    return parseStrategy(parsed, fallback_symbol);
}

core::OracleDecision OraclePayloadParser::parseStrategy(const nlohmann::json& payload, const std::string& fallback_symbol) {
    if (!payload.is_object()) {
        throw std::runtime_error("Strategy payload was not an object");
    }

    std::optional<Bias> bias;
    if (payload.contains("bias") && payload["bias"].is_string()) {
        bias = parseBias(trim(payload["bias"].get<std::string>()));
    }
    if (!bias) {
        throw std::runtime_error("Invalid bias returned from strategy oracle");
    }

    auto confidence = payload.contains("confidence") ? parseConfidence(payload["confidence"]) : std::nullopt;
    if (!confidence) {
        throw std::runtime_error("Invalid confidence returned from strategy oracle");
    }

    core::OracleDecision decision;
    decision.bias = bias;
    decision.confidence = std::max(0.0, std::min(1.0, *confidence));
    decision.reasoning = sanitizeReasoning(payload.value("reasoning", nlohmann::json()));

    std::string symbol = payload.contains("symbol") && payload["symbol"].is_string()
        ? trim(payload["symbol"].get<std::string>())
        : "";
    decision.symbol = symbol.empty() ? fallback_symbol : upper(symbol);

    if (payload.contains("action") && payload["action"].is_string()) {
        decision.action = parseDecisionAction(trim(payload["action"].get<std::string>()));
    }
    for (const char* key : {"entryPrice", "entry_price"}) {
        if (payload.contains(key) && payload[key].is_number()) {
            decision.entry_price = payload[key].get<double>();
        }
    }
    for (const char* key : {"exitPrice", "exit_price"}) {
        if (payload.contains(key) && payload[key].is_number()) {
            decision.exit_price = payload[key].get<double>();
        }
    }
    return decision;
}

strategy::PolicyVerdict OraclePayloadParser::parsePolicy(const nlohmann::json& payload) {
    static constexpr const char* kWhat = "Policy payload";
    if (!payload.is_object()) {
        throw std::runtime_error("Policy payload was not an object");
    }

    strategy::PolicyVerdict verdict;
    verdict.allow = requireBool(payload, "allow", kWhat);
    verdict.quality = requireNumber(payload, "quality", kWhat);
    if (verdict.quality < 0.0 || verdict.quality > 1.0) {
        throw std::runtime_error("Policy payload: quality out of range");
    }

    if (!payload.contains("chosen") || !payload["chosen"].is_object()) {
        throw std::runtime_error("Policy payload: chosen must be an object");
    }
    const auto& chosen = payload["chosen"];
    verdict.model = requireCandidateModel(requireString(chosen, "model", kWhat), kWhat);
    auto side = strategy::parseSide(requireString(chosen, "side", kWhat));
    if (!side) {
        throw std::runtime_error("Policy payload: invalid side");
    }
    verdict.side = *side;

    if (payload.contains("tpRR") && payload["tpRR"].is_number()) {
        const double rr = payload["tpRR"].get<double>();
        if (std::isfinite(rr) && rr > 0.0) {
            verdict.tp_rr = rr;
        }
    }
    if (payload.contains("entryHint")) {
        const auto& hint = payload["entryHint"];
        if (hint.is_string()) {
            verdict.entry_hint = strategy::parseEntryLevel(hint.get<std::string>());
        } else if (hint.is_object() && hint.contains("level") && hint["level"].is_string()) {
            verdict.entry_hint = strategy::parseEntryLevel(hint["level"].get<std::string>());
        }
    }
    if (payload.contains("notes") && payload["notes"].is_array()) {
        for (const auto& note : payload["notes"]) {
            if (note.is_string()) {
                verdict.notes.push_back(note.get<std::string>());
            }
        }
    }
    return verdict;
}

strategy::ShockRisk OraclePayloadParser::parseShockRisk(const nlohmann::json& payload) {
    static constexpr const char* kWhat = "Shock risk payload";
    if (!payload.is_object()) {
        throw std::runtime_error("Shock risk payload was not an object");
    }

    strategy::ShockRisk risk;
    risk.agg_impact = requireNumber(payload, "aggImpact", kWhat);
    if (risk.agg_impact < 0.0 || risk.agg_impact > 1.0) {
        throw std::runtime_error("Shock risk payload: aggImpact out of range");
    }
    auto grade = strategy::parseRiskGrade(requireString(payload, "grade", kWhat));
    if (!grade) {
        throw std::runtime_error("Shock risk payload: invalid grade");
    }
    risk.grade = *grade;

    if (!payload.contains("policy") || !payload["policy"].is_object()) {
        throw std::runtime_error("Shock risk payload: policy must be an object");
    }
    const auto& policy = payload["policy"];
    risk.policy.size_mul = requireNumber(policy, "sizeMul", kWhat);
    risk.policy.forbid_market = requireBool(policy, "forbidMarket", kWhat);
    risk.policy.model_pref = requireCandidateModel(requireString(policy, "modelPref", kWhat), kWhat);
    risk.policy.spread_cap_bp = requireNumber(policy, "spreadCapBp", kWhat);
    if (risk.policy.size_mul <= 0.0 || risk.policy.spread_cap_bp <= 0.0) {
        throw std::runtime_error("Shock risk payload: sizeMul and spreadCapBp must be positive");
    }
    return risk;
}

} // namespace network
} // namespace zenith
