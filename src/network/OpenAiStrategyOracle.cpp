#include "network/OpenAiStrategyOracle.h"
#include "network/OraclePayloadParser.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace zenith {
namespace network {

namespace {
const char* kSystemPrompt =
    "You are Zenith, an expert crypto futures trading strategist specializing in technical analysis.\n"
    "Return ONLY a JSON object with this exact structure, nothing else:\n"
    "{\"symbol\":\"string\",\"bias\":\"long|short|flat\",\"confidence\":0-1,\"reasoning\":\"<=22 words\"}\n"
    "Analysis Guidelines:\n"
    "- RSI_14: <30 oversold (bullish), >70 overbought (bearish), 30-70 neutral but trending\n"
    "- Change_5m_pct: >0.5% strong move, >0.8% very strong move, direction crucial\n"
    "- Vol_ratio: >1.2 high volume (confirms trend), >1.4 very high (strong confirmation)\n"
    "- Edge_score: >0.6 strong signal, >0.65 very strong signal\n"
    "- FLAT only when truly uncertain\n"
    "- Confidence: 0.30-0.95, based on signal alignment strength\n"
    "- Must reference actual values in reasoning";

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

double numberAt(const nlohmann::json& node, const char* key) {
    if (node.is_object() && node.contains(key) && node[key].is_number()) {
        return node[key].get<double>();
    }
    return 0.0;
}
} // namespace

OpenAiStrategyOracle::OpenAiStrategyOracle(
    std::string api_key,
    std::vector<OracleModelSpec> pipeline,
    std::optional<OracleModelSpec> escalation,
    std::string endpoint
)
    : api_key_(std::move(api_key))
    , pipeline_(std::move(pipeline))
    , escalation_(std::move(escalation))
    , endpoint_(std::move(endpoint))
    , session_(kRequestTimeoutSec) {}

std::vector<OracleModelSpec> OpenAiStrategyOracle::defaultPipeline() {
    return {
        {"gpt-5-mini", 2000, std::nullopt},
        {"gpt-5-nano", 1500, 0.62}
    };
}

OracleModelSpec OpenAiStrategyOracle::defaultEscalation() {
    return {"gpt-5-pro", 2000, 0.6};
}

std::string OpenAiStrategyOracle::buildPrompt(const std::string& symbol, const nlohmann::json& context) {
    return "Symbol: " + symbol + "\n" +
           "Metrics JSON:\n" +
           context.dump(2) + "\n" +
           "Analyze the metrics to determine trading bias. Consider all provided values.";
}

nlohmann::json OpenAiStrategyOracle::buildRequestBody(const OracleModelSpec& spec, const std::string& prompt) {
    return {
        {"model", spec.id},
        {"messages", nlohmann::json::array({
            {{"role", "system"}, {"content", kSystemPrompt}},
            {{"role", "user"}, {"content", prompt}}
        })},
        {"max_completion_tokens", spec.max_output_tokens},
        {"metadata", {{"application", "zenith-trader"}, {"intent", "strategy"}}}
    };
}

std::optional<std::string> OpenAiStrategyOracle::extractContent(const nlohmann::json& response) {
    if (!response.is_object() || !response.contains("choices") || !response["choices"].is_array() ||
        response["choices"].empty()) {
        return std::nullopt;
    }
    const auto& choice = response["choices"][0];
    if (!choice.contains("message") || !choice["message"].is_object()) {
        return std::nullopt;
    }
    const auto& message = choice["message"];
    if (!message.contains("content") || !message["content"].is_string()) {
        return std::nullopt;
    }
    std::string content = OraclePayloadParser::stripCodeFences(message["content"].get<std::string>());
    if (content.empty()) {
        return std::nullopt;
    }
    return content;
}

bool OpenAiStrategyOracle::shouldEscalate(const nlohmann::json& context) {
    if (!context.is_object() || !context.contains("account")) {
        return false;
    }
    const auto& account = context["account"];
    const double leverage = numberAt(account, "leverage");
    const double notional = numberAt(account, "estimated_notional");
    return leverage >= kHighLeverageThreshold || notional >= kHighNotionalThreshold;
}

std::vector<OracleModelSpec> OpenAiStrategyOracle::activePipeline(const nlohmann::json& context) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<OracleModelSpec> active;
    for (const auto& spec : pipeline_) {
        if (disabled_models_.count(spec.id) == 0) {
            active.push_back(spec);
        }
    }
    if (escalation_ && shouldEscalate(context) && disabled_models_.count(escalation_->id) == 0) {
        active.push_back(*escalation_);
    }
    return active;
}

std::string OpenAiStrategyOracle::call(const OracleModelSpec& spec, const std::string& prompt) {
    auto response = session_.perform("POST", endpoint_, buildRequestBody(spec, prompt).dump(), {
        {"Content-Type", "application/json"},
        {"Authorization", "Bearer " + api_key_}
    });

    nlohmann::json data = nlohmann::json::object();
    if (!response.body.empty()) {
        try {
            data = response.json();
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error(std::string("Failed to parse OpenAI response payload: ") + e.what());
        }
    }

    if (!response.isSuccess()) {
        std::string message = "OpenAI responded with status " + std::to_string(response.status_code);
        if (data.contains("error") && data["error"].is_object() &&
            data["error"].contains("message") && data["error"]["message"].is_string()) {
            message += ": " + data["error"]["message"].get<std::string>();
        }
        throw std::runtime_error(message);
    }

    auto content = extractContent(data);
    if (!content) {
        throw std::runtime_error("OpenAI response did not include strategy content");
    }
    return *content;
}

core::OracleDecision OpenAiStrategyOracle::request(const std::string& symbol, const nlohmann::json& context) {
    if (api_key_.empty()) {
        throw std::runtime_error("OPENAI_API_KEY is not configured");
    }

    const auto pipeline = activePipeline(context);
    if (pipeline.empty()) {
        throw std::runtime_error("No OpenAI models available for strategy request");
    }

    const std::string prompt = buildPrompt(symbol, context);
    std::string last_error = "Failed to obtain strategy from OpenAI";

    for (const auto& spec : pipeline) {
        try {
            auto decision = OraclePayloadParser::parseStrategy(call(spec, prompt), symbol);
            decision.model = spec.id;

            if (spec.min_confidence && decision.confidence.value_or(0.0) < *spec.min_confidence) {
                last_error = "Model " + spec.id + " returned low confidence " +
                             std::to_string(decision.confidence.value_or(0.0));
                LOG_WARN("[{}] {}", symbol, last_error);
                continue;
            }
            return decision;
        } catch (const std::runtime_error& e) {
            last_error = e.what();
            const std::string message = lower(last_error);
            if (message.find("does not exist") != std::string::npos) {
                LOG_WARN("OpenAI model not found, removing from pipeline: {}", spec.id);
                std::lock_guard<std::mutex> lock(mutex_);
                disabled_models_.insert(spec.id);
            } else {
                LOG_WARN("[{}] model {} failed: {}", symbol, spec.id, last_error);
            }
        }
    }
    throw std::runtime_error(last_error);
}

} // namespace network
} // namespace zenith
