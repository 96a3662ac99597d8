#pragma once

#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "core/contracts/IStrategyOracle.h"
#include "network/CurlSession.h"

namespace zenith {
namespace network {

struct OracleModelSpec {
    std::string id;
    int max_output_tokens = 2000;
    std::optional<double> min_confidence;   // 미만이면 다음 모델로
};

// chat-completions 기반 전략 오라클.
// 모델 파이프라인을 순서대로 시도하고, 존재하지 않는 모델은 이후 제외
class OpenAiStrategyOracle : public core::IStrategyOracle {
public:
    static constexpr long kRequestTimeoutSec = 20L;
    static constexpr int kHighLeverageThreshold = 10;
    static constexpr double kHighNotionalThreshold = 500.0;

    OpenAiStrategyOracle(
        std::string api_key,
        std::vector<OracleModelSpec> pipeline,
        std::optional<OracleModelSpec> escalation = std::nullopt,
        std::string endpoint = "https://api.openai.com/v1/chat/completions"
    );

    core::OracleDecision request(const std::string& symbol, const nlohmann::json& context) override;

    static std::vector<OracleModelSpec> defaultPipeline();
    static OracleModelSpec defaultEscalation();

    static std::string buildPrompt(const std::string& symbol, const nlohmann::json& context);
    static nlohmann::json buildRequestBody(const OracleModelSpec& spec, const std::string& prompt);

    // choices[0].message.content (없으면 nullopt)
    static std::optional<std::string> extractContent(const nlohmann::json& response);

    // 고레버리지/고명목 요청은 상위 모델 추가
    static bool shouldEscalate(const nlohmann::json& context);

private:
    std::string call(const OracleModelSpec& spec, const std::string& prompt);
    std::vector<OracleModelSpec> activePipeline(const nlohmann::json& context);

    std::string api_key_;
    std::vector<OracleModelSpec> pipeline_;
    std::optional<OracleModelSpec> escalation_;
    std::string endpoint_;
    CurlSession session_;

    std::set<std::string> disabled_models_;
    std::mutex mutex_;
};

} // namespace network
} // namespace zenith
