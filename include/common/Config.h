#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"
#include "strategy/ScalpConfig.h"

namespace zenith {

class Config {
public:
    static constexpr const char* kSymbolPattern = "^[A-Z0-9]{5,20}$";

    static Config& getInstance();

    // JSON 파일(선택) -> 환경 변수 순으로 적용. 숫자 오류는 std::runtime_error
    void load(const std::string& config_path);

    std::string getApiKey() const { return api_key_; }
    std::string getApiSecret() const { return api_secret_; }
    std::string getOpenAiKey() const { return openai_key_; }
    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }
    std::string getPolicyServiceUrl() const { return policy_service_url_; }
    std::string getNswServiceUrl() const { return nsw_service_url_; }

    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    strategy::ScalpConfig getScalpConfig() const { return scalp_config_; }

    // "btcusdt, ETHUSDT" -> {"BTCUSDT", "ETHUSDT"}. 형식 불일치는 제외, 중복 제거
    static std::vector<std::string> parseSymbols(const std::string& csv);
    static bool isValidSymbol(const std::string& symbol);

    // 비어 있으면 fallback. 숫자가 아니면 "Invalid numeric configuration: <값>"
    static double parseNumber(const std::string& raw, double fallback);

    static engine::StrategyMode parseMode(const std::string& raw);

private:
    Config() = default;

    void applyFile(const nlohmann::json& j);
    void applyEnvironment();
    void normalize();

    std::string api_key_;
    std::string api_secret_;
    std::string openai_key_;
    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
    std::string policy_service_url_ = "http://localhost:4502/api/policy";
    std::string nsw_service_url_ = "http://localhost:4501/api/nsw";

    engine::EngineConfig engine_config_;
    strategy::ScalpConfig scalp_config_;
};

} // namespace zenith
