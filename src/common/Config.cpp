#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <regex>
#include <set>
#include <stdexcept>

namespace zenith {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string lowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}
} // namespace

namespace engine {
const char* toString(StrategyMode mode) {
    return mode == StrategyMode::SCALP ? "scalp" : "oracle";
}
} // namespace engine

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

bool Config::isValidSymbol(const std::string& symbol) {
    static const std::regex kPattern(kSymbolPattern);
    return std::regex_match(symbol, kPattern);
}

std::vector<std::string> Config::parseSymbols(const std::string& csv) {
    const std::string source = trimCopy(csv).empty() ? "BTCUSDT,ETHUSDT" : csv;

    std::vector<std::string> symbols;
    std::set<std::string> seen;
    size_t start = 0;
    while (start <= source.size()) {
        size_t comma = source.find(',', start);
        if (comma == std::string::npos) comma = source.size();
        std::string symbol = trimCopy(source.substr(start, comma - start));
        std::transform(symbol.begin(), symbol.end(), symbol.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (!symbol.empty()) {
            if (!isValidSymbol(symbol)) {
                std::cout << "경고: 잘못된 심볼 형식은 제외합니다: " << symbol << std::endl;
            } else if (seen.insert(symbol).second) {
                symbols.push_back(symbol);
            }
        }
        start = comma + 1;
    }
    return symbols;
}

double Config::parseNumber(const std::string& raw, double fallback) {
    const std::string text = trimCopy(raw);
    if (text.empty()) {
        return fallback;
    }
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end == nullptr || *end != '\0' || !std::isfinite(value)) {
        throw std::runtime_error("Invalid numeric configuration: " + text);
    }
    return value;
}

engine::StrategyMode Config::parseMode(const std::string& raw) {
    const std::string mode = lowerCopy(trimCopy(raw));
    if (mode == "scalp") {
        return engine::StrategyMode::SCALP;
    }
    return engine::StrategyMode::ORACLE;
}

void Config::load(const std::string& path) {
    // 재호출 시 기본값에서 다시 시작
    engine_config_ = engine::EngineConfig();
    scalp_config_ = strategy::ScalpConfig();
    log_level_ = "info";
    log_dir_ = "logs";

    if (!path.empty()) {
        const std::filesystem::path config_path = utils::PathUtils::resolveRelativePath(path);

        std::cout << "설정 파일 경로: " << config_path << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cout << "경고: 설정 파일을 찾을 수 없습니다. 기본값을 사용합니다." << std::endl;
        } else {
            std::ifstream file(config_path);
            if (!file.is_open()) {
                std::cout << "경고: 설정 파일을 열 수 없습니다." << std::endl;
            } else {
                try {
                    nlohmann::json j;
                    file >> j;
                    applyFile(j);
                    std::cout << "설정 파일 로드 완료" << std::endl;
                } catch (const nlohmann::json::exception& e) {
                    std::cerr << "설정 로드 오류: " << e.what() << std::endl;
                }
            }
        }
    }

    applyEnvironment();
    normalize();
}

void Config::applyFile(const nlohmann::json& j) {
    if (j.contains("api")) {
        const std::string file_key = trimCopy(j["api"].value("api_key", ""));
        const std::string file_secret = trimCopy(j["api"].value("api_secret", ""));
        if (!file_key.empty() || !file_secret.empty()) {
            std::cout << "경고: config api 키 값은 무시됩니다. 환경 변수(BINANCE_API_KEY/BINANCE_API_SECRET)를 사용하세요."
                      << std::endl;
        }
    }

    if (j.contains("trading")) {
        auto& t = j["trading"];
        engine_config_.mode = parseMode(t.value("mode", "oracle"));
        if (t.contains("symbols") && t["symbols"].is_array()) {
            std::string joined;
            for (const auto& symbol : t["symbols"]) {
                if (!symbol.is_string()) continue;
                if (!joined.empty()) joined += ",";
                joined += symbol.get<std::string>();
            }
            engine_config_.symbols = parseSymbols(joined);
        }
        engine_config_.use_testnet = t.value("use_testnet", true);
        engine_config_.loop_interval_seconds = t.value("loop_interval_seconds", 30);
        engine_config_.leverage = t.value("leverage", 5);
        engine_config_.max_leverage = t.value("max_leverage", 5);
        engine_config_.allocation_pct = t.value("allocation_pct", 10.0);
        engine_config_.initial_balance = t.value("initial_balance", 100000.0);
        engine_config_.kline_interval = t.value("kline_interval", std::string("1m"));
        engine_config_.kline_limit = t.value("kline_limit", 240);
        engine_config_.order_book_depth = t.value("order_book_depth", 10);
        engine_config_.trade_lookback = t.value("trade_lookback", 200);
        engine_config_.position_ttl_ms = t.value("position_ttl_ms", 3000LL);
        engine_config_.decision_cooldown_ms = t.value("decision_cooldown_ms", 45000LL);
        engine_config_.decision_revalidation_ms = t.value("decision_revalidation_ms", 240000LL);
        engine_config_.journal_path = t.value("journal_path", engine_config_.journal_path);
    }

    if (j.contains("logging")) {
        log_level_ = j["logging"].value("level", log_level_);
        log_dir_ = j["logging"].value("dir", log_dir_);
    }

    if (j.contains("services")) {
        policy_service_url_ = j["services"].value("policy_url", policy_service_url_);
        nsw_service_url_ = j["services"].value("nsw_url", nsw_service_url_);
    }

    if (j.contains("scalp")) {
        auto& s = j["scalp"];
        auto& c = scalp_config_;
        c.quality_threshold = s.value("quality_threshold", c.quality_threshold);
        c.breakout_threshold = s.value("breakout_threshold", c.breakout_threshold);
        c.mean_threshold = s.value("mean_threshold", c.mean_threshold);
        c.ema50_threshold = s.value("ema50_threshold", c.ema50_threshold);
        c.orderflow_ratio_min = s.value("orderflow_ratio_min", c.orderflow_ratio_min);
        c.fvg_min_multiple = s.value("fvg_min_multiple", c.fvg_min_multiple);
        c.model1_tp1_rr = s.value("model1_tp1_rr", c.model1_tp1_rr);
        c.model2_tp1_rr = s.value("model2_tp1_rr", c.model2_tp1_rr);
        c.model3_tp1_rr = s.value("model3_tp1_rr", c.model3_tp1_rr);
        c.signal_stale_sec = s.value("signal_stale_sec", c.signal_stale_sec);
        c.max_hold_sec = s.value("max_hold_sec", c.max_hold_sec);
        c.max_bars = s.value("max_bars", c.max_bars);
        c.cooldown_window_ms = s.value("cooldown_window_ms", c.cooldown_window_ms);
        c.cooldown_ms = s.value("cooldown_ms", c.cooldown_ms);
        c.trail_atr_mult = s.value("trail_atr_mult", c.trail_atr_mult);

        if (s.contains("micro")) {
            auto& m = s["micro"];
            c.micro.spread_bp = m.value("spread_bp", c.micro.spread_bp);
            c.micro.slippage_bp = m.value("slippage_bp", c.micro.slippage_bp);
            c.micro.latency_ms = m.value("latency_ms", c.micro.latency_ms);
            c.micro.quote_age_ms = m.value("quote_age_ms", c.micro.quote_age_ms);
            c.micro.depth_bias_long = m.value("depth_bias_long", c.micro.depth_bias_long);
            c.micro.depth_bias_short = m.value("depth_bias_short", c.micro.depth_bias_short);
            c.micro.spread_high_bp = m.value("spread_high_bp", c.micro.spread_high_bp);
            c.micro.slippage_high_bp = m.value("slippage_high_bp", c.micro.slippage_high_bp);
        }
        if (s.contains("sessions")) {
            auto& w = s["sessions"];
            c.sessions.asia = w.value("asia", c.sessions.asia);
            c.sessions.london = w.value("london", c.sessions.london);
            c.sessions.ny = w.value("ny", c.sessions.ny);
            c.sessions.bridge = w.value("bridge", c.sessions.bridge);
        }
        if (s.contains("tick_sizes") && s["tick_sizes"].is_object()) {
            for (auto it = s["tick_sizes"].begin(); it != s["tick_sizes"].end(); ++it) {
                if (it.value().is_number()) {
                    c.tick_sizes[it.key()] = it.value().get<double>();
                }
            }
        }
    }
}

void Config::applyEnvironment() {
    api_key_ = readEnvVar("BINANCE_API_KEY");
    api_secret_ = readEnvVar("BINANCE_API_SECRET");
    openai_key_ = readEnvVar("OPENAI_API_KEY");
    if (api_key_.empty() || api_secret_.empty()) {
        std::cout << "경고: BINANCE_API_KEY 또는 BINANCE_API_SECRET 환경 변수가 비어 있습니다." << std::endl;
    }

    const std::string symbols = readEnvVar("BINANCE_SYMBOLS");
    if (!symbols.empty()) {
        engine_config_.symbols = parseSymbols(symbols);
    }

    const std::string testnet = readEnvVar("BINANCE_USE_TESTNET");
    if (!testnet.empty()) {
        engine_config_.use_testnet = lowerCopy(testnet) == "true";
    }

    engine_config_.initial_balance = parseNumber(readEnvVar("INITIAL_BALANCE"), engine_config_.initial_balance);
    engine_config_.loop_interval_seconds = static_cast<int>(
        parseNumber(readEnvVar("LOOP_INTERVAL_SECONDS"), engine_config_.loop_interval_seconds));
    engine_config_.max_leverage = static_cast<int>(
        parseNumber(readEnvVar("MAX_POSITION_LEVERAGE"), engine_config_.max_leverage));

    const std::string mode = readEnvVar("STRATEGY_MODE");
    if (!mode.empty()) {
        engine_config_.mode = parseMode(mode);
    }

    const std::string policy_url = readEnvVar("POLICY_SERVICE_URL");
    if (!policy_url.empty()) policy_service_url_ = policy_url;
    const std::string nsw_url = readEnvVar("NSW_SERVICE_URL");
    if (!nsw_url.empty()) nsw_service_url_ = nsw_url;

    const std::string level = readEnvVar("LOG_LEVEL");
    if (!level.empty()) log_level_ = lowerCopy(level);
}

void Config::normalize() {
    auto& e = engine_config_;
    e.max_leverage = std::max(1, e.max_leverage);
    e.leverage = std::max(1, std::min(e.leverage, e.max_leverage));
    e.allocation_pct = std::max(1.0, std::min(100.0, e.allocation_pct));
    e.loop_interval_seconds = std::max(1, e.loop_interval_seconds);
    if (!(e.initial_balance > 0.0)) {
        throw std::runtime_error("Invalid numeric configuration: initial balance must be positive");
    }
}

} // namespace zenith
