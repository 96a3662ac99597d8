#include "common/Config.h"

#include <cassert>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

int main() {
    using namespace zenith;

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    for (const char* name : {"BINANCE_SYMBOLS", "BINANCE_USE_TESTNET", "INITIAL_BALANCE",
                             "LOOP_INTERVAL_SECONDS", "MAX_POSITION_LEVERAGE", "STRATEGY_MODE",
                             "POLICY_SERVICE_URL", "NSW_SERVICE_URL", "LOG_LEVEL"}) {
        unsetenv(name);
    }

    // 1. 심볼 파싱
    {
        auto symbols = Config::parseSymbols("btcusdt, ETHUSDT,btcusdt,bad-sym");
        assert(symbols.size() == 2);
        assert(symbols[0] == "BTCUSDT");
        assert(symbols[1] == "ETHUSDT");

        auto defaults = Config::parseSymbols("  ");
        assert(defaults.size() == 2 && defaults[0] == "BTCUSDT");

        assert(Config::isValidSymbol("SOLUSDT"));
        assert(!Config::isValidSymbol("BTC"));
        assert(!Config::isValidSymbol("btcusdt"));
    }

    // 2. 숫자/모드 파싱
    {
        assert(Config::parseNumber("", 7.0) == 7.0);
        assert(Config::parseNumber(" 12.5 ", 0.0) == 12.5);
        bool threw = false;
        try {
            Config::parseNumber("abc", 1.0);
        } catch (const std::runtime_error& e) {
            threw = std::string(e.what()) == "Invalid numeric configuration: abc";
        }
        if (!threw) {
            std::cerr << "[TEST] parseNumber should reject non-numeric input\n";
            return 1;
        }
        assert(Config::parseMode("SCALP") == engine::StrategyMode::SCALP);
        assert(Config::parseMode("anything") == engine::StrategyMode::ORACLE);
    }

    // 3. 파일 로드 + 정규화
    const auto path = std::filesystem::temp_directory_path() / "zenith_test_config.json";
    {
        std::ofstream out(path);
        out << R"({
            "trading": {
                "mode": "scalp",
                "symbols": ["solusdt", "BTCUSDT", "x"],
                "leverage": 20,
                "max_leverage": 10,
                "allocation_pct": 250,
                "loop_interval_seconds": 15
            },
            "logging": { "level": "debug" },
            "scalp": {
                "quality_threshold": 0.75,
                "micro": { "spread_bp": 3.0 },
                "tick_sizes": { "SOLUSDT": 0.001 }
            }
        })";
    }

    Config& config = Config::getInstance();
    config.load(path.string());
    {
        auto e = config.getEngineConfig();
        assert(e.mode == engine::StrategyMode::SCALP);
        assert(e.symbols.size() == 2 && e.symbols[0] == "SOLUSDT");
        assert(e.max_leverage == 10);
        assert(e.leverage == 10);
        assert(e.allocation_pct == 100.0);
        assert(e.loop_interval_seconds == 15);
        assert(config.getLogLevel() == "debug");

        auto s = config.getScalpConfig();
        assert(std::abs(s.quality_threshold - 0.75) < 1e-12);
        assert(s.micro.spread_bp == 3.0);
        assert(s.tick_sizes.at("SOLUSDT") == 0.001);
        assert(s.tick_sizes.at("BTCUSDT") == 0.1);
    }

    // 4. 환경 변수 우선
    setenv("STRATEGY_MODE", "oracle", 1);
    setenv("BINANCE_SYMBOLS", "ethusdt", 1);
    setenv("MAX_POSITION_LEVERAGE", "3", 1);
    config.load(path.string());
    {
        auto e = config.getEngineConfig();
        assert(e.mode == engine::StrategyMode::ORACLE);
        assert(e.symbols.size() == 1 && e.symbols[0] == "ETHUSDT");
        assert(e.leverage == 3);
    }

    // 5. 잘못된 숫자 환경 변수는 설정 오류
    setenv("INITIAL_BALANCE", "lots", 1);
    bool threw = false;
    try {
        config.load(path.string());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    unsetenv("INITIAL_BALANCE");
    unsetenv("STRATEGY_MODE");
    unsetenv("BINANCE_SYMBOLS");
    unsetenv("MAX_POSITION_LEVERAGE");
    std::error_code ec;
    std::filesystem::remove(path, ec);

    if (!threw) {
        std::cerr << "[TEST] invalid INITIAL_BALANCE should fail load\n";
        return 1;
    }

    std::cout << "[TEST] Config Test PASSED!" << std::endl;
    return 0;
}
