#include "common/Config.h"
#include "common/Logger.h"
#include "core/state/EventJournalJsonl.h"
#include "engine/TradingEngine.h"
#include "network/BinanceExchangeAdapter.h"
#include "network/BinanceHttpClient.h"
#include "network/BinanceMarketData.h"
#include "network/OpenAiStrategyOracle.h"
#include "network/PolicyServiceClient.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace zenith;

namespace {

// 시그널 핸들러에서는 플래그만 세우고 stop() 은 메인 스레드에서 호출
std::atomic<bool> g_stop_requested{false};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_stop_requested = true;
    }
}

void printUsage() {
    std::cout << "Usage: zenith [--config <path>] [--once]\n"
              << "  --config <path>  JSON 설정 파일 (기본값: config/config.json)\n"
              << "  --once           한 주기만 실행 후 종료\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config/config.json";
    bool run_once = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--once") {
            run_once = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            std::cerr << "알 수 없는 인자: " << arg << "\n";
            printUsage();
            return 2;
        }
    }

    // ===== 설정 =====
    auto& config = Config::getInstance();
    try {
        config.load(config_path);
        LoggerOptions log_options;
        log_options.log_dir = config.getLogDir();
        log_options.level = config.getLogLevel();
        Logger::getInstance().initialize(log_options);
    } catch (const std::exception& e) {
        std::cerr << "설정 오류: " << e.what() << "\n";
        return 1;
    }

    LOG_INFO("=============================================");
    LOG_INFO("       Zenith Futures Trader");
    LOG_INFO("=============================================");

    engine::EngineConfig engine_config = config.getEngineConfig();

    try {
        if (config.getApiKey().empty() || config.getApiSecret().empty()) {
            LOG_ERROR("BINANCE_API_KEY / BINANCE_API_SECRET 가 설정되지 않았습니다");
            return 1;
        }
        if (config.getOpenAiKey().empty() && engine_config.mode == engine::StrategyMode::ORACLE) {
            LOG_WARN("OPENAI_API_KEY 가 없어 오라클 결정은 항상 fallback 으로 처리됩니다");
        }

        network::BinanceHttpClient http(config.getApiKey(), config.getApiSecret(), engine_config.use_testnet);
        network::BinanceExchangeAdapter exchange(http);
        network::BinanceMarketData market_data(http);

        network::OpenAiStrategyOracle strategy_oracle(
            config.getOpenAiKey(),
            network::OpenAiStrategyOracle::defaultPipeline(),
            network::OpenAiStrategyOracle::defaultEscalation()
        );
        network::HttpPolicyOracle policy_oracle(config.getPolicyServiceUrl());
        network::HttpShockRiskClient shock_risk(config.getNswServiceUrl());
        core::EventJournalJsonl journal(engine_config.journal_path);
        LOG_INFO("Binance: {} / 이벤트 저널: {} (seq {})",
                 http.baseUrl(), journal.path().string(), journal.lastSeq());

        // 거래 가능한 USDT 무기한 심볼만 유지
        const auto tradable = exchange.filterTradableSymbols(engine_config.symbols);
        if (tradable.empty()) {
            LOG_ERROR("거래 가능한 심볼이 없습니다 (요청: {}개)", engine_config.symbols.size());
            return 1;
        }
        if (tradable.size() != engine_config.symbols.size()) {
            LOG_WARN("거래 불가 심볼 {}개 제외", engine_config.symbols.size() - tradable.size());
        }
        engine_config.symbols = tradable;

        engine::EngineDependencies deps{exchange, market_data, strategy_oracle};
        deps.policy_oracle = &policy_oracle;
        deps.shock_risk = &shock_risk;
        deps.journal = &journal;

        engine::TradingEngine trading_engine(engine_config, config.getScalpConfig(), deps);

        if (run_once) {
            const bool ran = trading_engine.tick();
            LOG_INFO("단일 주기 실행 {}", ran ? "완료" : "건너뜀");
            return ran ? 0 : 1;
        }

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        if (!trading_engine.start()) {
            return 1;
        }

        while (!g_stop_requested && trading_engine.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(engine::TradingEngine::kStopPollMs));
        }

        LOG_INFO("종료 신호 수신");
        trading_engine.stop();

        const auto stats = http.rateLimitStats();
        LOG_INFO("REST 요청 {}건, 대기 {}회 (누적 {}ms), 마지막 used weight {}",
                 stats.total_requests, stats.forced_waits, stats.total_wait_time.count(),
                 stats.last_used_weight);
    } catch (const std::exception& e) {
        LOG_ERROR("치명적 오류: {}", e.what());
        return 1;
    }

    LOG_INFO("정상 종료");
    return 0;
}
