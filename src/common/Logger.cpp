#include "common/Logger.h"
#include "common/PathUtils.h"

#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>

#include <cmath>
#include <filesystem>
#include <stdexcept>
#include <vector>

namespace zenith {

namespace {
spdlog::level::level_enum levelOf(const std::string& level) {
    const auto parsed = spdlog::level::from_str(level);
    // from_str 는 모르는 이름을 off 로 돌려줌
    if (parsed == spdlog::level::off && level != "off") {
        return spdlog::level::info;
    }
    return parsed;
}

double finiteOrZero(double value) {
    return std::isfinite(value) ? value : 0.0;
}
} // namespace

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const LoggerOptions& options) {
    if (initialized_) return;

    const std::filesystem::path logs_path = utils::PathUtils::resolveRelativePath(options.log_dir);
    std::error_code ec;
    std::filesystem::create_directories(logs_path, ec);
    if (ec) {
        throw std::runtime_error("Log directory unavailable: " + logs_path.string() + " (" + ec.message() + ")");
    }

    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (logs_path / "zenith.log").string(), options.max_file_bytes, options.max_files
        );
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [t%t] %v");

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        main_logger_ = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
        main_logger_->set_level(levelOf(options.level));
        main_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(main_logger_);

        fill_logger_ = spdlog::daily_logger_mt("fills", (logs_path / "fills.log").string());
        fill_logger_->set_pattern("%v");
        fill_logger_->flush_on(spdlog::level::info);

        initialized_ = true;
        main_logger_->info("Logger initialized (level={})", spdlog::level::to_string_view(main_logger_->level()));
        main_logger_->info("Log directory: {}", logs_path.string());

    } catch (const spdlog::spdlog_ex& ex) {
        main_logger_.reset();
        fill_logger_.reset();
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

std::string Logger::formatFill(const FillLogEntry& entry) {
    nlohmann::json line = {
        {"symbol", entry.symbol},
        {"action", entry.action},
        {"side", entry.side},
        {"price", finiteOrZero(entry.price)},
        {"quantity", finiteOrZero(entry.quantity)}
    };
    if (entry.pnl) {
        line["pnl"] = finiteOrZero(*entry.pnl);
    }
    if (!entry.order_id.empty()) {
        line["orderId"] = entry.order_id;
    }
    return line.dump();
}

void Logger::logFill(const FillLogEntry& entry) {
    if (fill_logger_) {
        fill_logger_->info(formatFill(entry));
    }
}

} // namespace zenith
