#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <optional>
#include <string>

namespace zenith {

// 체결 로그 한 줄 (fills.log, JSON Lines)
struct FillLogEntry {
    std::string symbol;
    std::string action;              // ENTER / EXIT
    std::string side;                // BUY / SELL, LONG / SHORT
    double price = 0.0;
    double quantity = 0.0;
    std::optional<double> pnl;       // 청산만
    std::string order_id;
};

struct LoggerOptions {
    std::string log_dir = "logs";
    std::string level = "info";
    std::size_t max_file_bytes = 10 * 1024 * 1024;
    std::size_t max_files = 3;
};

class Logger {
public:
    static Logger& getInstance();

    // 두 번째 호출부터는 무시. sink 생성 실패 시 std::runtime_error
    void initialize(const LoggerOptions& options);

    // initialize() 이전 호출은 무시 (테스트/컴포넌트 단독 실행)
    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    void logFill(const FillLogEntry& entry);

    static std::string formatFill(const FillLogEntry& entry);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> fill_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) zenith::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) zenith::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) zenith::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) zenith::Logger::getInstance().error(__VA_ARGS__)

} // namespace zenith
