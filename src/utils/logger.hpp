#pragma once

#include <string>
#include <memory>
#include <chrono>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace arbx {
namespace utils {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5
};

LogLevel parse_log_level(const std::string& level, LogLevel fallback = LogLevel::INFO);

class Logger {
public:
    // Empty log_file_path means console only
    static void initialize(const std::string& log_file_path = "logs/arbx.log",
                           LogLevel level = LogLevel::INFO,
                           size_t max_file_size = 1024 * 1024 * 10,  // 10MB
                           size_t max_files = 3,
                           bool console_output = true);

    static void shutdown();

    template<typename... Args>
    static void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->trace(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->critical(fmt, std::forward<Args>(args)...);
        }
    }

    // Plain messages are never parsed as format strings
    static void trace(const std::string& msg);
    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    static void critical(const std::string& msg);

    static void set_level(LogLevel level);
    static LogLevel get_level();
    static bool is_enabled(LogLevel level);

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static LogLevel current_level_;

    static spdlog::level::level_enum to_spdlog_level(LogLevel level);
};

// Structured logging for arbitrage events
class TradingLogger {
public:
    static void log_opportunity(const std::string& token_in, const std::string& token_out,
                                double amount, double expected_profit);

    static void log_trade_executed(const std::string& attempt_id, const std::string& strategy,
                                   double profit, double amount_in, double amount_out);

    static void log_trade_failed(const std::string& attempt_id, const std::string& strategy,
                                 const std::string& reason);

    static void log_risk_alert(const std::string& alert_type, const std::string& description,
                               double current_value, double threshold);

    static void log_system_event(const std::string& event_type, const std::string& description);
};

// RAII scope timer, logs elapsed time at debug level
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& operation_name);
    ~ScopedTimer();

private:
    std::string operation_name_;
    std::chrono::steady_clock::time_point start_time_;
};

#define ARBX_LOG_TRACE(...) arbx::utils::Logger::trace(__VA_ARGS__)
#define ARBX_LOG_DEBUG(...) arbx::utils::Logger::debug(__VA_ARGS__)
#define ARBX_LOG_INFO(...) arbx::utils::Logger::info(__VA_ARGS__)
#define ARBX_LOG_WARN(...) arbx::utils::Logger::warn(__VA_ARGS__)
#define ARBX_LOG_ERROR(...) arbx::utils::Logger::error(__VA_ARGS__)
#define ARBX_LOG_CRITICAL(...) arbx::utils::Logger::critical(__VA_ARGS__)

#define ARBX_SCOPED_TIMER(name) arbx::utils::ScopedTimer timer(name)

} // namespace utils
} // namespace arbx
