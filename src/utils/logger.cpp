#include "utils/logger.hpp"
#include <filesystem>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <vector>
#include <algorithm>
#include <cctype>

namespace arbx {
namespace utils {

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;
LogLevel Logger::current_level_ = LogLevel::INFO;

LogLevel parse_log_level(const std::string& level, LogLevel fallback) {
    std::string upper = level;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "TRACE") return LogLevel::TRACE;
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "CRITICAL") return LogLevel::CRITICAL;
    return fallback;
}

void Logger::initialize(const std::string& log_file_path, LogLevel level,
                        size_t max_file_size, size_t max_files, bool console_output) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (console_output) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(to_spdlog_level(level));
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
            sinks.push_back(console_sink);
        }

        if (!log_file_path.empty()) {
            std::filesystem::path log_path(log_file_path);
            if (log_path.has_parent_path()) {
                std::filesystem::create_directories(log_path.parent_path());
            }
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file_path, max_file_size, max_files);
            file_sink->set_level(to_spdlog_level(level));
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }

        // Re-initialization replaces the registered logger
        spdlog::drop("arbx");
        logger_ = std::make_shared<spdlog::logger>("arbx", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(level));
        current_level_ = level;

        spdlog::register_logger(logger_);
        spdlog::set_default_logger(logger_);

        logger_->flush_on(spdlog::level::warn);
        spdlog::flush_every(std::chrono::seconds(3));

        Logger::info("Logger initialized");
    } catch (const std::exception& e) {
        std::cerr << "Logger initialization failed: " << e.what() << std::endl;
        throw;
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::shutdown();
        logger_ = nullptr;
    }
}

void Logger::trace(const std::string& msg) {
    if (logger_) logger_->trace(msg);
}

void Logger::debug(const std::string& msg) {
    if (logger_) logger_->debug(msg);
}

void Logger::info(const std::string& msg) {
    if (logger_) logger_->info(msg);
}

void Logger::warn(const std::string& msg) {
    if (logger_) logger_->warn(msg);
}

void Logger::error(const std::string& msg) {
    if (logger_) logger_->error(msg);
}

void Logger::critical(const std::string& msg) {
    if (logger_) logger_->critical(msg);
}

void Logger::set_level(LogLevel level) {
    current_level_ = level;
    if (logger_) {
        logger_->set_level(to_spdlog_level(level));
    }
}

LogLevel Logger::get_level() {
    return current_level_;
}

bool Logger::is_enabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(current_level_);
}

spdlog::level::level_enum Logger::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        default: return spdlog::level::info;
    }
}

// TradingLogger implementation
void TradingLogger::log_opportunity(const std::string& token_in, const std::string& token_out,
                                    double amount, double expected_profit) {
    std::stringstream ss;
    ss << "ARBITRAGE_OPPORTUNITY | In: " << token_in << " | Out: " << token_out
       << " | Amount: " << amount
       << " | ExpectedProfit: " << std::fixed << std::setprecision(6) << expected_profit;
    Logger::info(ss.str());
}

void TradingLogger::log_trade_executed(const std::string& attempt_id, const std::string& strategy,
                                       double profit, double amount_in, double amount_out) {
    std::stringstream ss;
    ss << "TRADE_EXECUTED | AttemptID: " << attempt_id << " | Strategy: " << strategy
       << " | In: " << amount_in << " | Out: " << amount_out
       << " | Profit: " << std::fixed << std::setprecision(6) << profit;
    Logger::info(ss.str());
}

void TradingLogger::log_trade_failed(const std::string& attempt_id, const std::string& strategy,
                                     const std::string& reason) {
    std::stringstream ss;
    ss << "TRADE_FAILED | AttemptID: " << attempt_id << " | Strategy: " << strategy
       << " | Reason: " << reason;
    Logger::warn(ss.str());
}

void TradingLogger::log_risk_alert(const std::string& alert_type, const std::string& description,
                                   double current_value, double threshold) {
    std::stringstream ss;
    ss << "RISK_ALERT | Type: " << alert_type << " | Description: " << description
       << " | Current: " << current_value << " | Threshold: " << threshold;
    Logger::warn(ss.str());
}

void TradingLogger::log_system_event(const std::string& event_type, const std::string& description) {
    std::stringstream ss;
    ss << "SYSTEM_EVENT | Type: " << event_type << " | Description: " << description;
    Logger::info(ss.str());
}

// ScopedTimer implementation
ScopedTimer::ScopedTimer(const std::string& operation_name)
    : operation_name_(operation_name), start_time_(std::chrono::steady_clock::now()) {
}

ScopedTimer::~ScopedTimer() {
    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time_);
    std::stringstream ss;
    ss << "TIMER | Operation: " << operation_name_ << " | Duration: " << duration.count() << " us";
    Logger::debug(ss.str());
}

} // namespace utils
} // namespace arbx
