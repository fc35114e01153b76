#include <iostream>
#include <memory>
#include <string>
#include <csignal>
#include <thread>
#include <chrono>

#include <nlohmann/json.hpp>

#include "utils/config_manager.hpp"
#include "utils/logger.hpp"
#include "core/app_state.hpp"
#include "core/arbitrage_engine.hpp"
#include "core/cli_options.hpp"
#include "core/engine_setup.hpp"
#include "core/exceptions.hpp"
#include "venue/simulated_market.hpp"

// Global application state
arbx::AppState app_state;

// Signal handler for graceful shutdown
void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        app_state.shutdown();
    }
}

namespace {

void print_report(const arbx::ExecutionReport& report) {
    nlohmann::json out = {
        {"attempt_id", report.attempt_id},
        {"strategy", arbx::to_string(report.strategy)},
        {"state", arbx::to_string(report.final_state)},
        {"success", report.success},
        {"failure", arbx::to_string(report.failure)},
        {"reason", report.reason},
        {"realized_profit", report.realized_profit},
        {"super_profit_converted", report.super_profit_converted}
    };
    if (report.opportunity) {
        out["opportunity"] = *report.opportunity;
    }
    std::cout << out.dump() << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    // Register signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    arbx::CliOptions options;
    if (!arbx::parse_cli_args(argc, argv, options)) {
        std::cerr << arbx::cli_usage() << std::endl;
        return 2;
    }

    // Console logging until the configured sinks are known
    arbx::utils::Logger::initialize("", arbx::utils::LogLevel::INFO);

    // Load configuration
    arbx::utils::ConfigManager config_manager;
    if (!config_manager.load(options.config_path)) {
        arbx::utils::Logger::error("Failed to load configuration. Exiting.");
        return 1;
    }
    if (!config_manager.has_simulation()) {
        arbx::utils::Logger::error("Configuration has no simulation section. Exiting.");
        return 1;
    }

    // Initialize logger
    const auto& logging = config_manager.get_logging_config();
    arbx::utils::LogLevel level = arbx::utils::parse_log_level(config_manager.get_app_config().log_level);
    if (config_manager.get_app_config().debug) {
        level = arbx::utils::LogLevel::DEBUG;
    }
    arbx::utils::Logger::initialize(logging.file_output ? logging.file_path : "", level,
                                    static_cast<size_t>(logging.max_file_size_mb) * 1024 * 1024,
                                    static_cast<size_t>(logging.max_backup_files),
                                    logging.console_output);
    arbx::utils::Logger::info("Starting {} {}...", config_manager.get_app_config().name,
                              config_manager.get_app_config().version);

    const double amount = options.amount.value_or(config_manager.get_execution_config().default_amount);

    try {
        auto market = arbx::venue::build_simulated_market(config_manager.get_simulation_config());
        arbx::ArbitrageEngine engine(arbx::make_engine_setup(config_manager, market));

        const arbx::Address& owner = engine.owner();
        for (const auto& [token, balance] : config_manager.get_simulation_config().initial_balances) {
            engine.deposit(owner, token, balance);
        }

        for (int i = 0; i < options.repeat && app_state.is_running(); ++i) {
            arbx::ExecutionReport report = options.strategy == arbx::Strategy::DIRECT
                ? engine.trigger_direct(owner, amount)
                : engine.trigger_flashloan(owner, amount);
            app_state.add_report(report);
            print_report(report);

            if (i + 1 < options.repeat) {
                std::this_thread::sleep_for(std::chrono::milliseconds(500));
            }
        }

        arbx::utils::Logger::info("Finished: {} settled, {} failed, total profit {}",
                                  app_state.settled_count(), app_state.failed_count(), engine.total_profit());
    } catch (const arbx::ConfigurationError& e) {
        arbx::utils::Logger::critical(e.what());
        return 1;
    } catch (const arbx::ArbxException& e) {
        arbx::utils::Logger::error(e.what());
        return 1;
    }

    arbx::utils::Logger::shutdown();
    return 0;
}
