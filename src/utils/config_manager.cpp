#include "config_manager.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include "config_validator.hpp"
#include "logger.hpp"

namespace arbx {
namespace utils {

bool ConfigManager::load(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        last_error_ = "Failed to open config file: " + file_path;
        Logger::error(last_error_);
        return false;
    }
    try {
        file >> config_data_;
    } catch (const nlohmann::json::exception& e) {
        last_error_ = "Error parsing config file: " + std::string(e.what());
        Logger::error(last_error_);
        return false;
    }
    return apply(config_data_);
}

bool ConfigManager::load_from_string(const std::string& content) {
    try {
        config_data_ = nlohmann::json::parse(content);
    } catch (const nlohmann::json::exception& e) {
        last_error_ = "Error parsing config: " + std::string(e.what());
        Logger::error(last_error_);
        return false;
    }
    return apply(config_data_);
}

bool ConfigManager::apply(const nlohmann::json& config) {
    auto validation = ConfigValidator::validate_config(config);
    if (validation.is_error()) {
        last_error_ = validation.error();
        for (const auto& error : ConfigValidator::get_errors()) {
            Logger::error("Config field '{}': {} ({})", error.field, error.message, error.value);
        }
        return false;
    }

    try {
        config["app"].get_to(app_config_);
        config["risk"].get_to(risk_config_);
        config["execution"].get_to(execution_config_);
        config["deployment"].get_to(deployment_config_);
        if (config.contains("logging")) {
            config["logging"].get_to(logging_config_);
        }
        has_simulation_ = config.contains("simulation");
        if (has_simulation_) {
            config["simulation"].get_to(simulation_config_);
        }
    } catch (const nlohmann::json::exception& e) {
        last_error_ = "Error reading config: " + std::string(e.what());
        Logger::error(last_error_);
        return false;
    }

    apply_env_overrides();
    last_error_.clear();
    return true;
}

void ConfigManager::apply_env_overrides() {
    std::string level = get_env_var("ARBX_LOG_LEVEL");
    if (!level.empty()) {
        app_config_.log_level = level;
    }
}

AppConfig& ConfigManager::get_app_config() {
    return app_config_;
}

LoggingConfig& ConfigManager::get_logging_config() {
    return logging_config_;
}

RiskConfig& ConfigManager::get_risk_config() {
    return risk_config_;
}

ExecutionConfig& ConfigManager::get_execution_config() {
    return execution_config_;
}

DeploymentConfig& ConfigManager::get_deployment_config() {
    return deployment_config_;
}

SimulationConfig& ConfigManager::get_simulation_config() {
    return simulation_config_;
}

} // namespace utils
} // namespace arbx
