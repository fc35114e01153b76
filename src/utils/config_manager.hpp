#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "config_types.hpp"
#include "core/types.hpp"

namespace arbx {
namespace utils {

class ConfigManager {
public:
    // Parses and validates; on failure logs every field error and returns false
    bool load(const std::string& file_path);
    bool load_from_string(const std::string& content);

    const std::string& last_error() const { return last_error_; }
    bool has_simulation() const { return has_simulation_; }

    AppConfig& get_app_config();
    LoggingConfig& get_logging_config();
    RiskConfig& get_risk_config();
    ExecutionConfig& get_execution_config();
    DeploymentConfig& get_deployment_config();
    SimulationConfig& get_simulation_config();

private:
    bool apply(const nlohmann::json& config);
    void apply_env_overrides();

    nlohmann::json config_data_; // Keep for initial parsing
    std::string last_error_;
    bool has_simulation_ = false;
    AppConfig app_config_;
    LoggingConfig logging_config_;
    RiskConfig risk_config_;
    ExecutionConfig execution_config_;
    DeploymentConfig deployment_config_;
    SimulationConfig simulation_config_;
};

} // namespace utils
} // namespace arbx
