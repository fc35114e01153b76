#include "config_validator.hpp"
#include "address.hpp"
#include <algorithm>
#include <numeric>
#include <set>

namespace arbx {
namespace utils {

ConfigValidator::ValidationErrors ConfigValidator::errors_;

ConfigValidator::ValidationResult ConfigValidator::validate_config(const nlohmann::json& config) {
    clear_errors();

    if (!config.is_object()) {
        add_error("", "Configuration must be a JSON object", config.dump());
        return Result<bool>::error("Configuration is not an object");
    }

    // Validate required top-level sections
    for (const char* section : {"app", "risk", "execution", "deployment"}) {
        if (!config.contains(section)) {
            add_error(section, "Missing required configuration section");
            return Result<bool>::error(std::string("Missing ") + section + " configuration");
        }
    }

    // Validate each section
    auto app_result = validate_app_config(config["app"]);
    if (app_result.is_error()) {
        return app_result;
    }

    if (config.contains("logging")) {
        auto logging_result = validate_logging_config(config["logging"]);
        if (logging_result.is_error()) {
            return logging_result;
        }
    }

    auto risk_result = validate_risk_config(config["risk"]);
    if (risk_result.is_error()) {
        return risk_result;
    }

    auto execution_result = validate_execution_config(config["execution"]);
    if (execution_result.is_error()) {
        return execution_result;
    }

    auto deployment_result = validate_deployment_config(config["deployment"]);
    if (deployment_result.is_error()) {
        return deployment_result;
    }

    if (config.contains("simulation")) {
        auto simulation_result = validate_simulation_config(config["simulation"]);
        if (simulation_result.is_error()) {
            return simulation_result;
        }
    }

    return Result<bool>::success(true);
}

ConfigValidator::ValidationResult ConfigValidator::validate_app_config(const nlohmann::json& app_config) {
    validate_required_field(app_config, "name");
    validate_string_field(app_config, "name", 1, 100);

    validate_required_field(app_config, "version");
    validate_string_field(app_config, "version", 1, 20);

    validate_required_field(app_config, "debug");
    validate_boolean_field(app_config, "debug");

    validate_required_field(app_config, "log_level");
    validate_enum_field(app_config, "log_level", {"TRACE", "DEBUG", "INFO", "WARN", "WARNING", "ERROR", "CRITICAL"});

    return errors_.empty() ? Result<bool>::success(true) :
                           Result<bool>::error("App configuration validation failed");
}

ConfigValidator::ValidationResult ConfigValidator::validate_logging_config(const nlohmann::json& logging_config) {
    for (const char* field : {"file_path", "max_file_size_mb", "max_backup_files", "console_output", "file_output"}) {
        validate_required_field(logging_config, field);
    }
    validate_string_field(logging_config, "file_path", 0, 500);
    validate_numeric_field(logging_config, "max_file_size_mb", 1, 1024);
    validate_numeric_field(logging_config, "max_backup_files", 1, 100);
    validate_boolean_field(logging_config, "console_output");
    validate_boolean_field(logging_config, "file_output");

    return errors_.empty() ? Result<bool>::success(true) :
                           Result<bool>::error("Logging configuration validation failed");
}

ConfigValidator::ValidationResult ConfigValidator::validate_risk_config(const nlohmann::json& risk_config) {
    for (const char* field : {"gas_price_limit", "profit_threshold", "super_profit_threshold",
                              "liquidity_threshold", "is_paused"}) {
        validate_required_field(risk_config, field);
    }
    bool thresholds_ok = validate_positive_field(risk_config, "gas_price_limit");
    thresholds_ok = validate_positive_field(risk_config, "profit_threshold") && thresholds_ok;
    thresholds_ok = validate_positive_field(risk_config, "super_profit_threshold") && thresholds_ok;
    validate_positive_field(risk_config, "liquidity_threshold");
    validate_boolean_field(risk_config, "is_paused");

    if (thresholds_ok && risk_config.contains("profit_threshold") &&
        risk_config.contains("super_profit_threshold")) {
        double profit = risk_config["profit_threshold"].get<double>();
        double super_profit = risk_config["super_profit_threshold"].get<double>();
        if (super_profit < profit) {
            add_error("super_profit_threshold", "Must not be below profit_threshold",
                      std::to_string(super_profit));
        }
    }

    return errors_.empty() ? Result<bool>::success(true) :
                           Result<bool>::error("Risk configuration validation failed");
}

ConfigValidator::ValidationResult ConfigValidator::validate_execution_config(const nlohmann::json& execution_config) {
    for (const char* field : {"max_slippage", "gas_units_per_swap", "max_staleness_sec",
                              "max_future_skew_sec", "max_price_deviation", "default_amount"}) {
        validate_required_field(execution_config, field);
    }
    validate_numeric_field(execution_config, "max_slippage", 0.0, 0.5);
    validate_positive_field(execution_config, "gas_units_per_swap");
    validate_numeric_field(execution_config, "max_staleness_sec", 1, 86400 * 7);
    validate_positive_field(execution_config, "max_future_skew_sec");
    validate_percentage_field(execution_config, "max_price_deviation");

    if (execution_config.contains("default_amount") && validate_positive_field(execution_config, "default_amount")) {
        if (execution_config["default_amount"].get<double>() <= 0.0) {
            add_error("default_amount", "Must be greater than zero", execution_config["default_amount"].dump());
        }
    }

    return errors_.empty() ? Result<bool>::success(true) :
                           Result<bool>::error("Execution configuration validation failed");
}

ConfigValidator::ValidationResult ConfigValidator::validate_deployment_config(const nlohmann::json& deployment_config) {
    for (const char* field : {"owner", "self", "base_token", "stable_token", "monitored_tokens"}) {
        validate_required_field(deployment_config, field);
        if (std::string(field) != "monitored_tokens") {
            validate_address_field(deployment_config, field);
        }
    }

    if (validate_array_field(deployment_config, "monitored_tokens", 1, 256) &&
        deployment_config.contains("monitored_tokens")) {
        std::set<std::string> seen;
        for (const auto& token : deployment_config["monitored_tokens"]) {
            if (!token.is_string() || !address::is_valid(token.get<std::string>()) ||
                address::is_zero(token.get<std::string>())) {
                add_error("monitored_tokens", "Invalid token address", token.dump());
                continue;
            }
            if (!seen.insert(address::normalize(token.get<std::string>())).second) {
                add_error("monitored_tokens", "Duplicate token address", token.get<std::string>());
            }
        }
    }

    return errors_.empty() ? Result<bool>::success(true) :
                           Result<bool>::error("Deployment configuration validation failed");
}

ConfigValidator::ValidationResult ConfigValidator::validate_simulation_config(const nlohmann::json& simulation_config) {
    for (const char* field : {"router", "lending_pool", "gas_oracle"}) {
        validate_required_field(simulation_config, field);
        validate_address_field(simulation_config, field);
    }
    for (const char* field : {"swap_fee", "flash_loan_premium", "gas_price_gwei", "pools",
                              "oracles", "lending_liquidity", "initial_balances"}) {
        validate_required_field(simulation_config, field);
    }
    validate_numeric_field(simulation_config, "swap_fee", 0.0, 0.1);
    validate_numeric_field(simulation_config, "flash_loan_premium", 0.0, 0.1);
    validate_positive_field(simulation_config, "gas_price_gwei");

    if (validate_array_field(simulation_config, "pools") && simulation_config.contains("pools")) {
        for (const auto& pool : simulation_config["pools"]) {
            validate_string_field(pool, "venue", 1, 64);
            validate_address_field(pool, "token_a");
            validate_address_field(pool, "token_b");
            validate_numeric_field(pool, "reserve_a", 0.0);
            validate_numeric_field(pool, "reserve_b", 0.0);
            for (const char* field : {"venue", "token_a", "token_b", "reserve_a", "reserve_b"}) {
                validate_required_field(pool, field);
            }
        }
    }

    if (validate_array_field(simulation_config, "oracles", 1, 16) && simulation_config.contains("oracles")) {
        for (const auto& oracle : simulation_config["oracles"]) {
            validate_required_field(oracle, "address");
            validate_address_field(oracle, "address");
            validate_required_field(oracle, "prices");
            validate_address_map(oracle, "prices", true);
            validate_required_field(oracle, "age_sec");
            validate_positive_field(oracle, "age_sec");
        }
    }

    validate_address_map(simulation_config, "lending_liquidity", false);
    validate_address_map(simulation_config, "initial_balances", false);

    return errors_.empty() ? Result<bool>::success(true) :
                           Result<bool>::error("Simulation configuration validation failed");
}

bool ConfigValidator::validate_required_field(const nlohmann::json& config, const std::string& field) {
    if (!config.contains(field)) {
        add_error(field, "Required field is missing");
        return false;
    }
    return true;
}

bool ConfigValidator::validate_string_field(const nlohmann::json& config, const std::string& field,
                                            size_t min_length, size_t max_length) {
    if (!config.contains(field)) return true;

    if (!config[field].is_string()) {
        add_error(field, "Field must be a string", config[field].dump());
        return false;
    }

    std::string value = config[field].get<std::string>();
    if (value.length() < min_length) {
        add_error(field, "String too short (min: " + std::to_string(min_length) + ")", value);
        return false;
    }

    if (value.length() > max_length) {
        add_error(field, "String too long (max: " + std::to_string(max_length) + ")", value);
        return false;
    }

    return true;
}

bool ConfigValidator::validate_numeric_field(const nlohmann::json& config, const std::string& field,
                                             double min_value, double max_value) {
    if (!config.contains(field)) return true;

    if (!config[field].is_number()) {
        add_error(field, "Field must be a number", config[field].dump());
        return false;
    }

    double value = config[field].get<double>();
    if (value < min_value) {
        add_error(field, "Value too small (min: " + std::to_string(min_value) + ")",
                  std::to_string(value));
        return false;
    }

    if (value > max_value) {
        add_error(field, "Value too large (max: " + std::to_string(max_value) + ")",
                  std::to_string(value));
        return false;
    }

    return true;
}

bool ConfigValidator::validate_boolean_field(const nlohmann::json& config, const std::string& field) {
    if (!config.contains(field)) return true;

    if (!config[field].is_boolean()) {
        add_error(field, "Field must be a boolean", config[field].dump());
        return false;
    }

    return true;
}

bool ConfigValidator::validate_array_field(const nlohmann::json& config, const std::string& field,
                                           size_t min_size, size_t max_size) {
    if (!config.contains(field)) return true;

    if (!config[field].is_array()) {
        add_error(field, "Field must be an array", config[field].dump());
        return false;
    }

    size_t size = config[field].size();
    if (size < min_size) {
        add_error(field, "Array too small (min: " + std::to_string(min_size) + ")",
                  std::to_string(size));
        return false;
    }

    if (size > max_size) {
        add_error(field, "Array too large (max: " + std::to_string(max_size) + ")",
                  std::to_string(size));
        return false;
    }

    return true;
}

bool ConfigValidator::validate_enum_field(const nlohmann::json& config, const std::string& field,
                                          const std::vector<std::string>& valid_values) {
    if (!config.contains(field)) return true;

    if (!config[field].is_string()) {
        add_error(field, "Field must be a string", config[field].dump());
        return false;
    }

    std::string value = config[field].get<std::string>();
    if (std::find(valid_values.begin(), valid_values.end(), value) == valid_values.end()) {
        add_error(field, "Invalid value. Must be one of: " +
                  std::accumulate(valid_values.begin(), valid_values.end(), std::string(),
                                  [](const std::string& a, const std::string& b) {
                                      return a.empty() ? b : a + ", " + b;
                                  }), value);
        return false;
    }

    return true;
}

bool ConfigValidator::validate_percentage_field(const nlohmann::json& config, const std::string& field) {
    return validate_numeric_field(config, field, 0.0, 1.0);
}

bool ConfigValidator::validate_positive_field(const nlohmann::json& config, const std::string& field) {
    return validate_numeric_field(config, field, 0.0, std::numeric_limits<double>::infinity());
}

bool ConfigValidator::validate_address_field(const nlohmann::json& config, const std::string& field,
                                             bool allow_zero) {
    if (!config.contains(field)) return true;

    if (!config[field].is_string()) {
        add_error(field, "Address must be a string", config[field].dump());
        return false;
    }

    std::string value = config[field].get<std::string>();
    if (!address::is_valid(value)) {
        add_error(field, "Invalid address format (expected 0x + 40 hex digits)", value);
        return false;
    }

    if (!allow_zero && address::is_zero(value)) {
        add_error(field, "Address must not be the zero address", value);
        return false;
    }

    return true;
}

bool ConfigValidator::validate_address_map(const nlohmann::json& config, const std::string& field,
                                           bool require_positive) {
    if (!config.contains(field)) return true;

    if (!config[field].is_object()) {
        add_error(field, "Field must be an object keyed by address", config[field].dump());
        return false;
    }

    bool ok = true;
    for (const auto& [key, value] : config[field].items()) {
        if (!address::is_valid(key) || address::is_zero(key)) {
            add_error(field, "Invalid address key", key);
            ok = false;
        } else if (!value.is_number() || value.get<double>() < 0.0 ||
                   (require_positive && value.get<double>() <= 0.0)) {
            add_error(field + "." + key, "Amount must be a non-negative number", value.dump());
            ok = false;
        }
    }
    return ok;
}

void ConfigValidator::add_error(const std::string& field, const std::string& message,
                                const std::string& value) {
    errors_.push_back({field, message, value});
}

} // namespace utils
} // namespace arbx
