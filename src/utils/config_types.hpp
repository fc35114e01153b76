#pragma once

#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>

namespace arbx {
namespace utils {

std::string get_env_var(const std::string& key);

struct AppConfig {
    std::string name;
    std::string version;
    bool debug = false;
    std::string log_level = "INFO";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(AppConfig, name, version, debug, log_level)

struct LoggingConfig {
    std::string file_path = "logs/arbx.log";
    int max_file_size_mb = 10;
    int max_backup_files = 3;
    bool console_output = true;
    bool file_output = true;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(LoggingConfig, file_path, max_file_size_mb, max_backup_files, console_output, file_output)

struct ExecutionConfig {
    double max_slippage = 0.005;
    double gas_units_per_swap = 150000.0;
    long long max_staleness_sec = 3600;
    long long max_future_skew_sec = 300;
    double max_price_deviation = 0.0;
    double default_amount = 100.0;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ExecutionConfig, max_slippage, gas_units_per_swap, max_staleness_sec, max_future_skew_sec, max_price_deviation, default_amount)

struct DeploymentConfig {
    std::string owner;
    std::string self;
    std::string base_token;
    std::string stable_token;
    std::vector<std::string> monitored_tokens;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(DeploymentConfig, owner, self, base_token, stable_token, monitored_tokens)

// One constant-product pool on one venue
struct SimPoolConfig {
    std::string venue;
    std::string token_a;
    std::string token_b;
    double reserve_a = 0.0;
    double reserve_b = 0.0;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(SimPoolConfig, venue, token_a, token_b, reserve_a, reserve_b)

struct SimOracleConfig {
    std::string address;
    std::map<std::string, double> prices;  // token address -> quote price
    long long age_sec = 0;                 // reported staleness of every reading
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(SimOracleConfig, address, prices, age_sec)

struct SimulationConfig {
    std::string router;
    std::string lending_pool;
    std::string gas_oracle;
    double swap_fee = 0.003;
    double flash_loan_premium = 0.0009;
    double gas_price_gwei = 30.0;
    std::vector<SimPoolConfig> pools;
    std::vector<SimOracleConfig> oracles;
    std::map<std::string, double> lending_liquidity;  // token address -> lendable amount
    std::map<std::string, double> initial_balances;   // deposited into the executor at start
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(SimulationConfig, router, lending_pool, gas_oracle, swap_fee, flash_loan_premium, gas_price_gwei, pools, oracles, lending_liquidity, initial_balances)

} // namespace utils
} // namespace arbx
