#pragma once

#include <optional>
#include <string>
#include "types.hpp"

namespace arbx {

struct CliOptions {
    std::string config_path = "config/settings.json";
    Strategy strategy = Strategy::DIRECT;
    std::optional<double> amount;  // unset means execution.default_amount
    int repeat = 1;
};

// arbx [config.json] [direct|flash] [amount] [--repeat N]
// False on help, unknown strategy, a repeat below one, or an amount that is
// not a finite positive number.
bool parse_cli_args(int argc, const char* const argv[], CliOptions& options);

const char* cli_usage();

} // namespace arbx
