#include "cli_options.hpp"
#include <cmath>
#include <stdexcept>
#include <vector>

namespace arbx {

namespace {

bool parse_amount(const std::string& text, double& amount) {
    size_t consumed = 0;
    try {
        amount = std::stod(text, &consumed);
    } catch (const std::exception&) {
        return false;
    }
    return consumed == text.size() && std::isfinite(amount) && amount > 0.0;
}

} // namespace

bool parse_cli_args(int argc, const char* const argv[], CliOptions& options) {
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--repeat") {
            if (i + 1 >= argc) {
                return false;
            }
            try {
                options.repeat = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                return false;
            }
            if (options.repeat < 1) {
                return false;
            }
        } else if (arg == "-h" || arg == "--help") {
            return false;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() > 3) {
        return false;
    }
    if (!positional.empty()) {
        options.config_path = positional[0];
    }
    if (positional.size() > 1) {
        if (positional[1] == "direct") {
            options.strategy = Strategy::DIRECT;
        } else if (positional[1] == "flash" || positional[1] == "flashloan") {
            options.strategy = Strategy::FLASH_LOAN;
        } else {
            return false;
        }
    }
    if (positional.size() > 2) {
        double amount = 0.0;
        if (!parse_amount(positional[2], amount)) {
            return false;
        }
        options.amount = amount;
    }
    return true;
}

const char* cli_usage() {
    return "usage: arbx [config.json] [direct|flash] [amount] [--repeat N]";
}

} // namespace arbx
