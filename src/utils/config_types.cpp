#include "config_types.hpp"
#include <cstdlib>

namespace arbx {
namespace utils {

std::string get_env_var(const std::string& key) {
    const char* val = std::getenv(key.c_str());
    return val == nullptr ? std::string("") : std::string(val);
}

} // namespace utils
} // namespace arbx
