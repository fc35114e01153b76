#include "utils/address.hpp"
#include "core/exceptions.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <iomanip>

namespace arbx {
namespace address {

const Address ZERO = "0x0000000000000000000000000000000000000000";

bool is_valid(const std::string& value) {
    if (value.size() != 42 || value[0] != '0' || (value[1] != 'x' && value[1] != 'X')) {
        return false;
    }
    return std::all_of(value.begin() + 2, value.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

Address normalize(const std::string& value) {
    if (!is_valid(value)) {
        throw ValidationError("malformed address '" + value + "'");
    }
    Address out = value;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_zero(const Address& value) {
    if (value.empty()) {
        return true;
    }
    if (!is_valid(value)) {
        return false;
    }
    return std::all_of(value.begin() + 2, value.end(), [](char c) { return c == '0'; });
}

std::string shorten(const Address& value) {
    if (value.size() < 12) {
        return value;
    }
    return value.substr(0, 6) + ".." + value.substr(value.size() - 4);
}

Address from_index(unsigned long long index) {
    std::ostringstream ss;
    ss << "0x" << std::hex << std::setw(40) << std::setfill('0') << index;
    return ss.str();
}

} // namespace address
} // namespace arbx
