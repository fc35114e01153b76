#pragma once

#include <string>

namespace arbx {

// 20-byte account / token identifier, "0x" + 40 lower-case hex characters
using Address = std::string;

namespace address {

extern const Address ZERO;

bool is_valid(const std::string& value);

// Lower-cases and validates; throws ValidationError on malformed input
Address normalize(const std::string& value);

// Empty strings count as the null identifier as well
bool is_zero(const Address& value);

// "0x1234..abcd" for log lines
std::string shorten(const Address& value);

// Deterministic address for fixtures and the simulated market
Address from_index(unsigned long long index);

} // namespace address
} // namespace arbx
