#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace arbx {
namespace utils {

class CryptoUtils {
public:
    // Cryptographically secure random bytes, throws on RNG failure
    static std::vector<uint8_t> generate_random_bytes(size_t length);

    // 16 hex chars, used to correlate log lines and events of one attempt
    static std::string generate_attempt_id();

    // Hash functions
    static std::vector<uint8_t> sha256(const std::vector<uint8_t>& data);
    static std::string sha256_hex(const std::string& data);

    static std::string hex_encode(const std::vector<uint8_t>& data);

    // Timing-safe comparison
    static bool secure_compare(const std::string& a, const std::string& b);

    static long long current_timestamp_ms();
    static long long current_timestamp_sec();

private:
    static std::string get_openssl_error();
};

} // namespace utils
} // namespace arbx
