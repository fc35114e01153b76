#include "utils/crypto_utils.hpp"
#include "utils/logger.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <openssl/crypto.h>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <chrono>
#include <memory>
#include <stdexcept>

namespace arbx {
namespace utils {

std::string CryptoUtils::get_openssl_error() {
    std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new(BIO_s_mem()), &BIO_free);
    if (!bio) {
        return "unknown OpenSSL error";
    }
    ERR_print_errors(bio.get());
    char* buf = nullptr;
    long len = BIO_get_mem_data(bio.get(), &buf);
    if (len <= 0 || buf == nullptr) {
        return "unknown OpenSSL error";
    }
    return std::string(buf, static_cast<size_t>(len));
}

std::vector<uint8_t> CryptoUtils::generate_random_bytes(size_t length) {
    std::vector<uint8_t> bytes(length);
    if (length == 0) {
        return bytes;
    }
    if (RAND_bytes(bytes.data(), static_cast<int>(length)) != 1) {
        std::string error = get_openssl_error();
        Logger::error("Failed to generate random bytes: {}", error);
        throw std::runtime_error("RAND_bytes failed: " + error);
    }
    return bytes;
}

std::string CryptoUtils::generate_attempt_id() {
    return hex_encode(generate_random_bytes(8));
}

std::vector<uint8_t> CryptoUtils::sha256(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> digest(SHA256_DIGEST_LENGTH);
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &len, EVP_sha256(), nullptr) != 1) {
        std::string error = get_openssl_error();
        Logger::error("SHA-256 failed: {}", error);
        throw std::runtime_error("EVP_Digest failed: " + error);
    }
    digest.resize(len);
    return digest;
}

std::string CryptoUtils::sha256_hex(const std::string& data) {
    return hex_encode(sha256(std::vector<uint8_t>(data.begin(), data.end())));
}

std::string CryptoUtils::hex_encode(const std::vector<uint8_t>& data) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t byte : data) {
        out.push_back(digits[byte >> 4]);
        out.push_back(digits[byte & 0x0F]);
    }
    return out;
}

bool CryptoUtils::secure_compare(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

long long CryptoUtils::current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

long long CryptoUtils::current_timestamp_sec() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace utils
} // namespace arbx
