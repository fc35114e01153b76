#include <gtest/gtest.h>
#include <set>
#include "utils/crypto_utils.hpp"
#include "utils/address.hpp"
#include "utils/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "core/exceptions.hpp"

using arbx::utils::CryptoUtils;

TEST(CryptoUtilsTest, Sha256KnownVector) {
    EXPECT_EQ(CryptoUtils::sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(CryptoUtils::sha256_hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(CryptoUtilsTest, AttemptIdsAreHexAndDistinct) {
    std::set<std::string> ids;
    for (int i = 0; i < 64; ++i) {
        std::string id = CryptoUtils::generate_attempt_id();
        ASSERT_EQ(id.size(), 16u);
        EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 64u);
}

TEST(CryptoUtilsTest, SecureCompare) {
    EXPECT_TRUE(CryptoUtils::secure_compare("digest", "digest"));
    EXPECT_FALSE(CryptoUtils::secure_compare("digest", "digesT"));
    EXPECT_FALSE(CryptoUtils::secure_compare("digest", "diges"));
}

TEST(CryptoUtilsTest, HexEncode) {
    EXPECT_EQ(CryptoUtils::hex_encode({0x00, 0x0f, 0xa5, 0xff}), "000fa5ff");
}

TEST(AddressTest, ValidatesAndNormalizes) {
    EXPECT_TRUE(arbx::address::is_valid("0xA0b86991c6218b36c1d19D4a2e9Eb0cE3606eB48"));
    EXPECT_FALSE(arbx::address::is_valid("0xA0b86991"));
    EXPECT_FALSE(arbx::address::is_valid("A0b86991c6218b36c1d19D4a2e9Eb0cE3606eB4800"));
    EXPECT_FALSE(arbx::address::is_valid("0xg0b86991c6218b36c1d19d4a2e9eb0ce3606eb48"));

    EXPECT_EQ(arbx::address::normalize("0xA0b86991c6218b36c1d19D4a2e9Eb0cE3606eB48"),
              "0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48");
    EXPECT_THROW(arbx::address::normalize("0x12"), arbx::ValidationError);
}

TEST(AddressTest, ZeroAndHelpers) {
    EXPECT_TRUE(arbx::address::is_zero(arbx::address::ZERO));
    EXPECT_TRUE(arbx::address::is_zero(""));
    EXPECT_FALSE(arbx::address::is_zero(arbx::address::from_index(1)));

    EXPECT_EQ(arbx::address::from_index(0xa1), "0x00000000000000000000000000000000000000a1");
    EXPECT_EQ(arbx::address::shorten("0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48"), "0xa0b8..eb48");
}

TEST(LoggerTest, ParsesLevels) {
    using arbx::utils::LogLevel;
    EXPECT_EQ(arbx::utils::parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(arbx::utils::parse_log_level("WARNING"), LogLevel::WARN);
    EXPECT_EQ(arbx::utils::parse_log_level("Critical"), LogLevel::CRITICAL);
    EXPECT_EQ(arbx::utils::parse_log_level("verbose", LogLevel::ERROR), LogLevel::ERROR);
}

TEST(ResultTest, CarriesValueOrError) {
    auto ok = arbx::Result<int>::success(42);
    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_EQ(ok.value(), 42);
    EXPECT_EQ(ok.map([](int v) { return v * 2; }).value(), 84);

    auto failed = arbx::Result<int>::error("boom");
    EXPECT_FALSE(static_cast<bool>(failed));
    EXPECT_EQ(failed.error(), "boom");
    EXPECT_EQ(failed.value_or(7), 7);
    EXPECT_TRUE(failed.map([](int v) { return v * 2; }).is_error());
}

TEST(TypesTest, FlashLoanRequestShape) {
    arbx::FlashLoanRequest request;
    EXPECT_FALSE(request.is_well_formed());

    request.assets = {arbx::address::from_index(0xa1)};
    request.amounts = {10.0};
    request.modes = {0};
    EXPECT_TRUE(request.is_well_formed());

    request.modes = {1};
    EXPECT_FALSE(request.is_well_formed());

    request.modes = {0};
    request.amounts = {0.0};
    EXPECT_FALSE(request.is_well_formed());
}

TEST(TypesTest, EnumNames) {
    EXPECT_STREQ(arbx::to_string(arbx::ExecutionState::SETTLED), "Settled");
    EXPECT_STREQ(arbx::to_string(arbx::Strategy::FLASH_LOAN), "flashloan");
    EXPECT_STREQ(arbx::to_string(arbx::FailureKind::NO_OPPORTUNITY), "no_opportunity");
}
