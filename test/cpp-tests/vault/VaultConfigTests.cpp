/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "formatting.hpp"
#include "loopvault/vault/VaultConfig.hpp"

#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace loopvault;
using namespace loopvault::vault;
using namespace loopvault::literals;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

constexpr const char* kVaultXml = R"(
<Vault owner="deployer" symbol="lvWETH" asset="WETH" borrowAsset="USDC"
       targetLtv="600000" lowerBoundLtv="500000" upperBoundLtv="700000"
       recenteringSpeed="200000" rebalanceInterval="86400"
       annualFeeRate="20000000000000000" swapSlippage="5000"/>
)";

VaultConfig validConfig()
{
    pugi::xml_document doc;
    if (!doc.load_string(kVaultXml)) {
        throw std::runtime_error{"Failed to parse vault config"};
    }
    return VaultConfig::fromXML(doc.child("Vault"));
}

}  // namespace

//-------------------------------------------------------------------------

TEST(VaultConfigTest, FromXML)
{
    const auto config = validConfig();
    EXPECT_EQ(config.owner, "deployer");
    EXPECT_EQ(config.name, "lvWETH");
    EXPECT_EQ(config.shareDecimals, 8u);
    EXPECT_EQ(config.targetLtvRatio(), DEC(0.6));
    EXPECT_EQ(config.lowerBoundLtvRatio(), DEC(0.5));
    EXPECT_EQ(config.upperBoundLtvRatio(), DEC(0.7));
    EXPECT_EQ(config.recenteringSpeedRatio(), DEC(0.2));
    EXPECT_EQ(config.rebalanceInterval, kSecondsPerDay);
    EXPECT_EQ(config.annualFeeRateRatio(), DEC(0.02));
    EXPECT_EQ(config.swapSlippageRatio(), DEC(0.005));
    EXPECT_EQ(config.maxOracleAge, 0u);
}

TEST(VaultConfigTest, MissingRequiredAttribute)
{
    pugi::xml_document doc;
    ASSERT_TRUE(doc.load_string(
        R"(<Vault symbol="lvWETH" asset="WETH" borrowAsset="USDC" targetLtv="600000"/>)"));
    EXPECT_THROW((void)VaultConfig::fromXML(doc.child("Vault")), ConfigurationError);
}

//-------------------------------------------------------------------------

struct InvalidConfigTestParams
{
    const char* description;
    std::function<void(VaultConfig&)> mutate;
};

void PrintTo(const InvalidConfigTestParams& params, std::ostream* os)
{
    *os << params.description;
}

struct InvalidConfigTest : TestWithParam<InvalidConfigTestParams> {};

TEST_P(InvalidConfigTest, IsRejected)
{
    auto config = validConfig();
    GetParam().mutate(config);
    EXPECT_THROW(config.validate(), ConfigurationError);
}

INSTANTIATE_TEST_SUITE_P(
    VaultConfigTests,
    InvalidConfigTest,
    Values(
        InvalidConfigTestParams{
            "lower bound at target", [](VaultConfig& c) { c.lowerBoundLtv = c.targetLtv; }},
        InvalidConfigTestParams{
            "upper bound at target", [](VaultConfig& c) { c.upperBoundLtv = c.targetLtv; }},
        InvalidConfigTestParams{"zero lower bound", [](VaultConfig& c) { c.lowerBoundLtv = 0; }},
        InvalidConfigTestParams{
            "upper bound at one", [](VaultConfig& c) { c.upperBoundLtv = 1'000'000; }},
        InvalidConfigTestParams{"zero speed", [](VaultConfig& c) { c.recenteringSpeed = 0; }},
        InvalidConfigTestParams{
            "full speed", [](VaultConfig& c) { c.recenteringSpeed = 1'000'000; }},
        InvalidConfigTestParams{"zero interval", [](VaultConfig& c) { c.rebalanceInterval = 0; }},
        InvalidConfigTestParams{
            "fee of 100%",
            [](VaultConfig& c) { c.annualFeeRate = 1'000'000'000'000'000'000ull; }},
        InvalidConfigTestParams{
            "slippage of 100%", [](VaultConfig& c) { c.swapSlippage = 1'000'000; }},
        InvalidConfigTestParams{"same assets", [](VaultConfig& c) { c.borrowAsset = c.asset; }},
        InvalidConfigTestParams{"no symbol", [](VaultConfig& c) { c.symbol.clear(); }},
        InvalidConfigTestParams{"share decimals", [](VaultConfig& c) { c.shareDecimals = 9; }}
    ));

//-------------------------------------------------------------------------
