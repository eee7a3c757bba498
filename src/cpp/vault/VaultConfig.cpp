/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "loopvault/vault/VaultConfig.hpp"

#include "VaultException.hpp"
#include "loopvault/accounting/common.hpp"

//-------------------------------------------------------------------------

namespace loopvault::vault
{

//-------------------------------------------------------------------------

void VaultConfig::validate() const
{
    static constexpr auto ctx = std::source_location::current().function_name();

    auto fail = [](std::string_view message) {
        throw ConfigurationError{fmt::format("{}: {}", ctx, message)};
    };

    if (asset.empty() || borrowAsset.empty()) {
        fail("asset and borrowAsset must be set");
    }
    if (asset == borrowAsset) {
        fail(fmt::format("asset and borrowAsset must differ, both were {}", asset));
    }
    if (symbol.empty()) {
        fail("share symbol must be set");
    }
    if (!(shareDecimals > 0 && shareDecimals <= accounting::kMaxTokenDecimals)) {
        fail(fmt::format(
            "shareDecimals should be in [1,{}], was {}",
            accounting::kMaxTokenDecimals, shareDecimals));
    }
    if (!(0 < lowerBoundLtv && lowerBoundLtv < targetLtv
        && targetLtv < upperBoundLtv && upperBoundLtv < util::kPpmScale)) {
        fail(fmt::format(
            "LTVs must satisfy 0 < lowerBoundLtv ({}) < targetLtv ({}) < upperBoundLtv ({}) < {}",
            lowerBoundLtv, targetLtv, upperBoundLtv, util::kPpmScale));
    }
    if (!(0 < recenteringSpeed && recenteringSpeed < util::kPpmScale)) {
        fail(fmt::format(
            "recenteringSpeed should be in (0,{}), was {}", util::kPpmScale, recenteringSpeed));
    }
    if (rebalanceInterval == 0) {
        fail("rebalanceInterval must be positive");
    }
    if (annualFeeRate >= util::kWadScale) {
        fail(fmt::format(
            "annualFeeRate should be below {}, was {}", util::kWadScale, annualFeeRate));
    }
    if (swapSlippage >= util::kPpmScale) {
        fail(fmt::format(
            "swapSlippage should be below {}, was {}", util::kPpmScale, swapSlippage));
    }
}

//-------------------------------------------------------------------------

VaultConfig VaultConfig::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    auto required = [&](const char* name) {
        pugi::xml_attribute attr = node.attribute(name);
        if (attr.empty()) {
            throw ConfigurationError{fmt::format(
                "{}: Missing required attribute '{}'", ctx, name)};
        }
        return attr;
    };

    VaultConfig config{
        .owner = node.attribute("owner").as_string(),
        .name = node.attribute("name").as_string(),
        .symbol = required("symbol").as_string(),
        .asset = required("asset").as_string(),
        .borrowAsset = required("borrowAsset").as_string(),
        .shareDecimals = node.attribute("shareDecimals").as_uint(util::kDefaultDecimalPlaces),
        .targetLtv = required("targetLtv").as_ullong(),
        .lowerBoundLtv = required("lowerBoundLtv").as_ullong(),
        .upperBoundLtv = required("upperBoundLtv").as_ullong(),
        .recenteringSpeed = required("recenteringSpeed").as_ullong(),
        .rebalanceInterval = required("rebalanceInterval").as_ullong(),
        .annualFeeRate = node.attribute("annualFeeRate").as_ullong(),
        .maxOracleAge = node.attribute("maxOracleAge").as_ullong(),
        .swapSlippage = node.attribute("swapSlippage").as_ullong()
    };
    if (config.name.empty()) {
        config.name = config.symbol;
    }
    config.validate();
    return config;
}

//-------------------------------------------------------------------------

}  // namespace loopvault::vault

//-------------------------------------------------------------------------
