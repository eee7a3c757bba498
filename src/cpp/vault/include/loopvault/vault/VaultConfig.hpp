/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

//-------------------------------------------------------------------------

namespace loopvault::vault
{

//-------------------------------------------------------------------------

// Ratios are in ppm, annualFeeRate in parts per 1e18, durations in seconds.
struct VaultConfig
{
    AccountId owner;
    std::string name;
    std::string symbol;
    AssetId asset;
    AssetId borrowAsset;
    uint32_t shareDecimals{util::kDefaultDecimalPlaces};
    uint64_t targetLtv;
    uint64_t lowerBoundLtv;
    uint64_t upperBoundLtv;
    uint64_t recenteringSpeed;
    Timestamp rebalanceInterval;
    uint64_t annualFeeRate{};
    Timestamp maxOracleAge{};
    uint64_t swapSlippage{};

    // Throws ConfigurationError on the first violated constraint.
    void validate() const;

    [[nodiscard]] decimal_t targetLtvRatio() const { return util::ppm2ratio(targetLtv); }
    [[nodiscard]] decimal_t lowerBoundLtvRatio() const { return util::ppm2ratio(lowerBoundLtv); }
    [[nodiscard]] decimal_t upperBoundLtvRatio() const { return util::ppm2ratio(upperBoundLtv); }
    [[nodiscard]] decimal_t recenteringSpeedRatio() const
    {
        return util::ppm2ratio(recenteringSpeed);
    }
    [[nodiscard]] decimal_t annualFeeRateRatio() const { return util::wad2ratio(annualFeeRate); }
    [[nodiscard]] decimal_t swapSlippageRatio() const { return util::ppm2ratio(swapSlippage); }

    [[nodiscard]] static VaultConfig fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

}  // namespace loopvault::vault

//-------------------------------------------------------------------------
