/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "loopvault/oracle/PriceOracle.hpp"

#include "VaultException.hpp"

//-------------------------------------------------------------------------

namespace loopvault::oracle
{

//-------------------------------------------------------------------------

decimal_t requirePrice(
    const PriceOracle& oracle, const AssetId& asset, const PriceRequirements& requirements)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const PriceQuote quote = [&] {
        try {
            return oracle.getPrice(asset);
        }
        catch (const OracleError&) {
            throw;
        }
        catch (const std::exception& exc) {
            throw OracleError{fmt::format(
                "{}: Oracle call for {} failed: {}", ctx, asset, exc.what())};
        }
    }();

    if (!(quote.price > 0_dec)) {
        throw OracleError{fmt::format(
            "{}: Oracle returned non-positive price {} for {}", ctx, quote.price, asset)};
    }
    if (requirements.maxAge > 0) {
        if (quote.updatedAt > requirements.now) {
            throw OracleError{fmt::format(
                "{}: Quote for {} is timestamped in the future ({} > {})",
                ctx, asset, quote.updatedAt, requirements.now)};
        }
        if (requirements.now - quote.updatedAt > requirements.maxAge) {
            throw OracleError{fmt::format(
                "{}: Quote for {} is stale, updated at {} but now is {} (max age {})",
                ctx, asset, quote.updatedAt, requirements.now, requirements.maxAge)};
        }
    }
    return quote.price;
}

//-------------------------------------------------------------------------

}  // namespace loopvault::oracle

//-------------------------------------------------------------------------
