/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

//-------------------------------------------------------------------------

namespace loopvault::oracle
{

//-------------------------------------------------------------------------

struct PriceQuote
{
    decimal_t price;
    Timestamp updatedAt;
};

//-------------------------------------------------------------------------

// Reference units per unit of an asset. Implementations may throw for
// assets they do not price.
class PriceOracle
{
public:
    virtual ~PriceOracle() noexcept = default;

    [[nodiscard]] virtual PriceQuote getPrice(const AssetId& asset) const = 0;
};

//-------------------------------------------------------------------------

struct PriceRequirements
{
    Timestamp now;
    Timestamp maxAge{};
};

// Returns a strictly positive, fresh price or throws OracleError.
// A maxAge of zero disables the staleness check.
[[nodiscard]] decimal_t requirePrice(
    const PriceOracle& oracle, const AssetId& asset, const PriceRequirements& requirements);

//-------------------------------------------------------------------------

}  // namespace loopvault::oracle

//-------------------------------------------------------------------------
