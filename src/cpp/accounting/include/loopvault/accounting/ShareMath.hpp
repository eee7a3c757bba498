/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "loopvault/decimal/decimal.hpp"

//-------------------------------------------------------------------------

namespace loopvault::accounting
{

//-------------------------------------------------------------------------

// Proportional conversion between a pool's assets and the shares issued
// against it. An empty pool converts one to one. Callers guard the case of
// outstanding shares with no backing assets.
struct SharePool
{
    decimal_t totalAssets;
    decimal_t totalShares;
};

[[nodiscard]] decimal_t assetsToShares(
    const SharePool& pool, decimal_t assets, uint32_t shareDecimals, Rounding rounding);

[[nodiscard]] decimal_t sharesToAssets(
    const SharePool& pool, decimal_t shares, uint32_t assetDecimals, Rounding rounding);

//-------------------------------------------------------------------------

}  // namespace loopvault::accounting

//-------------------------------------------------------------------------
