/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "loopvault/accounting/ShareMath.hpp"

//-------------------------------------------------------------------------

namespace loopvault::accounting
{

//-------------------------------------------------------------------------

decimal_t assetsToShares(
    const SharePool& pool, decimal_t assets, uint32_t shareDecimals, Rounding rounding)
{
    if (pool.totalShares == decimal_t{} || pool.totalAssets == decimal_t{}) {
        return util::round(assets, shareDecimals, rounding);
    }
    return util::mulDiv(assets, pool.totalShares, pool.totalAssets, shareDecimals, rounding);
}

//-------------------------------------------------------------------------

decimal_t sharesToAssets(
    const SharePool& pool, decimal_t shares, uint32_t assetDecimals, Rounding rounding)
{
    if (pool.totalShares == decimal_t{}) {
        return util::round(shares, assetDecimals, rounding);
    }
    return util::mulDiv(shares, pool.totalAssets, pool.totalShares, assetDecimals, rounding);
}

//-------------------------------------------------------------------------

}  // namespace loopvault::accounting

//-------------------------------------------------------------------------
