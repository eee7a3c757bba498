/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

//-------------------------------------------------------------------------

namespace loopvault::yield
{

//-------------------------------------------------------------------------

// A proportional-share vault over a single underlying asset.
class YieldTarget
{
public:
    virtual ~YieldTarget() noexcept = default;

    [[nodiscard]] virtual const AssetId& asset() const noexcept = 0;

    // Returns the shares minted.
    virtual decimal_t deposit(
        const AccountId& caller, decimal_t assets, const AccountId& receiver) = 0;
    // Returns the shares burned.
    virtual decimal_t withdraw(
        const AccountId& caller,
        decimal_t assets,
        const AccountId& receiver,
        const AccountId& owner) = 0;
    // Returns the assets paid out.
    virtual decimal_t redeem(
        const AccountId& caller,
        decimal_t shares,
        const AccountId& receiver,
        const AccountId& owner) = 0;

    [[nodiscard]] virtual decimal_t balanceOf(const AccountId& account) const = 0;
    [[nodiscard]] virtual decimal_t convertToAssets(decimal_t shares) const = 0;
    [[nodiscard]] virtual decimal_t convertToShares(decimal_t assets) const = 0;
    [[nodiscard]] virtual decimal_t maxWithdraw(const AccountId& owner) const = 0;
};

//-------------------------------------------------------------------------

}  // namespace loopvault::yield

//-------------------------------------------------------------------------
