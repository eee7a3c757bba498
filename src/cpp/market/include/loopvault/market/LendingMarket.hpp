/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

//-------------------------------------------------------------------------

namespace loopvault::market
{

//-------------------------------------------------------------------------

// Values in the reference unit.
struct AccountPosition
{
    decimal_t collateralValue{};
    decimal_t debtValue{};
};

struct ReserveStatus
{
    bool isActive{};
    bool isCollateralEligible{};
    bool isBorrowable{};
    decimal_t maxLtv{};
};

//-------------------------------------------------------------------------

class LendingMarket
{
public:
    virtual ~LendingMarket() noexcept = default;

    virtual void supply(const AccountId& account, const AssetId& asset, decimal_t amount) = 0;
    virtual decimal_t withdraw(
        const AccountId& account, const AssetId& asset, decimal_t amount, const AccountId& to) = 0;
    virtual void borrow(
        const AccountId& account, const AssetId& asset, decimal_t amount, const AccountId& to) = 0;
    virtual decimal_t repay(const AccountId& account, const AssetId& asset, decimal_t amount) = 0;

    [[nodiscard]] virtual AccountPosition getAccountPosition(const AccountId& account) const = 0;
    [[nodiscard]] virtual ReserveStatus getReserveStatus(const AssetId& asset) const = 0;

    // Balance of the interest-bearing collateral receipt.
    [[nodiscard]] virtual decimal_t collateralBalanceOf(
        const AssetId& asset, const AccountId& account) const = 0;
    [[nodiscard]] virtual decimal_t debtBalanceOf(
        const AssetId& asset, const AccountId& account) const = 0;
};

//-------------------------------------------------------------------------

}  // namespace loopvault::market

//-------------------------------------------------------------------------
