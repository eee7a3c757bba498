/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "loopvault/accounting/Ledger.hpp"
#include "loopvault/accounting/ShareMath.hpp"
#include "loopvault/market/LendingMarket.hpp"

//-------------------------------------------------------------------------

namespace loopvault::vault
{

//-------------------------------------------------------------------------

struct AccountingEngineDesc
{
    AccountId self;
    accounting::LedgerDesc shares;
    accounting::Ledger* asset;
    market::LendingMarket* market;
};

//-------------------------------------------------------------------------

// Issues shares against the vault's collateral in the lending market.
// Deposits pull the assets, supply them, then mint. Withdrawals burn before
// any assets leave the market.
class AccountingEngine
{
public:
    explicit AccountingEngine(const AccountingEngineDesc& desc);

    decimal_t deposit(const AccountId& caller, decimal_t assets, const AccountId& receiver);
    decimal_t mint(const AccountId& caller, decimal_t shares, const AccountId& receiver);
    decimal_t withdraw(
        const AccountId& caller,
        decimal_t assets,
        const AccountId& receiver,
        const AccountId& owner);
    decimal_t redeem(
        const AccountId& caller,
        decimal_t shares,
        const AccountId& receiver,
        const AccountId& owner);

    [[nodiscard]] decimal_t totalAssets() const;
    [[nodiscard]] decimal_t totalShares() const noexcept { return m_shares.totalSupply(); }

    [[nodiscard]] decimal_t convertToShares(decimal_t assets) const;
    [[nodiscard]] decimal_t convertToAssets(decimal_t shares) const;
    [[nodiscard]] decimal_t previewDeposit(decimal_t assets) const;
    [[nodiscard]] decimal_t previewMint(decimal_t shares) const;
    [[nodiscard]] decimal_t previewWithdraw(decimal_t assets) const;
    [[nodiscard]] decimal_t previewRedeem(decimal_t shares) const;
    [[nodiscard]] decimal_t maxWithdraw(const AccountId& owner) const;
    [[nodiscard]] decimal_t maxRedeem(const AccountId& owner) const noexcept;

    [[nodiscard]] const AccountId& self() const noexcept { return m_self; }
    [[nodiscard]] accounting::Ledger& asset() noexcept { return *m_asset; }
    [[nodiscard]] const accounting::Ledger& asset() const noexcept { return *m_asset; }
    [[nodiscard]] accounting::Ledger& shares() noexcept { return m_shares; }
    [[nodiscard]] const accounting::Ledger& shares() const noexcept { return m_shares; }

private:
    [[nodiscard]] accounting::SharePool pool(std::source_location sl) const;
    void burnFrom(const AccountId& caller, const AccountId& owner, decimal_t shares);

    AccountId m_self;
    accounting::Ledger m_shares;
    accounting::Ledger* m_asset;
    market::LendingMarket* m_market;
};

//-------------------------------------------------------------------------

}  // namespace loopvault::vault

//-------------------------------------------------------------------------
