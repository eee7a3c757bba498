/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "loopvault/accounting/Ledger.hpp"
#include "loopvault/accounting/ShareMath.hpp"
#include "loopvault/simulation/Clock.hpp"
#include "loopvault/yield/YieldTarget.hpp"

//-------------------------------------------------------------------------

namespace loopvault::yield
{

//-------------------------------------------------------------------------

struct SimulatedYieldVaultDesc
{
    // Account holding the underlying; also the share symbol.
    AccountId self;
    accounting::Ledger* underlying;
    const simulation::Clock* clock;
    decimal_t annualYieldRate{};
    uint32_t shareDecimals{accounting::kMaxTokenDecimals};
};

struct SimulatedYieldVaultState
{
    accounting::LedgerState shares;
    Timestamp lastAccrual;
};

//-------------------------------------------------------------------------

// Earns by minting the underlying into itself at a fixed simple annual rate.
class SimulatedYieldVault : public YieldTarget, public JsonSerializable
{
public:
    using Snapshot = SimulatedYieldVaultState;

    explicit SimulatedYieldVault(const SimulatedYieldVaultDesc& desc);

    [[nodiscard]] virtual const AssetId& asset() const noexcept override;

    virtual decimal_t deposit(
        const AccountId& caller, decimal_t assets, const AccountId& receiver) override;
    virtual decimal_t withdraw(
        const AccountId& caller,
        decimal_t assets,
        const AccountId& receiver,
        const AccountId& owner) override;
    virtual decimal_t redeem(
        const AccountId& caller,
        decimal_t shares,
        const AccountId& receiver,
        const AccountId& owner) override;

    [[nodiscard]] virtual decimal_t balanceOf(const AccountId& account) const override;
    [[nodiscard]] virtual decimal_t convertToAssets(decimal_t shares) const override;
    [[nodiscard]] virtual decimal_t convertToShares(decimal_t assets) const override;
    [[nodiscard]] virtual decimal_t maxWithdraw(const AccountId& owner) const override;

    void accrue();

    [[nodiscard]] decimal_t totalAssets() const noexcept;
    [[nodiscard]] const AccountId& self() const noexcept { return m_self; }
    [[nodiscard]] accounting::Ledger& shares() noexcept { return m_shares; }
    [[nodiscard]] const accounting::Ledger& shares() const noexcept { return m_shares; }

    [[nodiscard]] Snapshot snapshot() const;
    void restore(Snapshot snapshot) noexcept;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    [[nodiscard]] accounting::SharePool pool() const noexcept;
    void spendAllowance(const AccountId& owner, const AccountId& caller, decimal_t shares);

    AccountId m_self;
    accounting::Ledger* m_underlying;
    const simulation::Clock* m_clock;
    decimal_t m_annualYieldRate;
    accounting::Ledger m_shares;
    Timestamp m_lastAccrual;
};

//-------------------------------------------------------------------------

}  // namespace loopvault::yield

//-------------------------------------------------------------------------
