/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "loopvault/simulation/StateRegistry.hpp"
#include "loopvault/vault/AccountingEngine.hpp"
#include "loopvault/vault/RebalancingController.hpp"
#include "loopvault/vault/RewardAccrual.hpp"
#include "loopvault/vault/VaultSignals.hpp"

//-------------------------------------------------------------------------

namespace loopvault::vault
{

//-------------------------------------------------------------------------

struct LeveragedVaultDesc
{
    AccountId self;
    VaultConfig config;
    accounting::Ledger* asset;
    accounting::Ledger* borrowAsset;
    market::LendingMarket* market;
    const oracle::PriceOracle* oracle;
    yield::YieldTarget* yieldTarget;
    swap::SwapRouter* swapRouter;
    const simulation::Clock* clock;
    simulation::StateRegistry* registry;
};

//-------------------------------------------------------------------------

// Entry point for depositors and keepers. Every mutating call runs in a
// transaction over the registry and either completes or leaves no trace.
class LeveragedVault : public JsonSerializable
{
public:
    explicit LeveragedVault(const LeveragedVaultDesc& desc);

    LeveragedVault(const LeveragedVault&) = delete;
    LeveragedVault& operator=(const LeveragedVault&) = delete;

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
    RebalanceReport rebalance(const AccountId& caller);

    [[nodiscard]] decimal_t totalAssets() const { return m_engine.totalAssets(); }
    [[nodiscard]] decimal_t totalSupply() const noexcept { return m_engine.totalShares(); }
    [[nodiscard]] decimal_t balanceOf(const AccountId& account) const noexcept;
    [[nodiscard]] decimal_t getCollateralValue() const { return m_controller.getCollateralValue(); }
    [[nodiscard]] decimal_t getDebtValue() const { return m_controller.getDebtValue(); }
    [[nodiscard]] decimal_t getCurrentLtv() const { return m_controller.getCurrentLtv(); }
    [[nodiscard]] bool isRebalanceDue() const { return m_controller.isRebalanceDue(); }

    [[nodiscard]] const AccountId& self() const noexcept { return m_self; }
    [[nodiscard]] const VaultConfig& config() const noexcept { return m_config; }
    [[nodiscard]] AccountingEngine& engine() noexcept { return m_engine; }
    [[nodiscard]] const AccountingEngine& engine() const noexcept { return m_engine; }
    [[nodiscard]] const RebalancingController& controller() const noexcept { return m_controller; }
    [[nodiscard]] const RewardAccrual& rewards() const noexcept { return m_rewards; }
    [[nodiscard]] accounting::Ledger& shares() noexcept { return m_engine.shares(); }
    [[nodiscard]] VaultSignals& signals() noexcept { return m_signals; }

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    [[nodiscard]] static const LeveragedVaultDesc& checked(const LeveragedVaultDesc& desc);
    void validateReserves(const market::LendingMarket& market) const;
    void requireSettled(std::source_location sl) const;

    AccountId m_self;
    VaultConfig m_config;
    const simulation::Clock* m_clock;
    simulation::StateRegistry* m_registry;
    AccountingEngine m_engine;
    RewardAccrual m_rewards;
    RebalancingController m_controller;
    VaultSignals m_signals;
};

//-------------------------------------------------------------------------

}  // namespace loopvault::vault

//-------------------------------------------------------------------------
