/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "loopvault/accounting/Ledger.hpp"
#include "loopvault/market/LendingMarket.hpp"
#include "loopvault/oracle/PriceOracle.hpp"
#include "loopvault/simulation/Clock.hpp"
#include "loopvault/swap/SwapRouter.hpp"
#include "loopvault/vault/RewardAccrual.hpp"
#include "loopvault/vault/VaultConfig.hpp"
#include "loopvault/yield/YieldTarget.hpp"

//-------------------------------------------------------------------------

namespace loopvault::vault
{

//-------------------------------------------------------------------------

enum class RebalancePhase : uint8_t
{
    SETTLED,
    REBALANCING
};

struct HarvestResult
{
    // In the borrowed asset.
    decimal_t harvested{};
    // In the base asset, supplied as collateral.
    decimal_t proceeds{};
};

struct RecenterResult
{
    decimal_t collateralValue{};
    decimal_t debtValue{};
    decimal_t currentLtv{};
    decimal_t estimatedLtv{};
    decimal_t newLtv{};
    decimal_t newDebtValue{};
    // In the borrowed asset.
    decimal_t borrowed{};
    decimal_t repaid{};
};

struct RebalanceReport
{
    Timestamp timestamp;
    AccountId keeper;
    HarvestResult harvest;
    RecenterResult recenter;
    decimal_t rewardShares{};
};

struct RebalancingControllerDesc
{
    VaultConfig config;
    AccountId self;
    market::LendingMarket* market;
    const oracle::PriceOracle* oracle;
    yield::YieldTarget* yieldTarget;
    swap::SwapRouter* swapRouter;
    RewardAccrual* rewards;
    const simulation::Clock* clock;
    uint32_t valueDecimals{util::kDefaultDecimalPlaces};
    uint32_t assetDecimals{util::kDefaultDecimalPlaces};
    uint32_t borrowDecimals{util::kDefaultDecimalPlaces};
};

struct RebalancingControllerState
{
    Timestamp lastRebalanceTimestamp;
};

//-------------------------------------------------------------------------

class RebalancingController
{
public:
    using Snapshot = RebalancingControllerState;

    explicit RebalancingController(const RebalancingControllerDesc& desc);

    [[nodiscard]] bool isRebalanceDue() const;
    RebalanceReport rebalance(const AccountId& caller);

    [[nodiscard]] decimal_t getCollateralValue() const;
    [[nodiscard]] decimal_t getDebtValue() const;
    [[nodiscard]] decimal_t getCurrentLtv() const;
    [[nodiscard]] Timestamp lastRebalanceTimestamp() const noexcept
    {
        return m_state.lastRebalanceTimestamp;
    }
    [[nodiscard]] RebalancePhase phase() const noexcept { return m_phase; }
    [[nodiscard]] const VaultConfig& config() const noexcept { return m_config; }

    [[nodiscard]] Snapshot snapshot() const noexcept { return m_state; }
    void restore(Snapshot snapshot) noexcept { m_state = snapshot; }

private:
    class PhaseGuard
    {
    public:
        explicit PhaseGuard(RebalancePhase& phase);
        ~PhaseGuard() noexcept { m_phase = RebalancePhase::SETTLED; }

        PhaseGuard(const PhaseGuard&) = delete;
        PhaseGuard& operator=(const PhaseGuard&) = delete;

    private:
        RebalancePhase& m_phase;
    };

    [[nodiscard]] decimal_t ltvOf(const market::AccountPosition& position) const;
    [[nodiscard]] decimal_t priceOf(const AssetId& asset) const;
    HarvestResult harvest();
    RecenterResult recenter();

    VaultConfig m_config;
    AccountId m_self;
    market::LendingMarket* m_market;
    const oracle::PriceOracle* m_oracle;
    yield::YieldTarget* m_yieldTarget;
    swap::SwapRouter* m_swapRouter;
    RewardAccrual* m_rewards;
    const simulation::Clock* m_clock;
    uint32_t m_valueDecimals;
    uint32_t m_assetDecimals;
    uint32_t m_borrowDecimals;
    RebalancingControllerState m_state;
    RebalancePhase m_phase{RebalancePhase::SETTLED};
};

//-------------------------------------------------------------------------

}  // namespace loopvault::vault

//-------------------------------------------------------------------------
