/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "loopvault/accounting/Ledger.hpp"
#include "loopvault/market/LendingMarket.hpp"
#include "loopvault/oracle/PriceOracle.hpp"
#include "loopvault/simulation/Clock.hpp"

//-------------------------------------------------------------------------

namespace loopvault::market
{

//-------------------------------------------------------------------------

struct ReserveConfig
{
    bool active{true};
    bool collateralEnabled{};
    bool borrowEnabled{};
    decimal_t maxLtv{};
    decimal_t liquidationThreshold{};
    // Annual, simple interest.
    decimal_t supplyRate{};
    decimal_t borrowRate{};

    [[nodiscard]] static ReserveConfig fromXML(pugi::xml_node node);
};

struct ReserveState
{
    decimal_t liquidityIndex{1};
    decimal_t borrowIndex{1};
    Timestamp lastUpdate{};
    std::map<AccountId, decimal_t> scaledCollateral;
    std::map<AccountId, decimal_t> scaledDebt;
};

struct SimulatedLendingMarketDesc
{
    AccountId self;
    const oracle::PriceOracle* oracle;
    const simulation::Clock* clock;
    Timestamp maxOracleAge{};
    uint32_t valueDecimals{util::kDefaultDecimalPlaces};
};

//-------------------------------------------------------------------------

class SimulatedLendingMarket : public LendingMarket, public JsonSerializable
{
public:
    using Snapshot = std::map<AssetId, ReserveState>;

    explicit SimulatedLendingMarket(const SimulatedLendingMarketDesc& desc);

    void listReserve(accounting::Ledger* token, const ReserveConfig& config);

    virtual void supply(const AccountId& account, const AssetId& asset, decimal_t amount) override;
    virtual decimal_t withdraw(
        const AccountId& account,
        const AssetId& asset,
        decimal_t amount,
        const AccountId& to) override;
    virtual void borrow(
        const AccountId& account,
        const AssetId& asset,
        decimal_t amount,
        const AccountId& to) override;
    virtual decimal_t repay(const AccountId& account, const AssetId& asset, decimal_t amount) override;

    [[nodiscard]] virtual AccountPosition getAccountPosition(
        const AccountId& account) const override;
    [[nodiscard]] virtual ReserveStatus getReserveStatus(const AssetId& asset) const override;
    [[nodiscard]] virtual decimal_t collateralBalanceOf(
        const AssetId& asset, const AccountId& account) const override;
    [[nodiscard]] virtual decimal_t debtBalanceOf(
        const AssetId& asset, const AccountId& account) const override;

    // Persists interest accrued since the last update on every reserve.
    void accrue();

    [[nodiscard]] const AccountId& self() const noexcept { return m_self; }
    [[nodiscard]] const ReserveConfig& reserveConfig(const AssetId& asset) const;
    [[nodiscard]] decimal_t liquidityIndex(const AssetId& asset) const;
    [[nodiscard]] decimal_t borrowIndex(const AssetId& asset) const;

    [[nodiscard]] Snapshot snapshot() const;
    void restore(Snapshot snapshot) noexcept;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    struct Reserve
    {
        accounting::Ledger* token;
        ReserveConfig config;
        ReserveState state;
    };

    struct Valuation
    {
        AccountPosition position;
        decimal_t borrowCapacity{};
        decimal_t liquidationCapacity{};
    };

    [[nodiscard]] Reserve& reserveAt(const AssetId& asset, std::source_location sl);
    [[nodiscard]] const Reserve& reserveAt(const AssetId& asset, std::source_location sl) const;
    [[nodiscard]] decimal_t currentLiquidityIndex(const Reserve& reserve) const noexcept;
    [[nodiscard]] decimal_t currentBorrowIndex(const Reserve& reserve) const noexcept;
    [[nodiscard]] decimal_t growth(decimal_t rate, Timestamp since) const noexcept;
    [[nodiscard]] Valuation valuate(const AccountId& account) const;
    void accrue(Reserve& reserve) noexcept;
    void requireActive(const AssetId& asset, const Reserve& reserve, std::source_location sl) const;
    void requireLiquidity(const Reserve& reserve, decimal_t amount, std::source_location sl) const;

    AccountId m_self;
    const oracle::PriceOracle* m_oracle;
    const simulation::Clock* m_clock;
    Timestamp m_maxOracleAge;
    uint32_t m_valueDecimals;
    std::map<AssetId, Reserve> m_reserves;
};

//-------------------------------------------------------------------------

}  // namespace loopvault::market

//-------------------------------------------------------------------------
