/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "Process.hpp"
#include "VaultLogger.hpp"
#include "loopvault/accounting/Ledger.hpp"
#include "loopvault/market/SimulatedLendingMarket.hpp"
#include "loopvault/oracle/FeedPriceOracle.hpp"
#include "loopvault/simulation/Clock.hpp"
#include "loopvault/simulation/StateRegistry.hpp"
#include "loopvault/simulation/TimeConfig.hpp"
#include "loopvault/swap/OracleSwapRouter.hpp"
#include "loopvault/vault/LeveragedVault.hpp"
#include "loopvault/yield/SimulatedYieldVault.hpp"

//-------------------------------------------------------------------------

namespace loopvault::simulation
{

//-------------------------------------------------------------------------

enum class ActionType : uint8_t
{
    DEPOSIT,
    MINT,
    WITHDRAW,
    REDEEM
};

struct Action
{
    Timestamp time;
    ActionType type;
    AccountId caller;
    AccountId receiver;
    AccountId owner;
    decimal_t amount;

    [[nodiscard]] static Action fromXML(pugi::xml_node node, Timescale scale);
};

struct SimulationStats
{
    uint64_t steps{};
    uint64_t actionsExecuted{};
    uint64_t actionsFailed{};
    uint64_t rebalances{};
    uint64_t rebalancesFailed{};
};

//-------------------------------------------------------------------------

// Runs one vault against simulated protocols over a fixed horizon: prices
// follow their processes, interest accrues, scheduled user actions execute
// and a keeper rebalances whenever the vault is due.
class VaultSimulation : public JsonSerializable
{
public:
    explicit VaultSimulation(const fs::path& logDir);

    void run();
    void step(Timestamp timestamp);

    [[nodiscard]] const TimeConfig& time() const noexcept { return m_time; }
    [[nodiscard]] const Clock& clock() const noexcept { return m_clock; }
    [[nodiscard]] vault::LeveragedVault& vault() noexcept { return *m_vault; }
    [[nodiscard]] const vault::LeveragedVault& vault() const noexcept { return *m_vault; }
    [[nodiscard]] const market::SimulatedLendingMarket& market() const noexcept { return *m_market; }
    [[nodiscard]] const yield::SimulatedYieldVault& yieldVault() const noexcept { return *m_yieldVault; }
    [[nodiscard]] const oracle::FeedPriceOracle& oracle() const noexcept { return *m_oracle; }
    [[nodiscard]] const accounting::Ledger& ledger(const AssetId& asset) const;
    [[nodiscard]] const SimulationStats& stats() const noexcept { return m_stats; }
    [[nodiscard]] const fs::path& logDir() const noexcept { return m_logDir; }

    template<typename... Args>
    void logDebug(fmt::format_string<Args...> fmt, Args&&... args) const
    {
        if (m_debug) {
            fmt::print("{}\n", fmt::format(fmt, std::forward<Args>(args)...));
        }
    }

    void setDebug(bool flag) noexcept { m_debug = flag; }
    [[nodiscard]] bool debug() const noexcept { return m_debug; }

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    [[nodiscard]] static std::unique_ptr<VaultSimulation> fromXML(
        pugi::xml_node node, const fs::path& logDir);
    [[nodiscard]] static std::unique_ptr<VaultSimulation> fromConfig(
        const fs::path& path, const fs::path& logDir);

private:
    void configureAssets(pugi::xml_node node);
    void configureMarket(pugi::xml_node node);
    void configureYieldVault(pugi::xml_node node);
    void configureSwapRouter(pugi::xml_node node);
    void configureVault(pugi::xml_node node);
    void configureAccounts(pugi::xml_node node);
    void configureActions(pugi::xml_node node);

    void updatePrices();
    void execute(const Action& action);
    void keep();
    [[nodiscard]] accounting::Ledger& ledgerAt(const AssetId& asset);

    fs::path m_logDir;
    bool m_debug{};
    TimeConfig m_time;
    Clock m_clock;
    StateRegistry m_registry;
    std::map<AssetId, std::unique_ptr<accounting::Ledger>> m_ledgers;
    std::map<AssetId, std::unique_ptr<process::Process>> m_priceProcesses;
    std::unique_ptr<oracle::FeedPriceOracle> m_oracle;
    std::unique_ptr<market::SimulatedLendingMarket> m_market;
    std::unique_ptr<yield::SimulatedYieldVault> m_yieldVault;
    std::unique_ptr<swap::OracleSwapRouter> m_swapRouter;
    std::unique_ptr<vault::LeveragedVault> m_vault;
    std::unique_ptr<vault::VaultLogger> m_vaultLogger;
    AccountId m_keeper{"keeper"};
    std::vector<Action> m_actions;
    size_t m_nextAction{};
    SimulationStats m_stats;
};

//-------------------------------------------------------------------------

}  // namespace loopvault::simulation

//-------------------------------------------------------------------------
