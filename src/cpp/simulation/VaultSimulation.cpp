/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "loopvault/simulation/VaultSimulation.hpp"

#include "GBM.hpp"
#include "VaultException.hpp"

#include <algorithm>
#include <fstream>

//-------------------------------------------------------------------------

namespace loopvault::simulation
{

//-------------------------------------------------------------------------

namespace
{

decimal_t requiredAmount(pugi::xml_node node, const char* name, std::source_location sl)
{
    pugi::xml_attribute attr = node.attribute(name);
    if (attr.empty() || attr.as_double() < 0.0) {
        throw std::invalid_argument{fmt::format(
            "{}: Node '{}' needs a non-negative attribute '{}'",
            sl.function_name(), node.name(), name)};
    }
    return util::double2decimal(attr.as_double());
}

}  // namespace

//-------------------------------------------------------------------------

Action Action::fromXML(pugi::xml_node node, Timescale scale)
{
    static constexpr auto sl = std::source_location::current();

    const auto type = magic_enum::enum_cast<ActionType>(
        node.name(), magic_enum::case_insensitive);
    if (!type.has_value()) {
        throw std::invalid_argument{fmt::format(
            "{}: Unknown action '{}'", sl.function_name(), node.name())};
    }

    const AccountId caller = node.attribute("caller").as_string();
    if (caller.empty()) {
        throw std::invalid_argument{fmt::format(
            "{}: Action '{}' needs a caller", sl.function_name(), node.name())};
    }
    const char* amountAttr =
        *type == ActionType::DEPOSIT || *type == ActionType::WITHDRAW ? "assets" : "shares";

    return {
        .time = node.attribute("time").as_ullong() * timescaleToFactor(scale),
        .type = *type,
        .caller = caller,
        .receiver = node.attribute("receiver").as_string(caller.c_str()),
        .owner = node.attribute("owner").as_string(caller.c_str()),
        .amount = requiredAmount(node, amountAttr, sl)
    };
}

//-------------------------------------------------------------------------

VaultSimulation::VaultSimulation(const fs::path& logDir)
    : m_logDir{logDir},
      m_oracle{std::make_unique<oracle::FeedPriceOracle>(&m_clock)}
{}

//-------------------------------------------------------------------------

void VaultSimulation::run()
{
    const Timestamp start = m_time.startSeconds();
    const Timestamp end = start + m_time.durationSeconds();
    const Timestamp stepSize = m_time.stepSeconds();

    fmt::print(
        " - running from {} to {} in steps of {}{}\n",
        m_time.start, m_time.start + m_time.duration, m_time.step, m_time.scale);

    for (Timestamp t = start; t <= end; t += stepSize) {
        step(t);
    }

    const auto state = json::jsonSerializable2str(
        *this, json::FormatOptions{.indent = json::IndentOptions{}});
    fmt::print("{}\n", state);
    if (!m_logDir.empty()) {
        std::ofstream ofs{m_logDir / "state.json"};
        ofs << state;
    }
}

//-------------------------------------------------------------------------

void VaultSimulation::step(Timestamp timestamp)
{
    m_clock.set(timestamp);
    updatePrices();
    m_market->accrue();
    m_yieldVault->accrue();

    while (m_nextAction < m_actions.size() && m_actions[m_nextAction].time <= timestamp) {
        execute(m_actions[m_nextAction++]);
    }

    keep();
    ++m_stats.steps;
}

//-------------------------------------------------------------------------

const accounting::Ledger& VaultSimulation::ledger(const AssetId& asset) const
{
    auto it = m_ledgers.find(asset);
    if (it == m_ledgers.end()) {
        throw std::invalid_argument{fmt::format(
            "{}: Unknown asset {}", std::source_location::current().function_name(), asset)};
    }
    return *it->second;
}

//-------------------------------------------------------------------------

void VaultSimulation::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("time", rapidjson::Value{m_clock.now()}, allocator);
        json::serializeHelper(
            json,
            "stats",
            [this](rapidjson::Document& json) {
                json.SetObject();
                auto& allocator = json.GetAllocator();
                json.AddMember("steps", rapidjson::Value{m_stats.steps}, allocator);
                json.AddMember(
                    "actionsExecuted", rapidjson::Value{m_stats.actionsExecuted}, allocator);
                json.AddMember("actionsFailed", rapidjson::Value{m_stats.actionsFailed}, allocator);
                json.AddMember("rebalances", rapidjson::Value{m_stats.rebalances}, allocator);
                json.AddMember(
                    "rebalancesFailed", rapidjson::Value{m_stats.rebalancesFailed}, allocator);
            });
        json::serializeHelper(
            json,
            "prices",
            [this](rapidjson::Document& json) {
                json.SetObject();
                auto& allocator = json.GetAllocator();
                for (const auto& [asset, quote] : m_oracle->snapshot()) {
                    json.AddMember(
                        rapidjson::Value{asset.c_str(), allocator},
                        rapidjson::Value{util::decimal2double(quote.price)},
                        allocator);
                }
            });
        m_vault->jsonSerialize(json, "vault");
        m_market->jsonSerialize(json, "market");
        m_yieldVault->jsonSerialize(json, "yield");
        json::serializeHelper(
            json,
            "ledgers",
            [this](rapidjson::Document& json) {
                json.SetObject();
                for (const auto& [asset, ledger] : m_ledgers) {
                    ledger->jsonSerialize(json, asset);
                }
            });
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

std::unique_ptr<VaultSimulation> VaultSimulation::fromXML(
    pugi::xml_node node, const fs::path& logDir)
{
    auto simulation = std::make_unique<VaultSimulation>(logDir);

    simulation->m_debug = node.attribute("debug").as_bool();
    simulation->m_time = TimeConfig::fromXML(node);
    simulation->m_clock.set(simulation->m_time.startSeconds());

    simulation->configureAssets(node.child("Assets"));
    simulation->configureMarket(node.child("LendingMarket"));
    simulation->configureYieldVault(node.child("YieldVault"));
    simulation->configureSwapRouter(node.child("SwapRouter"));
    simulation->configureVault(node.child("Vault"));
    simulation->configureAccounts(node.child("Accounts"));
    simulation->configureActions(node.child("Actions"));

    if (pugi::xml_node keeperNode = node.child("Keeper")) {
        simulation->m_keeper = keeperNode.attribute("account").as_string("keeper");
    }
    if (!logDir.empty()) {
        simulation->m_vaultLogger = std::make_unique<vault::VaultLogger>(
            logDir / "vault.csv", simulation->m_vault.get());
    }

    return simulation;
}

//-------------------------------------------------------------------------

std::unique_ptr<VaultSimulation> VaultSimulation::fromConfig(
    const fs::path& path, const fs::path& logDir)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    pugi::xml_document doc;
    if (pugi::xml_parse_result result = doc.load_file(path.c_str()); !result) {
        throw std::runtime_error{fmt::format(
            "{}: Failed to parse '{}': {}", ctx, path.c_str(), result.description())};
    }
    fmt::print(" - '{}' loaded successfully\n", path.c_str());
    pugi::xml_node node = doc.child("Simulation");
    if (!node) {
        throw std::invalid_argument{fmt::format(
            "{}: '{}' has no 'Simulation' node", ctx, path.c_str())};
    }

    fs::path runDir = logDir;
    if (!runDir.empty()) {
        runDir /= node.attribute("id").as_string("default");
        fs::create_directories(runDir);
        pugi::xml_document copy;
        copy.append_copy(node);
        copy.save_file((runDir / "config.xml").c_str());
    }

    return fromXML(node, runDir);
}

//-------------------------------------------------------------------------

void VaultSimulation::configureAssets(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (!node) {
        throw std::invalid_argument{fmt::format("{}: Missing node 'Assets'", ctx)};
    }
    for (pugi::xml_node assetNode : node.children("Asset")) {
        auto ledger = std::make_unique<accounting::Ledger>(
            accounting::Ledger::descFromXML(assetNode));
        const AssetId asset = ledger->symbol();
        m_registry.track(*ledger, asset);

        if (pugi::xml_node gbmNode = assetNode.child("GBM")) {
            m_priceProcesses[asset] = process::GBM::fromXML(
                gbmNode, m_time.startSeconds(), m_ledgers.size());
        }
        m_oracle->setPrice(asset, requiredAmount(assetNode, "price", std::source_location::current()));
        m_ledgers[asset] = std::move(ledger);
    }
    if (m_ledgers.empty()) {
        throw std::invalid_argument{fmt::format("{}: No assets configured", ctx)};
    }
}

//-------------------------------------------------------------------------

void VaultSimulation::configureMarket(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (!node) {
        throw std::invalid_argument{fmt::format("{}: Missing node 'LendingMarket'", ctx)};
    }
    m_market = std::make_unique<market::SimulatedLendingMarket>(
        market::SimulatedLendingMarketDesc{
            .self = node.attribute("account").as_string("market"),
            .oracle = m_oracle.get(),
            .clock = &m_clock,
            .maxOracleAge = node.attribute("maxOracleAge").as_ullong()
        });
    for (pugi::xml_node reserveNode : node.children("Reserve")) {
        auto& token = ledgerAt(reserveNode.attribute("symbol").as_string());
        m_market->listReserve(&token, market::ReserveConfig::fromXML(reserveNode));
        token.mint(m_market->self(), util::double2decimal(
            reserveNode.attribute("liquidity").as_double()));
    }
    m_registry.track(*m_market, m_market->self());
}

//-------------------------------------------------------------------------

void VaultSimulation::configureYieldVault(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (!node) {
        throw std::invalid_argument{fmt::format("{}: Missing node 'YieldVault'", ctx)};
    }
    m_yieldVault = std::make_unique<yield::SimulatedYieldVault>(
        yield::SimulatedYieldVaultDesc{
            .self = node.attribute("account").as_string("yield"),
            .underlying = &ledgerAt(node.attribute("asset").as_string()),
            .clock = &m_clock,
            .annualYieldRate = util::ppm2ratio(node.attribute("annualYieldRate").as_ullong())
        });
    m_registry.track(*m_yieldVault, m_yieldVault->self());
}

//-------------------------------------------------------------------------

void VaultSimulation::configureSwapRouter(pugi::xml_node node)
{
    m_swapRouter = std::make_unique<swap::OracleSwapRouter>(
        swap::OracleSwapRouterDesc{
            .oracle = m_oracle.get(),
            .clock = &m_clock,
            .fee = util::ppm2ratio(node.attribute("fee").as_ullong()),
            .maxOracleAge = node.attribute("maxOracleAge").as_ullong()
        });
    for (auto& ledger : m_ledgers | views::values) {
        m_swapRouter->addAsset(ledger.get());
    }
}

//-------------------------------------------------------------------------

void VaultSimulation::configureVault(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (!node) {
        throw std::invalid_argument{fmt::format("{}: Missing node 'Vault'", ctx)};
    }
    const auto config = vault::VaultConfig::fromXML(node);
    m_vault = std::make_unique<vault::LeveragedVault>(vault::LeveragedVaultDesc{
        .self = node.attribute("account").as_string("vault"),
        .config = config,
        .asset = &ledgerAt(config.asset),
        .borrowAsset = &ledgerAt(config.borrowAsset),
        .market = m_market.get(),
        .oracle = m_oracle.get(),
        .yieldTarget = m_yieldVault.get(),
        .swapRouter = m_swapRouter.get(),
        .clock = &m_clock,
        .registry = &m_registry
    });
}

//-------------------------------------------------------------------------

void VaultSimulation::configureAccounts(pugi::xml_node node)
{
    for (pugi::xml_node accountNode : node.children("Account")) {
        const AccountId account = accountNode.attribute("name").as_string();
        for (pugi::xml_node balanceNode : accountNode.children("Balance")) {
            ledgerAt(balanceNode.attribute("asset").as_string()).mint(
                account, requiredAmount(balanceNode, "amount", std::source_location::current()));
        }
    }
}

//-------------------------------------------------------------------------

void VaultSimulation::configureActions(pugi::xml_node node)
{
    for (pugi::xml_node actionNode : node.children()) {
        m_actions.push_back(Action::fromXML(actionNode, m_time.scale));
        m_actions.back().time += m_time.startSeconds();
    }
    std::ranges::stable_sort(m_actions, {}, &Action::time);
}

//-------------------------------------------------------------------------

void VaultSimulation::updatePrices()
{
    for (const auto& [asset, process] : m_priceProcesses) {
        process->update(m_clock.now());
        m_oracle->setPrice(asset, util::double2decimal(process->value()));
    }
    for (const auto& asset : m_ledgers | views::keys) {
        if (!m_priceProcesses.contains(asset)) {
            m_oracle->setPrice(asset, m_oracle->getPrice(asset).price);
        }
    }
}

//-------------------------------------------------------------------------

void VaultSimulation::execute(const Action& action)
{
    try {
        switch (action.type) {
            case ActionType::DEPOSIT:
                m_vault->deposit(action.caller, action.amount, action.receiver);
                break;
            case ActionType::MINT:
                m_vault->mint(action.caller, action.amount, action.receiver);
                break;
            case ActionType::WITHDRAW:
                m_vault->withdraw(action.caller, action.amount, action.receiver, action.owner);
                break;
            case ActionType::REDEEM:
                m_vault->redeem(action.caller, action.amount, action.receiver, action.owner);
                break;
        }
        ++m_stats.actionsExecuted;
        logDebug(
            "{} {} {} by {}: ok",
            m_clock.now(), magic_enum::enum_name(action.type), action.amount, action.caller);
    }
    catch (const VaultException& exc) {
        ++m_stats.actionsFailed;
        fmt::print(
            "{} {} {} by {} failed with {}: {}\n",
            m_clock.now(), magic_enum::enum_name(action.type), action.amount,
            action.caller, exc.reason(), exc.what());
    }
}

//-------------------------------------------------------------------------

void VaultSimulation::keep()
{
    try {
        if (!m_vault->isRebalanceDue()) return;
        const auto report = m_vault->rebalance(m_keeper);
        ++m_stats.rebalances;
        logDebug(
            "{} rebalance: ltv {} -> {}, borrowed {}, repaid {}, harvested {}, reward {}",
            report.timestamp, report.recenter.currentLtv, report.recenter.newLtv,
            report.recenter.borrowed, report.recenter.repaid,
            report.harvest.harvested, report.rewardShares);
    }
    catch (const VaultException& exc) {
        ++m_stats.rebalancesFailed;
        fmt::print(
            "{} rebalance failed with {}: {}\n", m_clock.now(), exc.reason(), exc.what());
    }
}

//-------------------------------------------------------------------------

accounting::Ledger& VaultSimulation::ledgerAt(const AssetId& asset)
{
    return const_cast<accounting::Ledger&>(std::as_const(*this).ledger(asset));
}

//-------------------------------------------------------------------------

}  // namespace loopvault::simulation

//-------------------------------------------------------------------------
