/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "VaultLogger.hpp"

#include "VaultException.hpp"

#include <fmt/ranges.h>
#include <spdlog/sinks/basic_file_sink.h>

//-------------------------------------------------------------------------

namespace loopvault::vault
{

//-------------------------------------------------------------------------

VaultLogger::VaultLogger(const fs::path& filepath, LeveragedVault* vault)
    : m_filepath{filepath}, m_vault{vault}
{
    if (m_vault == nullptr) {
        throw std::invalid_argument{fmt::format(
            "{}: vault must not be null", std::source_location::current().function_name())};
    }

    m_logger = std::make_unique<spdlog::logger>(
        "VaultLogger", std::make_unique<spdlog::sinks::basic_file_sink_st>(m_filepath, true));
    m_logger->set_level(spdlog::level::trace);
    m_logger->set_pattern("%v");

    m_depositFeed = vault->signals().deposit.connect(
        [this](const DepositEvent& event) { log(event); });
    m_withdrawFeed = vault->signals().withdraw.connect(
        [this](const WithdrawEvent& event) { log(event); });
    m_rebalanceFeed = vault->signals().rebalance.connect(
        [this](const RebalanceReport& report) { log(report); });

    m_logger->trace(
        "time,event,account,assets,shares,borrowed,repaid,"
        "totalAssets,totalShares,collateralValue,debtValue,ltv");
    m_logger->flush();
}

//-------------------------------------------------------------------------

void VaultLogger::log(const DepositEvent& event) const
{
    write(event.timestamp, "deposit", event.receiver, event.assets, event.shares, {}, {});
}

//-------------------------------------------------------------------------

void VaultLogger::log(const WithdrawEvent& event) const
{
    write(event.timestamp, "withdraw", event.owner, event.assets, event.shares, {}, {});
}

//-------------------------------------------------------------------------

void VaultLogger::log(const RebalanceReport& report) const
{
    write(
        report.timestamp,
        "rebalance",
        report.keeper,
        report.harvest.proceeds,
        report.rewardShares,
        report.recenter.borrowed,
        report.recenter.repaid);
}

//-------------------------------------------------------------------------

void VaultLogger::write(
    Timestamp timestamp,
    std::string_view kind,
    const AccountId& account,
    decimal_t assets,
    decimal_t shares,
    decimal_t borrowed,
    decimal_t repaid) const
{
    const std::vector<decimal_t> values{
        assets,
        shares,
        borrowed,
        repaid,
        m_vault->totalAssets(),
        m_vault->totalSupply()
    };
    m_logger->trace(fmt::format(
        "{},{},{},{},{}",
        timestamp,
        kind,
        account,
        fmt::join(
            values | views::transform([](decimal_t value) { return util::decimal2double(value); }),
            ","),
        formatPosition()));
    m_logger->flush();
}

//-------------------------------------------------------------------------

std::string VaultLogger::formatPosition() const
{
    // The row records a committed operation, so an unusable oracle leaves the
    // valuation columns empty instead of failing the operation's caller.
    try {
        const decimal_t collateralValue = m_vault->getCollateralValue();
        return fmt::format(
            "{},{},{}",
            util::decimal2double(collateralValue),
            util::decimal2double(m_vault->getDebtValue()),
            util::decimal2double(
                collateralValue > 0_dec ? m_vault->getCurrentLtv() : decimal_t{}));
    }
    catch (const OracleError&) {
        return ",,";
    }
}

//-------------------------------------------------------------------------

}  // namespace loopvault::vault

//-------------------------------------------------------------------------
