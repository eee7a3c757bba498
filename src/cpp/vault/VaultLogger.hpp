/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "loopvault/vault/LeveragedVault.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace loopvault::vault
{

//-------------------------------------------------------------------------

// One CSV row per committed deposit, withdrawal and rebalance.
class VaultLogger
{
public:
    VaultLogger(const fs::path& filepath, LeveragedVault* vault);

    [[nodiscard]] const fs::path& filepath() const noexcept { return m_filepath; }

    void log(const DepositEvent& event) const;
    void log(const WithdrawEvent& event) const;
    void log(const RebalanceReport& report) const;

private:
    void write(
        Timestamp timestamp,
        std::string_view kind,
        const AccountId& account,
        decimal_t assets,
        decimal_t shares,
        decimal_t borrowed,
        decimal_t repaid) const;
    [[nodiscard]] std::string formatPosition() const;

    std::unique_ptr<spdlog::logger> m_logger;
    fs::path m_filepath;
    const LeveragedVault* m_vault;
    bs2::scoped_connection m_depositFeed;
    bs2::scoped_connection m_withdrawFeed;
    bs2::scoped_connection m_rebalanceFeed;
};

//-------------------------------------------------------------------------

}  // namespace loopvault::vault

//-------------------------------------------------------------------------
