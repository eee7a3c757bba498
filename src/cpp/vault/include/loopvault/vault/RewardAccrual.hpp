/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "loopvault/accounting/Ledger.hpp"

//-------------------------------------------------------------------------

namespace loopvault::vault
{

//-------------------------------------------------------------------------

// Pays the keeper a management fee of one rebalance interval's worth of
// the annual rate, as newly minted shares with no assets behind them.
class RewardAccrual
{
public:
    RewardAccrual(accounting::Ledger* shares, decimal_t annualFeeRate, Timestamp interval);

    [[nodiscard]] decimal_t feeRate() const noexcept { return m_feeRate; }
    [[nodiscard]] decimal_t previewReward() const;

    // Returns the shares minted to the caller.
    decimal_t accrue(const AccountId& caller);

private:
    accounting::Ledger* m_shares;
    decimal_t m_feeRate;
};

//-------------------------------------------------------------------------

}  // namespace loopvault::vault

//-------------------------------------------------------------------------
