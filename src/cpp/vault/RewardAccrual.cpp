/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "loopvault/vault/RewardAccrual.hpp"

//-------------------------------------------------------------------------

namespace loopvault::vault
{

//-------------------------------------------------------------------------

RewardAccrual::RewardAccrual(
    accounting::Ledger* shares, decimal_t annualFeeRate, Timestamp interval)
    : m_shares{shares}
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (m_shares == nullptr) {
        throw std::invalid_argument{fmt::format("{}: shares must not be null", ctx)};
    }
    if (annualFeeRate < 0_dec || annualFeeRate >= 1_dec) {
        throw std::invalid_argument{fmt::format(
            "{}: annualFeeRate should be in [0,1), was {}", ctx, annualFeeRate)};
    }
    m_feeRate = util::mulDiv(
        annualFeeRate,
        decimal_t{interval},
        decimal_t{kSecondsPerYear},
        util::kFeeRateDecimals,
        Rounding::DOWN);
}

//-------------------------------------------------------------------------

decimal_t RewardAccrual::previewReward() const
{
    return util::mul(m_shares->totalSupply(), m_feeRate, m_shares->decimals(), Rounding::DOWN);
}

//-------------------------------------------------------------------------

decimal_t RewardAccrual::accrue(const AccountId& caller)
{
    const decimal_t reward = previewReward();
    if (reward == 0_dec) return {};
    m_shares->mint(caller, reward);
    return reward;
}

//-------------------------------------------------------------------------

}  // namespace loopvault::vault

//-------------------------------------------------------------------------
