/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "loopvault/accounting/Ledger.hpp"
#include "loopvault/oracle/PriceOracle.hpp"
#include "loopvault/simulation/Clock.hpp"
#include "loopvault/swap/SwapRouter.hpp"

//-------------------------------------------------------------------------

namespace loopvault::swap
{

//-------------------------------------------------------------------------

struct OracleSwapRouterDesc
{
    const oracle::PriceOracle* oracle;
    const simulation::Clock* clock;
    decimal_t fee{};
    Timestamp maxOracleAge{};
};

//-------------------------------------------------------------------------

// Fills any size at the oracle cross rate less a proportional fee, taking
// the input out of circulation and issuing the output.
class OracleSwapRouter : public SwapRouter
{
public:
    explicit OracleSwapRouter(const OracleSwapRouterDesc& desc);

    void addAsset(accounting::Ledger* ledger);

    virtual decimal_t swapExactInput(const AccountId& caller, const SwapRequest& request) override;

    [[nodiscard]] decimal_t quote(
        const AssetId& assetIn, const AssetId& assetOut, decimal_t amountIn) const;
    [[nodiscard]] decimal_t fee() const noexcept { return m_fee; }

private:
    [[nodiscard]] accounting::Ledger& ledgerAt(const AssetId& asset, std::source_location sl) const;

    const oracle::PriceOracle* m_oracle;
    const simulation::Clock* m_clock;
    decimal_t m_fee;
    Timestamp m_maxOracleAge;
    std::map<AssetId, accounting::Ledger*> m_ledgers;
};

//-------------------------------------------------------------------------

}  // namespace loopvault::swap

//-------------------------------------------------------------------------
