/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "loopvault/swap/OracleSwapRouter.hpp"

#include "VaultException.hpp"

//-------------------------------------------------------------------------

namespace loopvault::swap
{

//-------------------------------------------------------------------------

OracleSwapRouter::OracleSwapRouter(const OracleSwapRouterDesc& desc)
    : m_oracle{desc.oracle},
      m_clock{desc.clock},
      m_fee{desc.fee},
      m_maxOracleAge{desc.maxOracleAge}
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (m_oracle == nullptr || m_clock == nullptr) {
        throw std::invalid_argument{fmt::format("{}: oracle and clock must not be null", ctx)};
    }
    if (m_fee < 0_dec || m_fee >= 1_dec) {
        throw ConfigurationError{fmt::format("{}: fee must be in [0,1), was {}", ctx, m_fee)};
    }
}

//-------------------------------------------------------------------------

void OracleSwapRouter::addAsset(accounting::Ledger* ledger)
{
    if (ledger == nullptr) {
        throw std::invalid_argument{fmt::format(
            "{}: ledger must not be null", std::source_location::current().function_name())};
    }
    m_ledgers[ledger->symbol()] = ledger;
}

//-------------------------------------------------------------------------

decimal_t OracleSwapRouter::swapExactInput(const AccountId& caller, const SwapRequest& request)
{
    static constexpr auto sl = std::source_location::current();

    auto& in = ledgerAt(request.assetIn, sl);
    auto& out = ledgerAt(request.assetOut, sl);

    const decimal_t amountIn = in.roundDown(request.amountIn);
    const decimal_t amountOut = quote(request.assetIn, request.assetOut, amountIn);
    if (amountOut < request.minAmountOut) {
        throw PreconditionError{
            ErrorCode::SLIPPAGE_EXCEEDED,
            fmt::format(
                "{}: {} {} buys {} {}, below the minimum {}",
                sl.function_name(), amountIn, request.assetIn,
                amountOut, request.assetOut, request.minAmountOut)};
    }
    if (amountIn == 0_dec) return {};

    in.burn(caller, amountIn);
    out.mint(request.receiver, amountOut);
    return amountOut;
}

//-------------------------------------------------------------------------

decimal_t OracleSwapRouter::quote(
    const AssetId& assetIn, const AssetId& assetOut, decimal_t amountIn) const
{
    const oracle::PriceRequirements requirements{.now = m_clock->now(), .maxAge = m_maxOracleAge};
    const decimal_t priceIn = oracle::requirePrice(*m_oracle, assetIn, requirements);
    const decimal_t priceOut = oracle::requirePrice(*m_oracle, assetOut, requirements);
    return ledgerAt(assetOut, std::source_location::current()).roundDown(
        amountIn * priceIn * util::dec1m(m_fee) / priceOut);
}

//-------------------------------------------------------------------------

accounting::Ledger& OracleSwapRouter::ledgerAt(
    const AssetId& asset, std::source_location sl) const
{
    auto it = m_ledgers.find(asset);
    if (it == m_ledgers.end()) {
        throw std::invalid_argument{fmt::format(
            "{}: No route for {}", sl.function_name(), asset)};
    }
    return *it->second;
}

//-------------------------------------------------------------------------

}  // namespace loopvault::swap

//-------------------------------------------------------------------------
