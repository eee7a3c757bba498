/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "loopvault/vault/AccountingEngine.hpp"

#include "VaultException.hpp"

//-------------------------------------------------------------------------

namespace loopvault::vault
{

//-------------------------------------------------------------------------

AccountingEngine::AccountingEngine(const AccountingEngineDesc& desc)
    : m_self{desc.self},
      m_shares{desc.shares},
      m_asset{desc.asset},
      m_market{desc.market}
{
    if (m_asset == nullptr || m_market == nullptr) {
        throw std::invalid_argument{fmt::format(
            "{}: asset and market must not be null",
            std::source_location::current().function_name())};
    }
}

//-------------------------------------------------------------------------

decimal_t AccountingEngine::deposit(
    const AccountId& caller, decimal_t assets, const AccountId& receiver)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    assets = m_asset->roundDown(assets);
    const decimal_t shares = previewDeposit(assets);
    if (shares == 0_dec) {
        throw RoundingError{
            ErrorCode::ZERO_SHARES,
            fmt::format("{}: Depositing {} {} mints no shares", ctx, assets, m_asset->symbol())};
    }

    m_asset->transfer(caller, m_self, assets);
    m_market->supply(m_self, m_asset->symbol(), assets);
    m_shares.mint(receiver, shares);
    return shares;
}

//-------------------------------------------------------------------------

decimal_t AccountingEngine::mint(
    const AccountId& caller, decimal_t shares, const AccountId& receiver)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    shares = m_shares.roundDown(shares);
    if (shares == 0_dec) {
        throw RoundingError{
            ErrorCode::ZERO_SHARES, fmt::format("{}: Cannot mint zero shares", ctx)};
    }
    const decimal_t assets = previewMint(shares);

    m_asset->transfer(caller, m_self, assets);
    m_market->supply(m_self, m_asset->symbol(), assets);
    m_shares.mint(receiver, shares);
    return assets;
}

//-------------------------------------------------------------------------

decimal_t AccountingEngine::withdraw(
    const AccountId& caller,
    decimal_t assets,
    const AccountId& receiver,
    const AccountId& owner)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    assets = m_asset->roundDown(assets);
    const decimal_t shares = previewWithdraw(assets);
    if (shares == 0_dec) {
        throw RoundingError{
            ErrorCode::ZERO_SHARES,
            fmt::format("{}: Withdrawing {} {} burns no shares", ctx, assets, m_asset->symbol())};
    }

    burnFrom(caller, owner, shares);
    m_market->withdraw(m_self, m_asset->symbol(), assets, receiver);
    return shares;
}

//-------------------------------------------------------------------------

decimal_t AccountingEngine::redeem(
    const AccountId& caller,
    decimal_t shares,
    const AccountId& receiver,
    const AccountId& owner)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    shares = m_shares.roundDown(shares);
    const decimal_t assets = previewRedeem(shares);
    if (assets == 0_dec) {
        throw RoundingError{
            ErrorCode::ZERO_ASSETS,
            fmt::format("{}: Redeeming {} shares pays out no {}", ctx, shares, m_asset->symbol())};
    }

    burnFrom(caller, owner, shares);
    m_market->withdraw(m_self, m_asset->symbol(), assets, receiver);
    return assets;
}

//-------------------------------------------------------------------------

decimal_t AccountingEngine::totalAssets() const
{
    return m_market->collateralBalanceOf(m_asset->symbol(), m_self);
}

//-------------------------------------------------------------------------

decimal_t AccountingEngine::convertToShares(decimal_t assets) const
{
    return accounting::assetsToShares(
        pool(std::source_location::current()), assets, m_shares.decimals(), Rounding::DOWN);
}

//-------------------------------------------------------------------------

decimal_t AccountingEngine::convertToAssets(decimal_t shares) const
{
    return accounting::sharesToAssets(
        pool(std::source_location::current()), shares, m_asset->decimals(), Rounding::DOWN);
}

//-------------------------------------------------------------------------

decimal_t AccountingEngine::previewDeposit(decimal_t assets) const
{
    return convertToShares(assets);
}

//-------------------------------------------------------------------------

decimal_t AccountingEngine::previewMint(decimal_t shares) const
{
    return accounting::sharesToAssets(
        pool(std::source_location::current()), shares, m_asset->decimals(), Rounding::UP);
}

//-------------------------------------------------------------------------

decimal_t AccountingEngine::previewWithdraw(decimal_t assets) const
{
    return accounting::assetsToShares(
        pool(std::source_location::current()), assets, m_shares.decimals(), Rounding::UP);
}

//-------------------------------------------------------------------------

decimal_t AccountingEngine::previewRedeem(decimal_t shares) const
{
    return convertToAssets(shares);
}

//-------------------------------------------------------------------------

decimal_t AccountingEngine::maxWithdraw(const AccountId& owner) const
{
    return convertToAssets(m_shares.balanceOf(owner));
}

//-------------------------------------------------------------------------

decimal_t AccountingEngine::maxRedeem(const AccountId& owner) const noexcept
{
    return m_shares.balanceOf(owner);
}

//-------------------------------------------------------------------------

accounting::SharePool AccountingEngine::pool(std::source_location sl) const
{
    const accounting::SharePool pool{
        .totalAssets = totalAssets(), .totalShares = m_shares.totalSupply()};
    if (pool.totalShares > 0_dec && pool.totalAssets == 0_dec) {
        throw PreconditionError{
            ErrorCode::ZERO_COLLATERAL,
            fmt::format(
                "{}: {} shares outstanding against no collateral",
                sl.function_name(), pool.totalShares)};
    }
    return pool;
}

//-------------------------------------------------------------------------

void AccountingEngine::burnFrom(
    const AccountId& caller, const AccountId& owner, decimal_t shares)
{
    if (caller != owner) {
        m_shares.spendAllowance(owner, caller, shares);
    }
    m_shares.burn(owner, shares);
}

//-------------------------------------------------------------------------

}  // namespace loopvault::vault

//-------------------------------------------------------------------------
