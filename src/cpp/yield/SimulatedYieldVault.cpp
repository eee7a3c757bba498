/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "loopvault/yield/SimulatedYieldVault.hpp"

#include "VaultException.hpp"

//-------------------------------------------------------------------------

namespace loopvault::yield
{

//-------------------------------------------------------------------------

SimulatedYieldVault::SimulatedYieldVault(const SimulatedYieldVaultDesc& desc)
    : m_self{desc.self},
      m_underlying{desc.underlying},
      m_clock{desc.clock},
      m_annualYieldRate{desc.annualYieldRate},
      m_shares{accounting::LedgerDesc{.symbol = desc.self, .decimals = desc.shareDecimals}},
      m_lastAccrual{desc.clock != nullptr ? desc.clock->now() : Timestamp{}}
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (m_underlying == nullptr || m_clock == nullptr) {
        throw std::invalid_argument{fmt::format(
            "{}: underlying and clock must not be null", ctx)};
    }
    if (m_annualYieldRate < 0_dec) {
        throw std::invalid_argument{fmt::format(
            "{}: annualYieldRate cannot be negative, was {}", ctx, m_annualYieldRate)};
    }
}

//-------------------------------------------------------------------------

const AssetId& SimulatedYieldVault::asset() const noexcept
{
    return m_underlying->symbol();
}

//-------------------------------------------------------------------------

decimal_t SimulatedYieldVault::deposit(
    const AccountId& caller, decimal_t assets, const AccountId& receiver)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    assets = m_underlying->roundDown(assets);
    const decimal_t shares = accounting::assetsToShares(
        pool(), assets, m_shares.decimals(), Rounding::DOWN);
    if (shares == 0_dec) {
        throw RoundingError{
            ErrorCode::ZERO_SHARES,
            fmt::format("{}: Depositing {} {} mints no shares", ctx, assets, asset())};
    }

    m_underlying->transfer(caller, m_self, assets);
    m_shares.mint(receiver, shares);
    return shares;
}

//-------------------------------------------------------------------------

decimal_t SimulatedYieldVault::withdraw(
    const AccountId& caller,
    decimal_t assets,
    const AccountId& receiver,
    const AccountId& owner)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    assets = m_underlying->roundDown(assets);
    if (const decimal_t max = maxWithdraw(owner); assets > max) {
        throw PreconditionError{
            ErrorCode::INSUFFICIENT_BALANCE,
            fmt::format("{}: {} may withdraw at most {} {}, requested {}",
                ctx, owner, max, asset(), assets)};
    }
    const decimal_t shares = std::min(
        accounting::assetsToShares(pool(), assets, m_shares.decimals(), Rounding::UP),
        m_shares.balanceOf(owner));
    if (shares == 0_dec) {
        throw RoundingError{
            ErrorCode::ZERO_SHARES,
            fmt::format("{}: Withdrawing {} {} burns no shares", ctx, assets, asset())};
    }

    spendAllowance(owner, caller, shares);
    m_shares.burn(owner, shares);
    m_underlying->transfer(m_self, receiver, assets);
    return shares;
}

//-------------------------------------------------------------------------

decimal_t SimulatedYieldVault::redeem(
    const AccountId& caller,
    decimal_t shares,
    const AccountId& receiver,
    const AccountId& owner)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    shares = m_shares.roundDown(shares);
    const decimal_t assets = accounting::sharesToAssets(
        pool(), shares, m_underlying->decimals(), Rounding::DOWN);
    if (assets == 0_dec) {
        throw RoundingError{
            ErrorCode::ZERO_ASSETS,
            fmt::format("{}: Redeeming {} shares pays out no {}", ctx, shares, asset())};
    }

    spendAllowance(owner, caller, shares);
    m_shares.burn(owner, shares);
    m_underlying->transfer(m_self, receiver, assets);
    return assets;
}

//-------------------------------------------------------------------------

decimal_t SimulatedYieldVault::balanceOf(const AccountId& account) const
{
    return m_shares.balanceOf(account);
}

//-------------------------------------------------------------------------

decimal_t SimulatedYieldVault::convertToAssets(decimal_t shares) const
{
    return accounting::sharesToAssets(pool(), shares, m_underlying->decimals(), Rounding::DOWN);
}

//-------------------------------------------------------------------------

decimal_t SimulatedYieldVault::convertToShares(decimal_t assets) const
{
    return accounting::assetsToShares(pool(), assets, m_shares.decimals(), Rounding::DOWN);
}

//-------------------------------------------------------------------------

decimal_t SimulatedYieldVault::maxWithdraw(const AccountId& owner) const
{
    return std::min(convertToAssets(m_shares.balanceOf(owner)), totalAssets());
}

//-------------------------------------------------------------------------

void SimulatedYieldVault::accrue()
{
    const Timestamp now = m_clock->now();
    if (now <= m_lastAccrual) return;

    const decimal_t elapsed{now - m_lastAccrual};
    m_lastAccrual = now;
    if (m_annualYieldRate == 0_dec || m_shares.totalSupply() == 0_dec) return;

    m_underlying->mint(
        m_self, totalAssets() * m_annualYieldRate * elapsed / decimal_t{kSecondsPerYear});
}

//-------------------------------------------------------------------------

decimal_t SimulatedYieldVault::totalAssets() const noexcept
{
    return m_underlying->balanceOf(m_self);
}

//-------------------------------------------------------------------------

SimulatedYieldVault::Snapshot SimulatedYieldVault::snapshot() const
{
    return {.shares = m_shares.snapshot(), .lastAccrual = m_lastAccrual};
}

//-------------------------------------------------------------------------

void SimulatedYieldVault::restore(Snapshot snapshot) noexcept
{
    m_shares.restore(std::move(snapshot.shares));
    m_lastAccrual = snapshot.lastAccrual;
}

//-------------------------------------------------------------------------

void SimulatedYieldVault::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("asset", rapidjson::Value{asset().c_str(), allocator}, allocator);
        json::addDecimalMember(json, "totalAssets", totalAssets());
        json::addDecimalMember(json, "annualYieldRate", m_annualYieldRate);
        m_shares.jsonSerialize(json, "shares");
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

accounting::SharePool SimulatedYieldVault::pool() const noexcept
{
    return {.totalAssets = totalAssets(), .totalShares = m_shares.totalSupply()};
}

//-------------------------------------------------------------------------

void SimulatedYieldVault::spendAllowance(
    const AccountId& owner, const AccountId& caller, decimal_t shares)
{
    if (caller != owner) {
        m_shares.spendAllowance(owner, caller, shares);
    }
}

//-------------------------------------------------------------------------

}  // namespace loopvault::yield

//-------------------------------------------------------------------------
