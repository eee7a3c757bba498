/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "loopvault/vault/LeveragedVault.hpp"

#include "VaultException.hpp"

//-------------------------------------------------------------------------

namespace loopvault::vault
{

//-------------------------------------------------------------------------

LeveragedVault::LeveragedVault(const LeveragedVaultDesc& desc)
    : m_self{checked(desc).self},
      m_config{desc.config},
      m_clock{desc.clock},
      m_registry{desc.registry},
      m_engine{AccountingEngineDesc{
          .self = desc.self,
          .shares = accounting::LedgerDesc{
              .symbol = desc.config.symbol,
              .decimals = desc.config.shareDecimals,
              .name = desc.config.name
          },
          .asset = desc.asset,
          .market = desc.market
      }},
      m_rewards{&m_engine.shares(), desc.config.annualFeeRateRatio(), desc.config.rebalanceInterval},
      m_controller{RebalancingControllerDesc{
          .config = desc.config,
          .self = desc.self,
          .market = desc.market,
          .oracle = desc.oracle,
          .yieldTarget = desc.yieldTarget,
          .swapRouter = desc.swapRouter,
          .rewards = &m_rewards,
          .clock = desc.clock,
          .assetDecimals = desc.asset->decimals(),
          .borrowDecimals = desc.borrowAsset->decimals()
      }}
{
    validateReserves(*desc.market);
    m_registry->track(m_engine.shares(), m_config.symbol);
    m_registry->track(m_controller, fmt::format("{}.controller", m_config.symbol));
}

//-------------------------------------------------------------------------

decimal_t LeveragedVault::deposit(
    const AccountId& caller, decimal_t assets, const AccountId& receiver)
{
    requireSettled(std::source_location::current());
    auto tx = m_registry->begin();
    const decimal_t shares = m_engine.deposit(caller, assets, receiver);
    tx.commit();
    m_signals.deposit(DepositEvent{
        .timestamp = m_clock->now(),
        .caller = caller,
        .receiver = receiver,
        .assets = m_engine.asset().roundDown(assets),
        .shares = shares
    });
    return shares;
}

//-------------------------------------------------------------------------

decimal_t LeveragedVault::mint(
    const AccountId& caller, decimal_t shares, const AccountId& receiver)
{
    requireSettled(std::source_location::current());
    auto tx = m_registry->begin();
    const decimal_t assets = m_engine.mint(caller, shares, receiver);
    tx.commit();
    m_signals.deposit(DepositEvent{
        .timestamp = m_clock->now(),
        .caller = caller,
        .receiver = receiver,
        .assets = assets,
        .shares = m_engine.shares().roundDown(shares)
    });
    return assets;
}

//-------------------------------------------------------------------------

decimal_t LeveragedVault::withdraw(
    const AccountId& caller,
    decimal_t assets,
    const AccountId& receiver,
    const AccountId& owner)
{
    requireSettled(std::source_location::current());
    auto tx = m_registry->begin();
    const decimal_t shares = m_engine.withdraw(caller, assets, receiver, owner);
    tx.commit();
    m_signals.withdraw(WithdrawEvent{
        .timestamp = m_clock->now(),
        .caller = caller,
        .receiver = receiver,
        .owner = owner,
        .assets = m_engine.asset().roundDown(assets),
        .shares = shares
    });
    return shares;
}

//-------------------------------------------------------------------------

decimal_t LeveragedVault::redeem(
    const AccountId& caller,
    decimal_t shares,
    const AccountId& receiver,
    const AccountId& owner)
{
    requireSettled(std::source_location::current());
    auto tx = m_registry->begin();
    const decimal_t assets = m_engine.redeem(caller, shares, receiver, owner);
    tx.commit();
    m_signals.withdraw(WithdrawEvent{
        .timestamp = m_clock->now(),
        .caller = caller,
        .receiver = receiver,
        .owner = owner,
        .assets = assets,
        .shares = m_engine.shares().roundDown(shares)
    });
    return assets;
}

//-------------------------------------------------------------------------

RebalanceReport LeveragedVault::rebalance(const AccountId& caller)
{
    auto tx = m_registry->begin();
    auto report = m_controller.rebalance(caller);
    tx.commit();
    m_signals.rebalance(report);
    return report;
}

//-------------------------------------------------------------------------

decimal_t LeveragedVault::balanceOf(const AccountId& account) const noexcept
{
    return m_engine.shares().balanceOf(account);
}

//-------------------------------------------------------------------------

void LeveragedVault::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("asset", rapidjson::Value{m_config.asset.c_str(), allocator}, allocator);
        json.AddMember(
            "borrowAsset", rapidjson::Value{m_config.borrowAsset.c_str(), allocator}, allocator);
        json.AddMember(
            "phase",
            rapidjson::Value{
                std::string{magic_enum::enum_name(m_controller.phase())}.c_str(), allocator},
            allocator);
        json.AddMember(
            "lastRebalanceTimestamp",
            rapidjson::Value{m_controller.lastRebalanceTimestamp()},
            allocator);
        json::addDecimalMember(json, "totalAssets", totalAssets());
        const decimal_t collateralValue = getCollateralValue();
        json::addDecimalMember(json, "collateralValue", collateralValue);
        json::addDecimalMember(json, "debtValue", getDebtValue());
        if (collateralValue > 0_dec) {
            json::addDecimalMember(json, "ltv", getCurrentLtv());
        }
        m_engine.shares().jsonSerialize(json, "shares");
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

const LeveragedVaultDesc& LeveragedVault::checked(const LeveragedVaultDesc& desc)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    desc.config.validate();
    if (desc.self.empty()) {
        throw std::invalid_argument{fmt::format("{}: Vault account must be named", ctx)};
    }
    if (desc.asset == nullptr || desc.borrowAsset == nullptr || desc.market == nullptr
        || desc.oracle == nullptr || desc.yieldTarget == nullptr || desc.swapRouter == nullptr
        || desc.clock == nullptr || desc.registry == nullptr) {
        throw std::invalid_argument{fmt::format("{}: Collaborators must not be null", ctx)};
    }
    if (desc.asset->symbol() != desc.config.asset
        || desc.borrowAsset->symbol() != desc.config.borrowAsset) {
        throw ConfigurationError{fmt::format(
            "{}: Ledgers {}/{} do not match configured assets {}/{}",
            ctx, desc.asset->symbol(), desc.borrowAsset->symbol(),
            desc.config.asset, desc.config.borrowAsset)};
    }
    if (desc.yieldTarget->asset() != desc.config.borrowAsset) {
        throw ConfigurationError{fmt::format(
            "{}: Yield target holds {}, expected {}",
            ctx, desc.yieldTarget->asset(), desc.config.borrowAsset)};
    }
    return desc;
}

//-------------------------------------------------------------------------

void LeveragedVault::validateReserves(const market::LendingMarket& market) const
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const auto collateral = market.getReserveStatus(m_config.asset);
    if (!collateral.isActive || !collateral.isCollateralEligible) {
        throw PreconditionError{
            ErrorCode::RESERVE_NOT_ELIGIBLE,
            fmt::format("{}: {} is not an active collateral reserve", ctx, m_config.asset)};
    }
    if (collateral.maxLtv < m_config.upperBoundLtvRatio()) {
        throw PreconditionError{
            ErrorCode::RESERVE_NOT_ELIGIBLE,
            fmt::format(
                "{}: {} allows a max LTV of {}, below the upper bound {}",
                ctx, m_config.asset, collateral.maxLtv, m_config.upperBoundLtvRatio())};
    }
    const auto debt = market.getReserveStatus(m_config.borrowAsset);
    if (!debt.isActive || !debt.isBorrowable) {
        throw PreconditionError{
            ErrorCode::RESERVE_NOT_ELIGIBLE,
            fmt::format("{}: {} is not an active borrowable reserve", ctx, m_config.borrowAsset)};
    }
}

//-------------------------------------------------------------------------

void LeveragedVault::requireSettled(std::source_location sl) const
{
    if (m_controller.phase() == RebalancePhase::REBALANCING) {
        throw ReentrancyError{fmt::format(
            "{}: Vault is rebalancing", sl.function_name())};
    }
}

//-------------------------------------------------------------------------

}  // namespace loopvault::vault

//-------------------------------------------------------------------------
