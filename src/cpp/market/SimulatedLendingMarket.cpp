/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "loopvault/market/SimulatedLendingMarket.hpp"

#include "VaultException.hpp"

//-------------------------------------------------------------------------

namespace loopvault::market
{

//-------------------------------------------------------------------------

ReserveConfig ReserveConfig::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const uint64_t maxLtv = node.attribute("maxLtv").as_ullong();
    const uint64_t liquidationThreshold =
        node.attribute("liquidationThreshold").as_ullong(maxLtv);
    if (maxLtv > liquidationThreshold || liquidationThreshold >= util::kPpmScale) {
        throw ConfigurationError{fmt::format(
            "{}: Reserve '{}' requires maxLtv <= liquidationThreshold < {}, got {} and {}",
            ctx, node.attribute("symbol").as_string(), util::kPpmScale,
            maxLtv, liquidationThreshold)};
    }

    return {
        .active = node.attribute("active").as_bool(true),
        .collateralEnabled = node.attribute("collateralEnabled").as_bool(),
        .borrowEnabled = node.attribute("borrowEnabled").as_bool(),
        .maxLtv = util::ppm2ratio(maxLtv),
        .liquidationThreshold = util::ppm2ratio(liquidationThreshold),
        .supplyRate = util::ppm2ratio(node.attribute("supplyRate").as_ullong()),
        .borrowRate = util::ppm2ratio(node.attribute("borrowRate").as_ullong())
    };
}

//-------------------------------------------------------------------------

SimulatedLendingMarket::SimulatedLendingMarket(const SimulatedLendingMarketDesc& desc)
    : m_self{desc.self},
      m_oracle{desc.oracle},
      m_clock{desc.clock},
      m_maxOracleAge{desc.maxOracleAge},
      m_valueDecimals{desc.valueDecimals}
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (m_self.empty()) {
        throw std::invalid_argument{fmt::format("{}: Market account must be named", ctx)};
    }
    if (m_oracle == nullptr || m_clock == nullptr) {
        throw std::invalid_argument{fmt::format("{}: oracle and clock must not be null", ctx)};
    }
}

//-------------------------------------------------------------------------

void SimulatedLendingMarket::listReserve(accounting::Ledger* token, const ReserveConfig& config)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (token == nullptr) {
        throw std::invalid_argument{fmt::format("{}: token must not be null", ctx)};
    }
    if (config.maxLtv > config.liquidationThreshold || config.liquidationThreshold >= 1_dec) {
        throw ConfigurationError{fmt::format(
            "{}: Reserve {} requires maxLtv <= liquidationThreshold < 1, got {} and {}",
            ctx, token->symbol(), config.maxLtv, config.liquidationThreshold)};
    }
    auto [it, inserted] = m_reserves.try_emplace(
        token->symbol(),
        Reserve{
            .token = token,
            .config = config,
            .state = ReserveState{.lastUpdate = m_clock->now()}
        });
    if (!inserted) {
        throw std::invalid_argument{fmt::format(
            "{}: Reserve {} is already listed", ctx, token->symbol())};
    }
}

//-------------------------------------------------------------------------

void SimulatedLendingMarket::supply(
    const AccountId& account, const AssetId& asset, decimal_t amount)
{
    static constexpr auto sl = std::source_location::current();

    auto& reserve = reserveAt(asset, sl);
    requireActive(asset, reserve, sl);
    amount = reserve.token->roundDown(amount);
    if (amount == 0_dec) return;

    accrue(reserve);
    reserve.token->transfer(account, m_self, amount);
    reserve.state.scaledCollateral[account] += amount / reserve.state.liquidityIndex;
}

//-------------------------------------------------------------------------

decimal_t SimulatedLendingMarket::withdraw(
    const AccountId& account, const AssetId& asset, decimal_t amount, const AccountId& to)
{
    static constexpr auto sl = std::source_location::current();

    auto& reserve = reserveAt(asset, sl);
    requireActive(asset, reserve, sl);
    accrue(reserve);

    const decimal_t balance = collateralBalanceOf(asset, account);
    amount = amount == util::maxDecimal() ? balance : reserve.token->roundDown(amount);
    if (amount == 0_dec) return {};
    if (amount > balance) {
        throw PreconditionError{
            ErrorCode::INSUFFICIENT_BALANCE,
            fmt::format(
                "{}: {} has {} {} supplied, requested {}",
                sl.function_name(), account, balance, asset, amount)};
    }
    requireLiquidity(reserve, amount, sl);

    auto& scaled = reserve.state.scaledCollateral;
    const decimal_t scaledBefore = scaled[account];
    if (amount == balance) {
        scaled.erase(account);
    } else {
        scaled[account] = scaledBefore - amount / reserve.state.liquidityIndex;
    }

    auto revert = [&] { scaled[account] = scaledBefore; };
    const auto valuation = [&] {
        try {
            return valuate(account);
        }
        catch (...) {
            revert();
            throw;
        }
    }();
    if (valuation.position.debtValue > valuation.liquidationCapacity) {
        revert();
        throw PreconditionError{
            ErrorCode::UNHEALTHY_POSITION,
            fmt::format(
                "{}: Withdrawing {} {} would leave {} with debt {} above liquidation capacity {}",
                sl.function_name(), amount, asset, account,
                valuation.position.debtValue, valuation.liquidationCapacity)};
    }

    reserve.token->transfer(m_self, to, amount);
    return amount;
}

//-------------------------------------------------------------------------

void SimulatedLendingMarket::borrow(
    const AccountId& account, const AssetId& asset, decimal_t amount, const AccountId& to)
{
    static constexpr auto sl = std::source_location::current();

    auto& reserve = reserveAt(asset, sl);
    requireActive(asset, reserve, sl);
    if (!reserve.config.borrowEnabled) {
        throw PreconditionError{
            ErrorCode::RESERVE_NOT_ELIGIBLE,
            fmt::format("{}: Borrowing is disabled on {}", sl.function_name(), asset)};
    }
    amount = reserve.token->roundDown(amount);
    if (amount == 0_dec) return;

    accrue(reserve);
    requireLiquidity(reserve, amount, sl);

    auto& scaled = reserve.state.scaledDebt;
    const decimal_t scaledBefore = scaled[account];
    scaled[account] = scaledBefore + amount / reserve.state.borrowIndex;

    auto revert = [&] {
        if (scaledBefore == 0_dec) {
            scaled.erase(account);
        } else {
            scaled[account] = scaledBefore;
        }
    };
    const auto valuation = [&] {
        try {
            return valuate(account);
        }
        catch (...) {
            revert();
            throw;
        }
    }();
    if (valuation.position.debtValue > valuation.borrowCapacity) {
        revert();
        throw PreconditionError{
            ErrorCode::BORROW_CAPACITY_EXCEEDED,
            fmt::format(
                "{}: Borrowing {} {} would take {} to debt {} over capacity {}",
                sl.function_name(), amount, asset, account,
                valuation.position.debtValue, valuation.borrowCapacity)};
    }

    reserve.token->transfer(m_self, to, amount);
}

//-------------------------------------------------------------------------

decimal_t SimulatedLendingMarket::repay(
    const AccountId& account, const AssetId& asset, decimal_t amount)
{
    static constexpr auto sl = std::source_location::current();

    auto& reserve = reserveAt(asset, sl);
    requireActive(asset, reserve, sl);
    accrue(reserve);

    const decimal_t debt = debtBalanceOf(asset, account);
    const decimal_t repaid = std::min(
        amount == util::maxDecimal() ? debt : reserve.token->roundDown(amount), debt);
    if (repaid == 0_dec) return {};

    reserve.token->transfer(account, m_self, repaid);
    auto& scaled = reserve.state.scaledDebt;
    if (repaid == debt) {
        scaled.erase(account);
    } else {
        scaled[account] = std::max(
            scaled[account] - repaid / reserve.state.borrowIndex, decimal_t{});
    }
    return repaid;
}

//-------------------------------------------------------------------------

AccountPosition SimulatedLendingMarket::getAccountPosition(const AccountId& account) const
{
    return valuate(account).position;
}

//-------------------------------------------------------------------------

ReserveStatus SimulatedLendingMarket::getReserveStatus(const AssetId& asset) const
{
    auto it = m_reserves.find(asset);
    if (it == m_reserves.end()) return {};
    const auto& config = it->second.config;
    return {
        .isActive = config.active,
        .isCollateralEligible = config.active && config.collateralEnabled,
        .isBorrowable = config.active && config.borrowEnabled,
        .maxLtv = config.maxLtv
    };
}

//-------------------------------------------------------------------------

decimal_t SimulatedLendingMarket::collateralBalanceOf(
    const AssetId& asset, const AccountId& account) const
{
    const auto& reserve = reserveAt(asset, std::source_location::current());
    auto it = reserve.state.scaledCollateral.find(account);
    if (it == reserve.state.scaledCollateral.end()) return {};
    return util::roundNearest(
        it->second * currentLiquidityIndex(reserve), reserve.token->decimals());
}

//-------------------------------------------------------------------------

decimal_t SimulatedLendingMarket::debtBalanceOf(
    const AssetId& asset, const AccountId& account) const
{
    const auto& reserve = reserveAt(asset, std::source_location::current());
    auto it = reserve.state.scaledDebt.find(account);
    if (it == reserve.state.scaledDebt.end()) return {};
    return util::roundNearest(
        it->second * currentBorrowIndex(reserve), reserve.token->decimals());
}

//-------------------------------------------------------------------------

void SimulatedLendingMarket::accrue()
{
    for (auto& reserve : m_reserves | views::values) {
        accrue(reserve);
    }
}

//-------------------------------------------------------------------------

const ReserveConfig& SimulatedLendingMarket::reserveConfig(const AssetId& asset) const
{
    return reserveAt(asset, std::source_location::current()).config;
}

//-------------------------------------------------------------------------

decimal_t SimulatedLendingMarket::liquidityIndex(const AssetId& asset) const
{
    return currentLiquidityIndex(reserveAt(asset, std::source_location::current()));
}

//-------------------------------------------------------------------------

decimal_t SimulatedLendingMarket::borrowIndex(const AssetId& asset) const
{
    return currentBorrowIndex(reserveAt(asset, std::source_location::current()));
}

//-------------------------------------------------------------------------

SimulatedLendingMarket::Snapshot SimulatedLendingMarket::snapshot() const
{
    Snapshot snapshot;
    for (const auto& [asset, reserve] : m_reserves) {
        snapshot.emplace(asset, reserve.state);
    }
    return snapshot;
}

//-------------------------------------------------------------------------

void SimulatedLendingMarket::restore(Snapshot snapshot) noexcept
{
    for (auto& [asset, state] : snapshot) {
        if (auto it = m_reserves.find(asset); it != m_reserves.end()) {
            it->second.state = std::move(state);
        }
    }
}

//-------------------------------------------------------------------------

void SimulatedLendingMarket::jsonSerialize(
    rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("account", rapidjson::Value{m_self.c_str(), allocator}, allocator);
        for (const auto& [asset, reserve] : m_reserves) {
            json::serializeHelper(
                json,
                asset,
                [&](rapidjson::Document& json) {
                    json.SetObject();
                    json::addDecimalMember(json, "liquidityIndex", currentLiquidityIndex(reserve));
                    json::addDecimalMember(json, "borrowIndex", currentBorrowIndex(reserve));
                    json::addDecimalMember(json, "liquidity", reserve.token->balanceOf(m_self));
                    json::addDecimalMember(
                        json,
                        "scaledCollateral",
                        ranges::accumulate(reserve.state.scaledCollateral | views::values, 0_dec));
                    json::addDecimalMember(
                        json,
                        "scaledDebt",
                        ranges::accumulate(reserve.state.scaledDebt | views::values, 0_dec));
                });
        }
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

SimulatedLendingMarket::Reserve& SimulatedLendingMarket::reserveAt(
    const AssetId& asset, std::source_location sl)
{
    return const_cast<Reserve&>(std::as_const(*this).reserveAt(asset, sl));
}

//-------------------------------------------------------------------------

const SimulatedLendingMarket::Reserve& SimulatedLendingMarket::reserveAt(
    const AssetId& asset, std::source_location sl) const
{
    auto it = m_reserves.find(asset);
    if (it == m_reserves.end()) {
        throw PreconditionError{
            ErrorCode::RESERVE_NOT_ELIGIBLE,
            fmt::format("{}: No reserve listed for {}", sl.function_name(), asset)};
    }
    return it->second;
}

//-------------------------------------------------------------------------

decimal_t SimulatedLendingMarket::currentLiquidityIndex(const Reserve& reserve) const noexcept
{
    return reserve.state.liquidityIndex
        * growth(reserve.config.supplyRate, reserve.state.lastUpdate);
}

//-------------------------------------------------------------------------

decimal_t SimulatedLendingMarket::currentBorrowIndex(const Reserve& reserve) const noexcept
{
    return reserve.state.borrowIndex
        * growth(reserve.config.borrowRate, reserve.state.lastUpdate);
}

//-------------------------------------------------------------------------

decimal_t SimulatedLendingMarket::growth(decimal_t rate, Timestamp since) const noexcept
{
    const Timestamp now = m_clock->now();
    if (now <= since || rate == 0_dec) return 1_dec;
    return 1_dec + rate * decimal_t{now - since} / decimal_t{kSecondsPerYear};
}

//-------------------------------------------------------------------------

SimulatedLendingMarket::Valuation SimulatedLendingMarket::valuate(const AccountId& account) const
{
    Valuation valuation;
    for (const auto& [asset, reserve] : m_reserves) {
        const decimal_t collateral = reserve.config.collateralEnabled
            ? collateralBalanceOf(asset, account) : decimal_t{};
        const decimal_t debt = debtBalanceOf(asset, account);
        if (collateral == 0_dec && debt == 0_dec) continue;

        const decimal_t price = oracle::requirePrice(
            *m_oracle,
            asset,
            oracle::PriceRequirements{.now = m_clock->now(), .maxAge = m_maxOracleAge});
        const decimal_t collateralValue = util::mul(
            collateral, price, m_valueDecimals, Rounding::DOWN);
        valuation.position.collateralValue += collateralValue;
        valuation.position.debtValue += util::mul(debt, price, m_valueDecimals, Rounding::UP);
        valuation.borrowCapacity += util::mul(
            collateralValue, reserve.config.maxLtv, m_valueDecimals, Rounding::DOWN);
        valuation.liquidationCapacity += util::mul(
            collateralValue, reserve.config.liquidationThreshold, m_valueDecimals, Rounding::DOWN);
    }
    return valuation;
}

//-------------------------------------------------------------------------

void SimulatedLendingMarket::accrue(Reserve& reserve) noexcept
{
    const Timestamp now = m_clock->now();
    if (now <= reserve.state.lastUpdate) return;
    reserve.state.liquidityIndex = currentLiquidityIndex(reserve);
    reserve.state.borrowIndex = currentBorrowIndex(reserve);
    reserve.state.lastUpdate = now;
}

//-------------------------------------------------------------------------

void SimulatedLendingMarket::requireActive(
    const AssetId& asset, const Reserve& reserve, std::source_location sl) const
{
    if (!reserve.config.active) {
        throw PreconditionError{
            ErrorCode::RESERVE_NOT_ELIGIBLE,
            fmt::format("{}: Reserve {} is inactive", sl.function_name(), asset)};
    }
}

//-------------------------------------------------------------------------

void SimulatedLendingMarket::requireLiquidity(
    const Reserve& reserve, decimal_t amount, std::source_location sl) const
{
    if (const decimal_t available = reserve.token->balanceOf(m_self); available < amount) {
        throw PreconditionError{
            ErrorCode::INSUFFICIENT_LIQUIDITY,
            fmt::format(
                "{}: Market holds {} {}, requested {}",
                sl.function_name(), available, reserve.token->symbol(), amount)};
    }
}

//-------------------------------------------------------------------------

}  // namespace loopvault::market

//-------------------------------------------------------------------------
