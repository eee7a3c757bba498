/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "loopvault/vault/RebalancingController.hpp"

#include "VaultException.hpp"

//-------------------------------------------------------------------------

namespace loopvault::vault
{

//-------------------------------------------------------------------------

RebalancingController::PhaseGuard::PhaseGuard(RebalancePhase& phase)
    : m_phase{phase}
{
    if (m_phase == RebalancePhase::REBALANCING) {
        throw ReentrancyError{fmt::format(
            "{}: Rebalance already in progress",
            std::source_location::current().function_name())};
    }
    m_phase = RebalancePhase::REBALANCING;
}

//-------------------------------------------------------------------------

RebalancingController::RebalancingController(const RebalancingControllerDesc& desc)
    : m_config{desc.config},
      m_self{desc.self},
      m_market{desc.market},
      m_oracle{desc.oracle},
      m_yieldTarget{desc.yieldTarget},
      m_swapRouter{desc.swapRouter},
      m_rewards{desc.rewards},
      m_clock{desc.clock},
      m_valueDecimals{desc.valueDecimals},
      m_assetDecimals{desc.assetDecimals},
      m_borrowDecimals{desc.borrowDecimals}
{
    if (m_market == nullptr || m_oracle == nullptr || m_yieldTarget == nullptr
        || m_swapRouter == nullptr || m_rewards == nullptr || m_clock == nullptr) {
        throw std::invalid_argument{fmt::format(
            "{}: Collaborators must not be null",
            std::source_location::current().function_name())};
    }
    m_config.validate();
    m_state.lastRebalanceTimestamp = m_clock->now();
}

//-------------------------------------------------------------------------

bool RebalancingController::isRebalanceDue() const
{
    const auto position = m_market->getAccountPosition(m_self);
    if (position.collateralValue == 0_dec) return false;

    const Timestamp now = m_clock->now();
    if (now > m_state.lastRebalanceTimestamp
        && now - m_state.lastRebalanceTimestamp > m_config.rebalanceInterval) {
        return true;
    }
    const decimal_t ltv = ltvOf(position);
    return ltv < m_config.lowerBoundLtvRatio() || ltv > m_config.upperBoundLtvRatio();
}

//-------------------------------------------------------------------------

RebalanceReport RebalancingController::rebalance(const AccountId& caller)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    PhaseGuard guard{m_phase};

    if (getCollateralValue() == 0_dec) {
        throw PreconditionError{
            ErrorCode::ZERO_COLLATERAL,
            fmt::format("{}: {} holds no collateral", ctx, m_self)};
    }
    if (!isRebalanceDue()) {
        throw PreconditionError{
            ErrorCode::REBALANCE_NOT_DUE,
            fmt::format(
                "{}: Last rebalance at {} is within {}s of {} and LTV {} is within [{}, {}]",
                ctx, m_state.lastRebalanceTimestamp, m_config.rebalanceInterval,
                m_clock->now(), getCurrentLtv(),
                m_config.lowerBoundLtvRatio(), m_config.upperBoundLtvRatio())};
    }

    RebalanceReport report{.timestamp = m_clock->now(), .keeper = caller};
    report.harvest = harvest();
    report.recenter = recenter();
    m_state.lastRebalanceTimestamp = m_clock->now();
    report.rewardShares = m_rewards->accrue(caller);
    return report;
}

//-------------------------------------------------------------------------

decimal_t RebalancingController::getCollateralValue() const
{
    return m_market->getAccountPosition(m_self).collateralValue;
}

//-------------------------------------------------------------------------

decimal_t RebalancingController::getDebtValue() const
{
    return m_market->getAccountPosition(m_self).debtValue;
}

//-------------------------------------------------------------------------

decimal_t RebalancingController::getCurrentLtv() const
{
    return ltvOf(m_market->getAccountPosition(m_self));
}

//-------------------------------------------------------------------------

decimal_t RebalancingController::ltvOf(const market::AccountPosition& position) const
{
    if (position.collateralValue == 0_dec) {
        throw PreconditionError{
            ErrorCode::ZERO_COLLATERAL,
            fmt::format(
                "{}: LTV is undefined without collateral",
                std::source_location::current().function_name())};
    }
    return util::div(
        position.debtValue, position.collateralValue, util::kRatioDecimals, Rounding::UP);
}

//-------------------------------------------------------------------------

decimal_t RebalancingController::priceOf(const AssetId& asset) const
{
    return oracle::requirePrice(
        *m_oracle,
        asset,
        oracle::PriceRequirements{.now = m_clock->now(), .maxAge = m_config.maxOracleAge});
}

//-------------------------------------------------------------------------

HarvestResult RebalancingController::harvest()
{
    const AssetId& borrowAsset = m_config.borrowAsset;

    const decimal_t debtBalance = m_market->debtBalanceOf(borrowAsset, m_self);
    const decimal_t targetBalance =
        m_yieldTarget->convertToAssets(m_yieldTarget->balanceOf(m_self));
    if (targetBalance <= debtBalance) return {};

    const decimal_t surplus = std::min(
        targetBalance - debtBalance, m_yieldTarget->maxWithdraw(m_self));
    if (surplus == 0_dec) return {};

    const decimal_t expectedOut = util::mulDiv(
        surplus, priceOf(borrowAsset), priceOf(m_config.asset), m_assetDecimals, Rounding::DOWN);
    const decimal_t minAmountOut = util::mul(
        expectedOut, util::dec1m(m_config.swapSlippageRatio()), m_assetDecimals, Rounding::DOWN);

    m_yieldTarget->withdraw(m_self, surplus, m_self, m_self);
    const decimal_t proceeds = m_swapRouter->swapExactInput(
        m_self,
        swap::SwapRequest{
            .assetIn = borrowAsset,
            .assetOut = m_config.asset,
            .amountIn = surplus,
            .minAmountOut = minAmountOut,
            .receiver = m_self
        });
    if (proceeds > 0_dec) {
        m_market->supply(m_self, m_config.asset, proceeds);
    }
    return {.harvested = surplus, .proceeds = proceeds};
}

//-------------------------------------------------------------------------

RecenterResult RebalancingController::recenter()
{
    const AssetId& borrowAsset = m_config.borrowAsset;
    const auto position = m_market->getAccountPosition(m_self);

    RecenterResult result{
        .collateralValue = position.collateralValue,
        .debtValue = position.debtValue,
        .currentLtv = ltvOf(position)
    };

    const decimal_t speed = m_config.recenteringSpeedRatio();
    result.estimatedLtv =
        util::mul(result.currentLtv, util::dec1m(speed), util::kRatioDecimals, Rounding::DOWN)
        + util::mul(m_config.targetLtvRatio(), speed, util::kRatioDecimals, Rounding::DOWN);
    result.newLtv = util::clamp(
        result.estimatedLtv, m_config.lowerBoundLtvRatio(), m_config.upperBoundLtvRatio());
    result.newDebtValue = util::mul(
        position.collateralValue, result.newLtv, m_valueDecimals, Rounding::DOWN);

    const decimal_t price = priceOf(borrowAsset);

    if (result.newDebtValue > position.debtValue) {
        const decimal_t amount = util::div(
            result.newDebtValue - position.debtValue, price, m_borrowDecimals, Rounding::DOWN);
        if (amount == 0_dec) return result;
        m_market->borrow(m_self, borrowAsset, amount, m_self);
        m_yieldTarget->deposit(m_self, amount, m_self);
        result.borrowed = amount;
    }
    else if (result.newDebtValue < position.debtValue) {
        const decimal_t amount = util::div(
            position.debtValue - result.newDebtValue, price, m_borrowDecimals, Rounding::DOWN);
        const decimal_t shares = std::min(
            m_yieldTarget->convertToShares(amount), m_yieldTarget->balanceOf(m_self));
        if (shares == 0_dec || m_yieldTarget->convertToAssets(shares) == 0_dec) return result;
        const decimal_t redeemed = m_yieldTarget->redeem(m_self, shares, m_self, m_self);
        result.repaid = m_market->repay(m_self, borrowAsset, redeemed);
    }

    return result;
}

//-------------------------------------------------------------------------

}  // namespace loopvault::vault

//-------------------------------------------------------------------------
