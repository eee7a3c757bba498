/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "formatting.hpp"
#include "mocks.hpp"
#include "loopvault/vault/RebalancingController.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace loopvault;
using namespace loopvault::vault;
using namespace loopvault::literals;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

constexpr Timestamp kStart = 1'700'000'000;

VaultConfig makeConfig()
{
    return {
        .owner = "deployer",
        .name = "Looped WETH",
        .symbol = "lvWETH",
        .asset = "WETH",
        .borrowAsset = "USDC",
        .targetLtv = 600'000,
        .lowerBoundLtv = 500'000,
        .upperBoundLtv = 700'000,
        .recenteringSpeed = 200'000,
        .rebalanceInterval = kSecondsPerDay,
        .annualFeeRate = 20'000'000'000'000'000,
        .swapSlippage = 20'000
    };
}

}  // namespace

//-------------------------------------------------------------------------

struct RebalancingControllerTest : Test
{
    void SetUp() override
    {
        ON_CALL(market, getAccountPosition(Eq("vault")))
            .WillByDefault([this](const AccountId&) { return position; });
        ON_CALL(oracle, getPrice(Eq("USDC"))).WillByDefault([this](const AssetId&) {
            return oracle::PriceQuote{.price = usdcPrice, .updatedAt = clock.now()};
        });
        ON_CALL(oracle, getPrice(Eq("WETH"))).WillByDefault([this](const AssetId&) {
            return oracle::PriceQuote{.price = 2000_dec, .updatedAt = clock.now()};
        });
        ON_CALL(yieldTarget, convertToAssets(_)).WillByDefault(ReturnArg<0>());
        ON_CALL(yieldTarget, convertToShares(_)).WillByDefault(ReturnArg<0>());

        shares.mint("alice", 1'000_dec);
    }

    simulation::Clock clock{kStart};
    market::AccountPosition position{};
    decimal_t usdcPrice{1};
    NiceMock<test::MockLendingMarket> market;
    NiceMock<test::MockPriceOracle> oracle;
    NiceMock<test::MockYieldTarget> yieldTarget;
    NiceMock<test::MockSwapRouter> router;
    accounting::Ledger shares{accounting::LedgerDesc{.symbol = "lvWETH", .decimals = 8}};
    RewardAccrual rewards{&shares, makeConfig().annualFeeRateRatio(), kSecondsPerDay};
    RebalancingController controller{RebalancingControllerDesc{
        .config = makeConfig(),
        .self = "vault",
        .market = &market,
        .oracle = &oracle,
        .yieldTarget = &yieldTarget,
        .swapRouter = &router,
        .rewards = &rewards,
        .clock = &clock,
        .borrowDecimals = 6
    }};
};

//-------------------------------------------------------------------------

TEST_F(RebalancingControllerTest, LowerBoundIsNotDue)
{
    position = {.collateralValue = 200'000_dec, .debtValue = 100'000_dec};

    EXPECT_CALL(market, borrow(_, _, _, _)).Times(0);
    EXPECT_CALL(market, repay(_, _, _)).Times(0);

    EXPECT_EQ(controller.getCurrentLtv(), DEC(0.5));
    EXPECT_FALSE(controller.isRebalanceDue());
    EXPECT_FALSE(controller.isRebalanceDue());
    EXPECT_VAULT_ERROR(controller.rebalance("keeper"), ErrorCode::REBALANCE_NOT_DUE);
    EXPECT_EQ(shares.balanceOf("keeper"), 0_dec);
    EXPECT_EQ(controller.phase(), RebalancePhase::SETTLED);
}

TEST_F(RebalancingControllerTest, IntervalMustBeExceeded)
{
    position = {.collateralValue = 200'000_dec, .debtValue = 120'000_dec};

    clock.advance(kSecondsPerDay);
    EXPECT_FALSE(controller.isRebalanceDue());
    clock.advance(1);
    EXPECT_TRUE(controller.isRebalanceDue());
}

TEST_F(RebalancingControllerTest, RepaysDownToTheUpperBound)
{
    position = {.collateralValue = 200'000_dec, .debtValue = 150'000_dec};
    ON_CALL(market, debtBalanceOf(Eq("USDC"), Eq("vault"))).WillByDefault(Return(150'000_dec));
    ON_CALL(yieldTarget, balanceOf(Eq("vault"))).WillByDefault(Return(50'000_dec));

    {
        InSequence seq;
        EXPECT_CALL(yieldTarget, redeem(Eq("vault"), Eq(10'000_dec), Eq("vault"), Eq("vault")))
            .WillOnce(Return(10'000_dec));
        EXPECT_CALL(market, repay(Eq("vault"), Eq("USDC"), Eq(10'000_dec)))
            .WillOnce(Return(10'000_dec));
    }
    EXPECT_CALL(market, borrow(_, _, _, _)).Times(0);

    const auto report = controller.rebalance("keeper");
    EXPECT_EQ(report.recenter.currentLtv, DEC(0.75));
    EXPECT_EQ(report.recenter.estimatedLtv, DEC(0.72));
    EXPECT_EQ(report.recenter.newLtv, DEC(0.7));
    EXPECT_EQ(report.recenter.newDebtValue, 140'000_dec);
    EXPECT_EQ(report.recenter.repaid, 10'000_dec);
    EXPECT_EQ(report.recenter.borrowed, 0_dec);
}

TEST_F(RebalancingControllerTest, RepayIsLimitedByYieldShares)
{
    position = {.collateralValue = 200'000_dec, .debtValue = 150'000_dec};
    ON_CALL(yieldTarget, balanceOf(Eq("vault"))).WillByDefault(Return(4'000_dec));
    ON_CALL(market, debtBalanceOf(_, _)).WillByDefault(Return(150'000_dec));

    EXPECT_CALL(yieldTarget, redeem(_, Eq(4'000_dec), _, _)).WillOnce(Return(4'000_dec));
    EXPECT_CALL(market, repay(_, _, Eq(4'000_dec))).WillOnce(Return(4'000_dec));

    EXPECT_EQ(controller.rebalance("keeper").recenter.repaid, 4'000_dec);
}

TEST_F(RebalancingControllerTest, HarvestRealizesYieldAsCollateral)
{
    position = {.collateralValue = 200'000_dec, .debtValue = 120'000_dec};
    ON_CALL(market, debtBalanceOf(Eq("USDC"), Eq("vault"))).WillByDefault(Return(900_dec));
    ON_CALL(yieldTarget, balanceOf(Eq("vault"))).WillByDefault(Return(1'000_dec));
    ON_CALL(yieldTarget, maxWithdraw(Eq("vault"))).WillByDefault(Return(1'000_dec));
    clock.advance(kSecondsPerDay + 1);

    {
        InSequence seq;
        EXPECT_CALL(yieldTarget, withdraw(Eq("vault"), Eq(100_dec), Eq("vault"), Eq("vault")))
            .WillOnce(Return(100_dec));
        EXPECT_CALL(
            router,
            swapExactInput(
                Eq("vault"),
                AllOf(
                    Field(&swap::SwapRequest::assetIn, Eq("USDC")),
                    Field(&swap::SwapRequest::assetOut, Eq("WETH")),
                    Field(&swap::SwapRequest::amountIn, Eq(100_dec)),
                    Field(&swap::SwapRequest::minAmountOut, Eq(DEC(0.049))),
                    Field(&swap::SwapRequest::receiver, Eq("vault")))))
            .WillOnce(Return(DEC(0.0499)));
        EXPECT_CALL(market, supply(Eq("vault"), Eq("WETH"), Eq(DEC(0.0499))));
    }
    EXPECT_CALL(market, borrow(_, _, _, _)).Times(0);
    EXPECT_CALL(market, repay(_, _, _)).Times(0);

    const auto report = controller.rebalance("keeper");
    EXPECT_EQ(report.harvest.harvested, 100_dec);
    EXPECT_EQ(report.harvest.proceeds, DEC(0.0499));
    EXPECT_EQ(report.recenter.newLtv, DEC(0.6));
    EXPECT_EQ(controller.lastRebalanceTimestamp(), clock.now());
}

TEST_F(RebalancingControllerTest, HarvestWithoutProfitIsANoop)
{
    position = {.collateralValue = 200'000_dec, .debtValue = 120'000_dec};
    ON_CALL(market, debtBalanceOf(Eq("USDC"), Eq("vault"))).WillByDefault(Return(1'000_dec));
    ON_CALL(yieldTarget, balanceOf(Eq("vault"))).WillByDefault(Return(900_dec));
    clock.advance(kSecondsPerDay + 1);

    EXPECT_CALL(yieldTarget, withdraw(_, _, _, _)).Times(0);
    EXPECT_CALL(router, swapExactInput(_, _)).Times(0);
    EXPECT_CALL(market, supply(_, _, _)).Times(0);

    const auto report = controller.rebalance("keeper");
    EXPECT_EQ(report.harvest.harvested, 0_dec);
    EXPECT_EQ(report.harvest.proceeds, 0_dec);
}

TEST_F(RebalancingControllerTest, FailedOracleBlocksBorrowing)
{
    position = {.collateralValue = 200'000_dec, .debtValue = 98'000_dec};
    usdcPrice = 0_dec;

    EXPECT_CALL(market, borrow(_, _, _, _)).Times(0);
    EXPECT_THROW(controller.rebalance("keeper"), OracleError);
    EXPECT_EQ(controller.phase(), RebalancePhase::SETTLED);
    EXPECT_EQ(controller.lastRebalanceTimestamp(), kStart);

    EXPECT_CALL(oracle, getPrice(Eq("USDC")))
        .WillRepeatedly(Throw(std::runtime_error{"feed offline"}));
    EXPECT_THROW(controller.rebalance("keeper"), OracleError);
}

TEST_F(RebalancingControllerTest, NestedRebalanceIsRejected)
{
    position = {.collateralValue = 200'000_dec, .debtValue = 98'000_dec};

    EXPECT_CALL(market, borrow(_, _, _, _))
        .WillOnce([this](const AccountId&, const AssetId&, decimal_t, const AccountId&) {
            EXPECT_EQ(controller.phase(), RebalancePhase::REBALANCING);
            EXPECT_THROW(controller.rebalance("mallory"), ReentrancyError);
        });

    const auto report = controller.rebalance("keeper");
    EXPECT_EQ(report.recenter.borrowed, 4'400_dec);
    EXPECT_EQ(controller.phase(), RebalancePhase::SETTLED);
    EXPECT_EQ(shares.balanceOf("mallory"), 0_dec);
}

TEST_F(RebalancingControllerTest, ZeroCollateral)
{
    position = {};

    EXPECT_FALSE(controller.isRebalanceDue());
    EXPECT_VAULT_ERROR(controller.rebalance("keeper"), ErrorCode::ZERO_COLLATERAL);
    EXPECT_VAULT_ERROR((void)controller.getCurrentLtv(), ErrorCode::ZERO_COLLATERAL);
}

//-------------------------------------------------------------------------

struct RecenterBorrowTestParams
{
    decimal_t usdcPrice;
    decimal_t refBorrowed;
};

void PrintTo(const RecenterBorrowTestParams& params, std::ostream* os)
{
    *os << fmt::format(
        "{{.usdcPrice = {}, .refBorrowed = {}}}", params.usdcPrice, params.refBorrowed);
}

struct RecenterBorrowTest
    : RebalancingControllerTest, WithParamInterface<RecenterBorrowTestParams>
{};

TEST_P(RecenterBorrowTest, BorrowsTheValueDeltaAtOraclePrice)
{
    const auto [price, refBorrowed] = GetParam();
    usdcPrice = price;
    position = {.collateralValue = 200'000_dec, .debtValue = 98'000_dec};

    {
        InSequence seq;
        EXPECT_CALL(market, borrow(Eq("vault"), Eq("USDC"), Eq(refBorrowed), Eq("vault")));
        EXPECT_CALL(yieldTarget, deposit(Eq("vault"), Eq(refBorrowed), Eq("vault")))
            .WillOnce(Return(refBorrowed));
    }

    EXPECT_TRUE(controller.isRebalanceDue());
    const auto report = controller.rebalance("keeper");

    EXPECT_EQ(report.keeper, "keeper");
    EXPECT_EQ(report.recenter.currentLtv, DEC(0.49));
    EXPECT_EQ(report.recenter.estimatedLtv, DEC(0.512));
    EXPECT_EQ(report.recenter.newLtv, DEC(0.512));
    EXPECT_EQ(report.recenter.newDebtValue, 102'400_dec);
    EXPECT_EQ(report.recenter.borrowed, refBorrowed);
    EXPECT_EQ(report.rewardShares, DEC(0.05479452));
    EXPECT_EQ(shares.balanceOf("keeper"), DEC(0.05479452));
}

INSTANTIATE_TEST_SUITE_P(
    RebalancingControllerTests,
    RecenterBorrowTest,
    Values(
        RecenterBorrowTestParams{.usdcPrice = 1_dec, .refBorrowed = 4'400_dec},
        RecenterBorrowTestParams{.usdcPrice = 2_dec, .refBorrowed = 2'200_dec},
        RecenterBorrowTestParams{.usdcPrice = DEC(0.8), .refBorrowed = 5'500_dec},
        RecenterBorrowTestParams{.usdcPrice = 3_dec, .refBorrowed = DEC(1466.666666)}));

//-------------------------------------------------------------------------
