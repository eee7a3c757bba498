/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "formatting.hpp"
#include "loopvault/market/SimulatedLendingMarket.hpp"
#include "loopvault/oracle/FeedPriceOracle.hpp"

#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace loopvault;
using namespace loopvault::market;
using namespace loopvault::literals;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

constexpr Timestamp kStart = 1'000'000;

}  // namespace

struct SimulatedLendingMarketTest : Test
{
    void SetUp() override
    {
        oracle.setPrice("WETH", 2000_dec);
        oracle.setPrice("USDC", 1_dec);
        market.listReserve(
            &weth,
            ReserveConfig{
                .collateralEnabled = true,
                .maxLtv = DEC(0.8),
                .liquidationThreshold = DEC(0.825)
            });
        market.listReserve(
            &usdc, ReserveConfig{.borrowEnabled = true, .borrowRate = DEC(0.1)});
        usdc.mint("market", 1'000'000_dec);
        weth.mint("alice", 10_dec);
    }

    simulation::Clock clock{kStart};
    accounting::Ledger weth{accounting::LedgerDesc{.symbol = "WETH", .decimals = 8}};
    accounting::Ledger usdc{accounting::LedgerDesc{.symbol = "USDC", .decimals = 6}};
    oracle::FeedPriceOracle oracle{&clock};
    SimulatedLendingMarket market{SimulatedLendingMarketDesc{
        .self = "market", .oracle = &oracle, .clock = &clock
    }};
};

//-------------------------------------------------------------------------

TEST_F(SimulatedLendingMarketTest, SupplyAndWithdrawEverything)
{
    market.supply("alice", "WETH", 10_dec);
    EXPECT_EQ(weth.balanceOf("alice"), 0_dec);
    EXPECT_EQ(weth.balanceOf("market"), 10_dec);
    EXPECT_EQ(market.collateralBalanceOf("WETH", "alice"), 10_dec);

    const auto position = market.getAccountPosition("alice");
    EXPECT_EQ(position.collateralValue, 20'000_dec);
    EXPECT_EQ(position.debtValue, 0_dec);

    EXPECT_EQ(market.withdraw("alice", "WETH", util::maxDecimal(), "bob"), 10_dec);
    EXPECT_EQ(weth.balanceOf("bob"), 10_dec);
    EXPECT_EQ(market.collateralBalanceOf("WETH", "alice"), 0_dec);
}

TEST_F(SimulatedLendingMarketTest, BorrowIsCappedByMaxLtv)
{
    market.supply("alice", "WETH", 10_dec);

    EXPECT_VAULT_ERROR(
        market.borrow("alice", "USDC", DEC(16000.000001), "alice"),
        ErrorCode::BORROW_CAPACITY_EXCEEDED);
    EXPECT_EQ(market.debtBalanceOf("USDC", "alice"), 0_dec);
    EXPECT_EQ(usdc.balanceOf("alice"), 0_dec);

    market.borrow("alice", "USDC", 16'000_dec, "alice");
    EXPECT_EQ(market.debtBalanceOf("USDC", "alice"), 16'000_dec);
    EXPECT_EQ(usdc.balanceOf("alice"), 16'000_dec);
    EXPECT_EQ(market.getAccountPosition("alice").debtValue, 16'000_dec);
}

TEST_F(SimulatedLendingMarketTest, WithdrawIsCappedByLiquidationThreshold)
{
    market.supply("alice", "WETH", 10_dec);
    market.borrow("alice", "USDC", 16'000_dec, "alice");

    // 9.9 WETH still covers 16335 at the liquidation threshold, 9 only 14850.
    EXPECT_EQ(market.withdraw("alice", "WETH", DEC(0.1), "alice"), DEC(0.1));
    EXPECT_VAULT_ERROR(
        market.withdraw("alice", "WETH", DEC(0.9), "alice"), ErrorCode::UNHEALTHY_POSITION);
    EXPECT_EQ(market.collateralBalanceOf("WETH", "alice"), DEC(9.9));
    EXPECT_EQ(weth.balanceOf("alice"), DEC(0.1));
}

TEST_F(SimulatedLendingMarketTest, WithdrawMoreThanSuppliedFails)
{
    market.supply("alice", "WETH", 1_dec);
    EXPECT_VAULT_ERROR(
        market.withdraw("alice", "WETH", DEC(1.00000001), "alice"),
        ErrorCode::INSUFFICIENT_BALANCE);
}

TEST_F(SimulatedLendingMarketTest, DebtAccruesInterest)
{
    market.supply("alice", "WETH", 10_dec);
    market.borrow("alice", "USDC", 1'000_dec, "alice");

    clock.advance(kSecondsPerYear / 2);
    EXPECT_EQ(market.borrowIndex("USDC"), DEC(1.05));
    EXPECT_EQ(market.debtBalanceOf("USDC", "alice"), 1'050_dec);

    usdc.mint("alice", 50_dec);
    EXPECT_EQ(market.repay("alice", "USDC", util::maxDecimal()), 1'050_dec);
    EXPECT_EQ(market.debtBalanceOf("USDC", "alice"), 0_dec);
    EXPECT_EQ(usdc.balanceOf("alice"), 0_dec);
}

TEST_F(SimulatedLendingMarketTest, RepayIsCappedByDebt)
{
    market.supply("alice", "WETH", 10_dec);
    market.borrow("alice", "USDC", 100_dec, "alice");
    usdc.mint("alice", 100_dec);

    EXPECT_EQ(market.repay("alice", "USDC", 40_dec), 40_dec);
    EXPECT_EQ(market.debtBalanceOf("USDC", "alice"), 60_dec);
    EXPECT_EQ(market.repay("alice", "USDC", 500_dec), 60_dec);
    EXPECT_EQ(usdc.balanceOf("alice"), 100_dec);
}

TEST_F(SimulatedLendingMarketTest, BorrowNeedsLiquidity)
{
    usdc.burn("market", 999'900_dec);
    market.supply("alice", "WETH", 10_dec);
    EXPECT_VAULT_ERROR(
        market.borrow("alice", "USDC", 1'000_dec, "alice"), ErrorCode::INSUFFICIENT_LIQUIDITY);
}

TEST_F(SimulatedLendingMarketTest, OracleFailureLeavesNoDebt)
{
    market.supply("alice", "WETH", 10_dec);
    oracle.setPrice("WETH", 0_dec);

    EXPECT_THROW(market.borrow("alice", "USDC", 100_dec, "alice"), OracleError);
    EXPECT_EQ(market.debtBalanceOf("USDC", "alice"), 0_dec);
    EXPECT_EQ(usdc.balanceOf("alice"), 0_dec);
}

TEST_F(SimulatedLendingMarketTest, IneligibleReserves)
{
    EXPECT_VAULT_ERROR(
        market.borrow("alice", "WETH", 1_dec, "alice"), ErrorCode::RESERVE_NOT_ELIGIBLE);
    EXPECT_VAULT_ERROR(market.supply("alice", "DAI", 1_dec), ErrorCode::RESERVE_NOT_ELIGIBLE);

    const auto unknown = market.getReserveStatus("DAI");
    EXPECT_FALSE(unknown.isActive);
    EXPECT_FALSE(unknown.isCollateralEligible);

    const auto collateral = market.getReserveStatus("WETH");
    EXPECT_TRUE(collateral.isCollateralEligible);
    EXPECT_FALSE(collateral.isBorrowable);
    EXPECT_EQ(collateral.maxLtv, DEC(0.8));
}

TEST_F(SimulatedLendingMarketTest, RestoreReturnsToSnapshot)
{
    market.supply("alice", "WETH", 10_dec);
    const auto snapshot = market.snapshot();

    market.borrow("alice", "USDC", 100_dec, "alice");
    market.restore(snapshot);

    EXPECT_EQ(market.debtBalanceOf("USDC", "alice"), 0_dec);
    EXPECT_EQ(market.collateralBalanceOf("WETH", "alice"), 10_dec);
}

//-------------------------------------------------------------------------

TEST(ReserveConfigTest, FromXML)
{
    pugi::xml_document doc;
    ASSERT_TRUE(doc.load_string(
        R"(<Reserve symbol="WETH" collateralEnabled="true" maxLtv="800000" borrowRate="25000"/>)"));
    const auto config = ReserveConfig::fromXML(doc.child("Reserve"));
    EXPECT_TRUE(config.active);
    EXPECT_TRUE(config.collateralEnabled);
    EXPECT_FALSE(config.borrowEnabled);
    EXPECT_EQ(config.maxLtv, DEC(0.8));
    EXPECT_EQ(config.liquidationThreshold, DEC(0.8));
    EXPECT_EQ(config.borrowRate, DEC(0.025));
}

TEST(ReserveConfigTest, ThresholdBelowMaxLtvIsRejected)
{
    pugi::xml_document doc;
    ASSERT_TRUE(doc.load_string(
        R"(<Reserve symbol="WETH" maxLtv="800000" liquidationThreshold="700000"/>)"));
    EXPECT_THROW((void)ReserveConfig::fromXML(doc.child("Reserve")), ConfigurationError);
}

//-------------------------------------------------------------------------
