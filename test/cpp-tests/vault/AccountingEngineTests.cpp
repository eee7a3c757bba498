/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "formatting.hpp"
#include "mocks.hpp"
#include "loopvault/vault/AccountingEngine.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace loopvault;
using namespace loopvault::vault;
using namespace loopvault::literals;

using namespace testing;

//-------------------------------------------------------------------------

// The market mock keeps the vault's collateral in 'collateral' and pays
// withdrawals out by minting to the receiver.
struct AccountingEngineTest : Test
{
    void SetUp() override
    {
        ON_CALL(market, collateralBalanceOf(_, _))
            .WillByDefault([this](const AssetId&, const AccountId&) { return collateral; });
        ON_CALL(market, supply(_, _, _))
            .WillByDefault([this](const AccountId&, const AssetId&, decimal_t amount) {
                collateral += amount;
            });
        ON_CALL(market, withdraw(_, _, _, _))
            .WillByDefault([this](
                const AccountId&, const AssetId&, decimal_t amount, const AccountId& to) {
                collateral -= amount;
                weth.mint(to, amount);
                return amount;
            });

        weth.mint("alice", 100_dec);
        weth.mint("bob", 100_dec);
    }

    // Alice holds 10 shares backed by 11 WETH.
    void seedPool()
    {
        engine.deposit("alice", 10_dec, "alice");
        collateral += 1_dec;
    }

    decimal_t collateral{};
    NiceMock<test::MockLendingMarket> market;
    accounting::Ledger weth{accounting::LedgerDesc{.symbol = "WETH", .decimals = 8}};
    AccountingEngine engine{AccountingEngineDesc{
        .self = "vault",
        .shares = accounting::LedgerDesc{.symbol = "lvWETH", .decimals = 8},
        .asset = &weth,
        .market = &market
    }};
};

//-------------------------------------------------------------------------

TEST_F(AccountingEngineTest, DepositPullsSuppliesThenMints)
{
    EXPECT_CALL(market, supply(Eq("vault"), Eq("WETH"), Eq(10_dec)))
        .WillOnce([this](const AccountId&, const AssetId&, decimal_t amount) {
            EXPECT_EQ(weth.balanceOf("vault"), 10_dec);
            EXPECT_EQ(engine.totalShares(), 0_dec);
            collateral += amount;
        });

    EXPECT_EQ(engine.deposit("alice", 10_dec, "carol"), 10_dec);
    EXPECT_EQ(engine.shares().balanceOf("carol"), 10_dec);
    EXPECT_EQ(weth.balanceOf("alice"), 90_dec);
    EXPECT_EQ(engine.totalAssets(), 10_dec);
}

TEST_F(AccountingEngineTest, WithdrawBurnsBeforePayingOut)
{
    seedPool();

    EXPECT_CALL(market, withdraw(Eq("vault"), Eq("WETH"), Eq(DEC(1.1)), Eq("alice")))
        .WillOnce([this](const AccountId&, const AssetId&, decimal_t amount, const AccountId&) {
            EXPECT_EQ(engine.shares().balanceOf("alice"), 9_dec);
            collateral -= amount;
            return amount;
        });

    EXPECT_EQ(engine.withdraw("alice", DEC(1.1), "alice", "alice"), 1_dec);
    EXPECT_EQ(engine.totalShares(), 9_dec);
}

TEST_F(AccountingEngineTest, SharesTrackTheExchangeRate)
{
    seedPool();

    EXPECT_EQ(engine.convertToAssets(10_dec), 11_dec);
    EXPECT_EQ(engine.deposit("bob", DEC(2.2), "bob"), 2_dec);
    EXPECT_EQ(engine.redeem("bob", 2_dec, "bob", "bob"), DEC(2.2));
    EXPECT_EQ(weth.balanceOf("bob"), 100_dec);
    EXPECT_EQ(engine.maxWithdraw("alice"), 11_dec);
    EXPECT_EQ(engine.maxRedeem("alice"), 10_dec);
}

TEST_F(AccountingEngineTest, MintAndWithdrawRoundAgainstTheCaller)
{
    seedPool();

    EXPECT_EQ(engine.previewMint(DEC(0.33333333)), DEC(0.36666667));
    EXPECT_EQ(engine.previewDeposit(DEC(0.36666667)), DEC(0.33333333));
    EXPECT_EQ(engine.previewWithdraw(1_dec), DEC(0.90909091));
    EXPECT_EQ(engine.previewRedeem(DEC(0.90909091)), DEC(1.00000000));

    EXPECT_EQ(engine.mint("bob", DEC(0.33333333), "bob"), DEC(0.36666667));
    EXPECT_EQ(weth.balanceOf("bob"), DEC(99.63333333));
}

TEST_F(AccountingEngineTest, ZeroDepositMintsNothing)
{
    EXPECT_CALL(market, supply(_, _, _)).Times(0);

    EXPECT_VAULT_ERROR(engine.deposit("alice", 0_dec, "alice"), ErrorCode::ZERO_SHARES);
    EXPECT_EQ(weth.balanceOf("alice"), 100_dec);
    EXPECT_EQ(weth.balanceOf("vault"), 0_dec);
    EXPECT_EQ(engine.totalShares(), 0_dec);

    collateral = 10_dec;
    engine.shares().mint("alice", 10_dec);
    EXPECT_VAULT_ERROR(engine.deposit("bob", 0_dec, "bob"), ErrorCode::ZERO_SHARES);
    EXPECT_EQ(weth.balanceOf("bob"), 100_dec);
    EXPECT_EQ(weth.balanceOf("vault"), 0_dec);
    EXPECT_EQ(engine.totalShares(), 10_dec);
}

TEST_F(AccountingEngineTest, DustIsRejectedWithoutSideEffects)
{
    engine.deposit("alice", 10_dec, "alice");
    collateral = 20_dec;
    EXPECT_CALL(market, supply(_, _, _)).Times(0);
    EXPECT_VAULT_ERROR(engine.deposit("bob", DEC(0.00000001), "bob"), ErrorCode::ZERO_SHARES);
    EXPECT_VAULT_ERROR(engine.mint("bob", DEC(0.000000001), "bob"), ErrorCode::ZERO_SHARES);
    EXPECT_EQ(weth.balanceOf("bob"), 100_dec);

    collateral = 5_dec;
    EXPECT_CALL(market, withdraw(_, _, _, _)).Times(0);
    EXPECT_VAULT_ERROR(
        engine.redeem("alice", DEC(0.00000001), "alice", "alice"), ErrorCode::ZERO_ASSETS);
    EXPECT_EQ(engine.shares().balanceOf("alice"), 10_dec);
}

TEST_F(AccountingEngineTest, SharesWithoutCollateralCannotBePriced)
{
    engine.deposit("alice", 10_dec, "alice");
    collateral = 0_dec;
    EXPECT_VAULT_ERROR((void)engine.convertToAssets(1_dec), ErrorCode::ZERO_COLLATERAL);
    EXPECT_VAULT_ERROR(engine.deposit("bob", 1_dec, "bob"), ErrorCode::ZERO_COLLATERAL);
}

TEST_F(AccountingEngineTest, OverdrawingSharesFails)
{
    seedPool();
    EXPECT_VAULT_ERROR(
        engine.redeem("alice", DEC(10.00000001), "alice", "alice"),
        ErrorCode::INSUFFICIENT_BALANCE);
}

//-------------------------------------------------------------------------

struct WithdrawAllowanceTestParams
{
    decimal_t allowance;
    bool succeeds;
};

void PrintTo(const WithdrawAllowanceTestParams& params, std::ostream* os)
{
    *os << fmt::format("{{.allowance = {}, .succeeds = {}}}", params.allowance, params.succeeds);
}

struct WithdrawAllowanceTest
    : AccountingEngineTest, WithParamInterface<WithdrawAllowanceTestParams>
{};

TEST_P(WithdrawAllowanceTest, ThirdPartyWithdrawSpendsAllowance)
{
    const auto [allowance, succeeds] = GetParam();
    seedPool();
    engine.shares().approve("alice", "bob", allowance);

    // 1 WETH of 11 costs 10/11 shares, rounded up.
    if (succeeds) {
        EXPECT_EQ(engine.withdraw("bob", 1_dec, "bob", "alice"), DEC(0.90909091));
        EXPECT_EQ(engine.shares().allowance("alice", "bob"), 0_dec);
        EXPECT_EQ(weth.balanceOf("bob"), 101_dec);
    } else {
        EXPECT_THROW(engine.withdraw("bob", 1_dec, "bob", "alice"), AllowanceError);
        EXPECT_EQ(engine.shares().allowance("alice", "bob"), allowance);
        EXPECT_EQ(engine.shares().balanceOf("alice"), 10_dec);
    }
}

INSTANTIATE_TEST_SUITE_P(
    AccountingEngineTests,
    WithdrawAllowanceTest,
    Values(
        WithdrawAllowanceTestParams{.allowance = DEC(0.90909091), .succeeds = true},
        WithdrawAllowanceTestParams{.allowance = DEC(0.90909090), .succeeds = false}));

//-------------------------------------------------------------------------
