/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "loopvault/decimal/decimal.hpp"

#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace loopvault;
using namespace loopvault::literals;

using namespace testing;

//-------------------------------------------------------------------------

struct RoundTestParams
{
    decimal_t value;
    uint32_t decimalPlaces;
    Rounding rounding;
    decimal_t refValue;
};

void PrintTo(const RoundTestParams& params, std::ostream* os)
{
    *os << fmt::format(
        "{{.value = {}, .decimalPlaces = {}, .rounding = {}, .refValue = {}}}",
        params.value,
        params.decimalPlaces,
        params.rounding == Rounding::UP ? "UP" : "DOWN",
        params.refValue);
}

struct RoundTest : TestWithParam<RoundTestParams> {};

TEST_P(RoundTest, WorksCorrectly)
{
    const auto [value, decimalPlaces, rounding, refValue] = GetParam();
    EXPECT_EQ(util::round(value, decimalPlaces, rounding), refValue);
}

INSTANTIATE_TEST_SUITE_P(
    DecimalTests,
    RoundTest,
    Values(
        RoundTestParams{
            .value = DEC(42.32125839), .decimalPlaces = 3,
            .rounding = Rounding::UP, .refValue = DEC(42.322)
        },
        RoundTestParams{
            .value = DEC(42.32125839), .decimalPlaces = 3,
            .rounding = Rounding::DOWN, .refValue = DEC(42.321)
        },
        RoundTestParams{
            .value = DEC(0.00005100), .decimalPlaces = 4,
            .rounding = Rounding::UP, .refValue = DEC(0.0001)
        },
        RoundTestParams{
            .value = DEC(0.00005100), .decimalPlaces = 4,
            .rounding = Rounding::DOWN, .refValue = DEC(0.0)
        },
        RoundTestParams{
            .value = DEC(420.6921), .decimalPlaces = 2,
            .rounding = Rounding::UP, .refValue = DEC(420.70)
        },
        RoundTestParams{
            .value = DEC(0.0), .decimalPlaces = 10,
            .rounding = Rounding::UP, .refValue = DEC(0.0)
        },
        RoundTestParams{
            .value = DEC(10000.1), .decimalPlaces = 0,
            .rounding = Rounding::UP, .refValue = DEC(10001.0)
        },
        RoundTestParams{
            .value = DEC(0.512), .decimalPlaces = 6,
            .rounding = Rounding::DOWN, .refValue = DEC(0.512)
        }
    ));

//-------------------------------------------------------------------------

TEST(DecimalTests, MulDivRoundsInTheRequestedDirection)
{
    EXPECT_EQ(util::mulDiv(1_dec, 1_dec, 3_dec, 6, Rounding::DOWN), DEC(0.333333));
    EXPECT_EQ(util::mulDiv(1_dec, 1_dec, 3_dec, 6, Rounding::UP), DEC(0.333334));
    EXPECT_EQ(util::mulDiv(98000_dec, 1_dec, 200000_dec, 6, Rounding::UP), DEC(0.49));
}

TEST(DecimalTests, MulDivRoundsOnceAtFullPrecision)
{
    // 10000000.0999999899999999 exactly.
    EXPECT_EQ(
        util::mulDiv(DEC(9999999.99999999), DEC(1.00000001), 1_dec, 8, Rounding::DOWN),
        DEC(10000000.09999998));
    EXPECT_EQ(
        util::mul(DEC(9999999.99999999), DEC(1.00000001), 8, Rounding::DOWN),
        DEC(10000000.09999998));
    // 10000000.1000000100000001 exactly.
    EXPECT_EQ(
        util::mulDiv(DEC(10000000.00000001), DEC(1.00000001), 1_dec, 8, Rounding::UP),
        DEC(10000000.10000002));
}

TEST(DecimalTests, RoundNearestGoesHalfAwayFromZero)
{
    EXPECT_EQ(util::roundNearest(DEC(1.23456785), 7), DEC(1.2345679));
    EXPECT_EQ(util::roundNearest(DEC(1.23456784), 7), DEC(1.2345678));
    EXPECT_EQ(util::roundNearest(DEC(99.999999999999), 8), 100_dec);
}

TEST(DecimalTests, FixedPointRatios)
{
    EXPECT_EQ(util::ppm2ratio(600'000), DEC(0.6));
    EXPECT_EQ(util::ppm2ratio(1), DEC(0.000001));
    EXPECT_EQ(util::ratio2ppm(DEC(0.512)), 512'000u);
    EXPECT_EQ(util::wad2ratio(20'000'000'000'000'000ull), DEC(0.02));
}

TEST(DecimalTests, Helpers)
{
    EXPECT_EQ(util::dec1m(DEC(0.2)), DEC(0.8));
    EXPECT_EQ(util::abs(DEC(-3.5)), DEC(3.5));
    EXPECT_EQ(util::clamp(DEC(0.45), DEC(0.5), DEC(0.7)), DEC(0.5));
    EXPECT_EQ(util::clamp(DEC(0.75), DEC(0.5), DEC(0.7)), DEC(0.7));
    EXPECT_EQ(util::clamp(DEC(0.6), DEC(0.5), DEC(0.7)), DEC(0.6));
    EXPECT_EQ(util::double2decimal(0.1 + 0.2), DEC(0.3));
    EXPECT_EQ(fmt::format("{}", 0_dec), "0.0");
}

//-------------------------------------------------------------------------
