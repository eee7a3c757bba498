/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <bdldfp_decimal.h>
#include <bdldfp_decimalconvertutil.h>
#include <bdldfp_decimalutil.h>
#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <spanstream>

//-------------------------------------------------------------------------

#define DEC(lit) BDLDFP_DECIMAL_DD(lit)

//-------------------------------------------------------------------------

namespace loopvault
{

using decimal_t = BloombergLP::bdldfp::Decimal64;

enum class Rounding : uint8_t
{
    DOWN,
    UP
};

}  // namespace loopvault

//-------------------------------------------------------------------------

namespace loopvault::util
{

inline constexpr uint32_t kDefaultDecimalPlaces = 8;

// Ratios (LTVs, speeds, rates) carry six implied decimal digits. Results of
// mul, div and mulDiv must fit 16 significant digits after rounding.
inline constexpr uint32_t kRatioDecimals = 6;
inline constexpr uint32_t kPpmScale = 1'000'000;

// Per-period fee rates are kept at 1e-18 resolution.
inline constexpr uint32_t kFeeRateDecimals = 18;
inline constexpr uint64_t kWadScale = 1'000'000'000'000'000'000ull;

[[nodiscard]] inline decimal_t round(
    decimal_t val, uint32_t decimalPlaces = kDefaultDecimalPlaces)
{
    return BloombergLP::bdldfp::DecimalUtil::trunc(val, decimalPlaces);
}

[[nodiscard]] inline decimal_t roundUp(decimal_t val, uint32_t decimalPlaces)
{
    using namespace BloombergLP::bdldfp;
    const auto factor = DecimalUtil::multiplyByPowerOf10(decimal_t{1}, decimalPlaces);
    return DecimalUtil::ceil(val * factor) / factor;
}

// Half away from zero.
[[nodiscard]] inline decimal_t roundNearest(decimal_t val, uint32_t decimalPlaces)
{
    return BloombergLP::bdldfp::DecimalUtil::round(val, decimalPlaces);
}

[[nodiscard]] inline decimal_t round(decimal_t val, uint32_t decimalPlaces, Rounding rounding)
{
    return rounding == Rounding::UP ? roundUp(val, decimalPlaces) : round(val, decimalPlaces);
}

namespace detail
{

using wide_decimal_t = BloombergLP::bdldfp::Decimal128;

// Products of two Decimal64 values are exact in 34 digits, so the directed
// rounding below is the only inexact step short of quotients.
[[nodiscard]] inline decimal_t narrow(
    wide_decimal_t val, uint32_t decimalPlaces, Rounding rounding)
{
    using namespace BloombergLP::bdldfp;
    if (rounding == Rounding::UP) {
        const auto factor = DecimalUtil::multiplyByPowerOf10(wide_decimal_t{1}, decimalPlaces);
        return decimal_t{DecimalUtil::ceil(val * factor) / factor};
    }
    return decimal_t{DecimalUtil::trunc(val, decimalPlaces)};
}

}  // namespace detail

// a * b / c, rounded at decimalPlaces in the requested direction.
[[nodiscard]] inline decimal_t mulDiv(
    decimal_t a, decimal_t b, decimal_t c, uint32_t decimalPlaces, Rounding rounding)
{
    using detail::wide_decimal_t;
    return detail::narrow(
        wide_decimal_t{a} * wide_decimal_t{b} / wide_decimal_t{c}, decimalPlaces, rounding);
}

[[nodiscard]] inline decimal_t mul(
    decimal_t a, decimal_t b, uint32_t decimalPlaces, Rounding rounding)
{
    using detail::wide_decimal_t;
    return detail::narrow(wide_decimal_t{a} * wide_decimal_t{b}, decimalPlaces, rounding);
}

[[nodiscard]] inline decimal_t div(
    decimal_t a, decimal_t b, uint32_t decimalPlaces, Rounding rounding)
{
    using detail::wide_decimal_t;
    return detail::narrow(wide_decimal_t{a} / wide_decimal_t{b}, decimalPlaces, rounding);
}

[[nodiscard]] inline decimal_t ppm2ratio(uint64_t ppm)
{
    return decimal_t{ppm} / decimal_t{kPpmScale};
}

[[nodiscard]] inline uint64_t ratio2ppm(decimal_t ratio)
{
    const decimal_t scaled = round(ratio * decimal_t{kPpmScale}, 0);
    return static_cast<uint64_t>(
        BloombergLP::bdldfp::DecimalConvertUtil::decimalToDouble(scaled));
}

[[nodiscard]] inline decimal_t wad2ratio(uint64_t wad)
{
    return decimal_t{wad} / decimal_t{kWadScale};
}

[[nodiscard]] inline double decimal2double(decimal_t val)
{
    return BloombergLP::bdldfp::DecimalConvertUtil::decimalToDouble(val);
}

[[nodiscard]] inline decimal_t double2decimal(
    double val, uint32_t decimalPlaces = kDefaultDecimalPlaces)
{
    return round(decimal_t{val}, decimalPlaces);
}

[[nodiscard]] inline decimal_t dec1m(decimal_t val) noexcept
{
    return 1 - val;
}

[[nodiscard]] inline decimal_t abs(decimal_t val) noexcept
{
    return val < decimal_t{} ? -val : val;
}

[[nodiscard]] inline decimal_t clamp(decimal_t val, decimal_t lo, decimal_t hi) noexcept
{
    return std::min(std::max(val, lo), hi);
}

[[nodiscard]] inline decimal_t maxDecimal() noexcept
{
    return std::numeric_limits<decimal_t>::max();
}

}  // namespace loopvault::util

//-------------------------------------------------------------------------

namespace loopvault::literals
{

[[nodiscard]] constexpr decimal_t operator"" _dec(unsigned long long int val)
{
    return decimal_t{val};
}

}  // namespace loopvault::literals

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<loopvault::decimal_t>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(loopvault::decimal_t val, FormatContext& ctx) const
    {
        using namespace loopvault::literals;
        char buf[32]{};
        std::ospanstream oss{buf};
        if (val == 0_dec) [[unlikely]] {
            oss << "0.0";
        } else {
            oss << val;
        }
        return fmt::format_to(ctx.out(), "{}", buf);
    }
};

//-------------------------------------------------------------------------
