/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <cstdint>
#include <source_location>

//-------------------------------------------------------------------------

namespace loopvault::accounting
{

// Token amounts are truncated to at most this many decimals, the precision
// a Decimal64 keeps for balances in the 1e8 range.
inline constexpr uint32_t kMaxTokenDecimals = 8;

uint32_t validateDecimalPlaces(
    uint32_t decimalPlaces, std::source_location sl = std::source_location::current());

}  // namespace loopvault::accounting

//-------------------------------------------------------------------------
