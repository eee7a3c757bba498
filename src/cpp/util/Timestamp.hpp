/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <cstdint>

//-------------------------------------------------------------------------

// Seconds since the start of the simulated chain.
using Timestamp = uint64_t;

inline constexpr Timestamp TIMESTAMP_INVALID = 0;

inline constexpr Timestamp kSecondsPerHour = 3'600;
inline constexpr Timestamp kSecondsPerDay = 24 * kSecondsPerHour;
inline constexpr Timestamp kSecondsPerYear = 365 * kSecondsPerDay;

//-------------------------------------------------------------------------
