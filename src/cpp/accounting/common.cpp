/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "loopvault/accounting/common.hpp"

#include <fmt/format.h>

#include <stdexcept>

//-------------------------------------------------------------------------

namespace loopvault::accounting
{

uint32_t validateDecimalPlaces(uint32_t decimalPlaces, std::source_location sl)
{
    if (!(decimalPlaces > 0 && decimalPlaces <= kMaxTokenDecimals)) {
        throw std::invalid_argument{fmt::format(
            "{}: decimalPlaces should be in [1,{}], was {}",
            sl.function_name(), kMaxTokenDecimals, decimalPlaces)};
    }
    return decimalPlaces;
}

}  // namespace loopvault::accounting

//-------------------------------------------------------------------------
