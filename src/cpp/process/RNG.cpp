/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "RNG.hpp"

//-------------------------------------------------------------------------

namespace loopvault::process
{

//-------------------------------------------------------------------------

RNG::RNG(uint64_t seed) noexcept
    : std::mt19937{static_cast<result_type>(seed)}, m_seed{seed}
{}

//-------------------------------------------------------------------------

RNG::result_type RNG::operator()()
{
    ++m_callCount;
    return std::mt19937::operator()();
}

//-------------------------------------------------------------------------

}  // namespace loopvault::process

//-------------------------------------------------------------------------
