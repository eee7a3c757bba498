/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <cstdint>
#include <random>

//-------------------------------------------------------------------------

namespace loopvault::process
{

// Counts draws so a run can report how far its stream advanced.
class RNG : public std::mt19937
{
public:
    explicit RNG(uint64_t seed = std::mt19937::default_seed) noexcept;

    result_type operator()();

    [[nodiscard]] uint64_t seed() const noexcept { return m_seed; }
    [[nodiscard]] uint64_t callCount() const noexcept { return m_callCount; }

private:
    uint64_t m_seed;
    uint64_t m_callCount{};
};

}  // namespace loopvault::process

//-------------------------------------------------------------------------
