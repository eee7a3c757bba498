/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Timestamp.hpp"

#include <fmt/format.h>

#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace loopvault::simulation
{

//-------------------------------------------------------------------------

// The simulated block time. Time only moves forward.
class Clock
{
public:
    explicit Clock(Timestamp start = {}) noexcept : m_now{start} {}

    [[nodiscard]] Timestamp now() const noexcept { return m_now; }

    void advance(Timestamp delta) noexcept { m_now += delta; }

    void set(Timestamp timestamp)
    {
        if (timestamp < m_now) {
            throw std::invalid_argument{fmt::format(
                "{}: Cannot move clock backwards from {} to {}",
                std::source_location::current().function_name(), m_now, timestamp)};
        }
        m_now = timestamp;
    }

private:
    Timestamp m_now;
};

//-------------------------------------------------------------------------

}  // namespace loopvault::simulation

//-------------------------------------------------------------------------
