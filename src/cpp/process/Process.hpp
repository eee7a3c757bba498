/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

//-------------------------------------------------------------------------

namespace loopvault::process
{

//-------------------------------------------------------------------------

class Process
{
public:
    using ValueSignal = UnsyncSignal<void(double)>;

    virtual ~Process() noexcept = default;

    virtual void update(Timestamp timestamp) = 0;
    [[nodiscard]] virtual double value() const = 0;

    [[nodiscard]] ValueSignal& valueSignal() noexcept { return m_valueSignal; }
    [[nodiscard]] Timestamp updatePeriod() const noexcept { return m_updatePeriod; }

protected:
    Process() noexcept = default;

    ValueSignal m_valueSignal;
    Timestamp m_updatePeriod{1};
};

//-------------------------------------------------------------------------

}  // namespace loopvault::process

//-------------------------------------------------------------------------
