/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Process.hpp"
#include "RNG.hpp"

//-------------------------------------------------------------------------

namespace loopvault::process
{

//-------------------------------------------------------------------------

struct GBMDesc
{
    double X0;
    // Annualized drift and volatility.
    double mu;
    double sigma;
    uint64_t seed;
    Timestamp start{};
    Timestamp updatePeriod{1};
};

//-------------------------------------------------------------------------

// Geometric Brownian motion sampled at simulation timestamps, with time
// measured in years.
class GBM : public Process
{
public:
    explicit GBM(const GBMDesc& desc);

    [[nodiscard]] virtual double value() const override { return m_value; }
    [[nodiscard]] const RNG& rng() const noexcept { return m_rng; }

    virtual void update(Timestamp timestamp) override;

    [[nodiscard]] static std::unique_ptr<GBM> fromXML(
        pugi::xml_node node, Timestamp start = {}, uint64_t seedShift = {});

private:
    RNG m_rng;
    double m_X0, m_mu, m_sigma;
    Timestamp m_start, m_last;
    double m_W{};
    std::normal_distribution<double> m_gaussian{0.0, 1.0};
    double m_value;
};

//-------------------------------------------------------------------------

}  // namespace loopvault::process

//-------------------------------------------------------------------------
