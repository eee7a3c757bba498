/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "GBM.hpp"

#include <cmath>

//-------------------------------------------------------------------------

namespace loopvault::process
{

//-------------------------------------------------------------------------

GBM::GBM(const GBMDesc& desc)
    : m_rng{desc.seed},
      m_X0{desc.X0},
      m_mu{desc.mu},
      m_sigma{desc.sigma},
      m_start{desc.start},
      m_last{desc.start},
      m_value{desc.X0}
{
    if (!(m_X0 > 0.0) || m_sigma < 0.0) {
        throw std::invalid_argument{fmt::format(
            "{}: GBM requires X0 > 0 and sigma >= 0, got X0 = {}, sigma = {}",
            std::source_location::current().function_name(), m_X0, m_sigma)};
    }
    m_updatePeriod = std::max<Timestamp>(desc.updatePeriod, 1);
}

//-------------------------------------------------------------------------

void GBM::update(Timestamp timestamp)
{
    if (timestamp < m_last + m_updatePeriod) return;

    static constexpr double kYear = static_cast<double>(kSecondsPerYear);
    const double dt = static_cast<double>(timestamp - m_last) / kYear;
    const double t = static_cast<double>(timestamp - m_start) / kYear;
    m_last = timestamp;
    m_W += std::sqrt(dt) * m_gaussian(m_rng);
    m_value = m_X0 * std::exp((m_mu - 0.5 * m_sigma * m_sigma) * t + m_sigma * m_W);
    m_valueSignal(m_value);
}

//-------------------------------------------------------------------------

std::unique_ptr<GBM> GBM::fromXML(pugi::xml_node node, Timestamp start, uint64_t seedShift)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    auto getNonNegativeAttribute = [&](const char* name) {
        pugi::xml_attribute attr = node.attribute(name);
        if (double value = attr.as_double(); attr.empty() || value < 0.0) {
            throw std::invalid_argument(fmt::format(
                "{}: Attribute '{}' must be non-negative", ctx, name));
        } else {
            return value;
        }
    };

    const uint64_t seed = [&] {
        pugi::xml_attribute attr;
        if (attr = node.attribute("seed"); attr.empty()) {
            throw std::invalid_argument(fmt::format(
                "{}: Missing required attribute '{}'", ctx, "seed"));
        }
        return attr.as_ullong();
    }();

    return std::make_unique<GBM>(GBMDesc{
        .X0 = getNonNegativeAttribute("X0"),
        .mu = node.attribute("mu").as_double(),
        .sigma = getNonNegativeAttribute("sigma"),
        .seed = seed + seedShift,
        .start = start,
        .updatePeriod = node.attribute("updatePeriod").as_ullong(1)
    });
}

//-------------------------------------------------------------------------

}  // namespace loopvault::process

//-------------------------------------------------------------------------
