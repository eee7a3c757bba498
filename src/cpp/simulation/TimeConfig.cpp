/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "loopvault/simulation/TimeConfig.hpp"

#include <optional>
#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace loopvault::simulation
{

//-------------------------------------------------------------------------

TimeConfig::TimeConfig(Timestamp start, Timestamp duration, Timestamp step, Timescale scale)
    : start{start}, duration{duration}, step{step}, scale{scale}
{
    if (step == 0) {
        throw std::invalid_argument{fmt::format(
            "{}: step must be positive", std::source_location::current().function_name())};
    }
}

//-------------------------------------------------------------------------

TimeConfig TimeConfig::fromXML(pugi::xml_node node)
{
    auto timescaleFallback = [] {
        static constexpr auto fallback = Timescale::s;
        fmt::print("Unknown or missing attribute 'timescale', falling back to '{}'\n", fallback);
        return std::make_optional(fallback);
    };

    return TimeConfig{
        node.attribute("start").as_ullong(),
        node.attribute("duration").as_ullong(),
        node.attribute("step").as_ullong(1),
        magic_enum::enum_cast<Timescale>(
            node.attribute("timescale").as_string()).or_else(timescaleFallback).value()};
}

//-------------------------------------------------------------------------

}  // namespace loopvault::simulation

//-------------------------------------------------------------------------
