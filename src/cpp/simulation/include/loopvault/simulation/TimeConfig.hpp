/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Timestamp.hpp"

#include <fmt/format.h>
#include <magic_enum.hpp>
#include <pugixml.hpp>

#include <array>
#include <utility>

//-------------------------------------------------------------------------

namespace loopvault::simulation
{

//-------------------------------------------------------------------------

enum class Timescale { s, min, h, d };

inline constexpr auto kTimescaleCount = magic_enum::enum_count<Timescale>();

inline constexpr std::array<Timestamp, kTimescaleCount> timescaleFactor{
    1,
    60,
    kSecondsPerHour,
    kSecondsPerDay
};

[[nodiscard]] inline constexpr Timestamp timescaleToFactor(Timescale ts) noexcept
{
    return timescaleFactor[std::to_underlying(ts)];
}

//-------------------------------------------------------------------------

// start, duration and step are in units of scale.
struct TimeConfig
{
    Timestamp start{}, duration{}, step{};
    Timescale scale{};

    TimeConfig() noexcept = default;
    TimeConfig(Timestamp start, Timestamp duration, Timestamp step, Timescale scale);

    [[nodiscard]] Timestamp startSeconds() const noexcept { return start * timescaleToFactor(scale); }
    [[nodiscard]] Timestamp durationSeconds() const noexcept
    {
        return duration * timescaleToFactor(scale);
    }
    [[nodiscard]] Timestamp stepSeconds() const noexcept { return step * timescaleToFactor(scale); }

    [[nodiscard]] static TimeConfig fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

}  // namespace loopvault::simulation

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<loopvault::simulation::Timescale>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(loopvault::simulation::Timescale ts, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(ts));
    }
};

//-------------------------------------------------------------------------
