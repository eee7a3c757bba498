/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <concepts>
#include <utility>

//-------------------------------------------------------------------------

namespace loopvault::serialization
{

// A participant of a transaction: it can hand out a copy of its mutable
// state and later be reset to it.
template<typename T>
concept Snapshotable = requires (T t, const T& ct) {
    { ct.snapshot() } -> std::copy_constructible;
    { t.restore(ct.snapshot()) } -> std::same_as<void>;
};

}  // namespace loopvault::serialization

//-------------------------------------------------------------------------
