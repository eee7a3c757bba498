/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "loopvault/simulation/StateRegistry.hpp"

#include <algorithm>
#include <iterator>
#include <ranges>
#include <utility>

//-------------------------------------------------------------------------

namespace loopvault::simulation
{

//-------------------------------------------------------------------------

Transaction::Transaction(std::vector<Restorer> restorers) noexcept
    : m_restorers{std::move(restorers)}
{}

//-------------------------------------------------------------------------

Transaction::~Transaction() noexcept
{
    if (!m_committed) {
        rollback();
    }
}

//-------------------------------------------------------------------------

Transaction::Transaction(Transaction&& other) noexcept
    : m_restorers{std::move(other.m_restorers)},
      m_committed{std::exchange(other.m_committed, true)}
{}

//-------------------------------------------------------------------------

void Transaction::rollback() noexcept
{
    for (auto& restore : m_restorers | std::views::reverse) {
        restore();
    }
    m_restorers.clear();
    m_committed = true;
}

//-------------------------------------------------------------------------

Transaction StateRegistry::begin() const
{
    std::vector<Transaction::Restorer> restorers;
    restorers.reserve(m_checkpointers.size());
    std::ranges::transform(
        m_checkpointers,
        std::back_inserter(restorers),
        [](const auto& checkpoint) { return checkpoint(); });
    return Transaction{std::move(restorers)};
}

//-------------------------------------------------------------------------

}  // namespace loopvault::simulation

//-------------------------------------------------------------------------
