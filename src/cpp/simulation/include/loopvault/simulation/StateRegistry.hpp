/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Snapshotable.hpp"

#include <functional>
#include <string>
#include <vector>

//-------------------------------------------------------------------------

namespace loopvault::simulation
{

//-------------------------------------------------------------------------

// Restores every tracked participant on destruction unless committed.
class Transaction
{
public:
    using Restorer = std::function<void()>;

    explicit Transaction(std::vector<Restorer> restorers) noexcept;
    ~Transaction() noexcept;

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction(Transaction&& other) noexcept;
    Transaction& operator=(Transaction&& other) = delete;

    void commit() noexcept { m_committed = true; }
    void rollback() noexcept;

    [[nodiscard]] bool committed() const noexcept { return m_committed; }

private:
    std::vector<Restorer> m_restorers;
    bool m_committed{};
};

//-------------------------------------------------------------------------

// The set of mutable state an operation may touch. Opening a transaction
// snapshots all of it.
class StateRegistry
{
public:
    template<serialization::Snapshotable T>
    void track(T& participant, std::string label = {})
    {
        m_labels.push_back(std::move(label));
        m_checkpointers.push_back([&participant] -> Transaction::Restorer {
            return [&participant, snapshot = participant.snapshot()] {
                participant.restore(snapshot);
            };
        });
    }

    [[nodiscard]] Transaction begin() const;

    [[nodiscard]] size_t size() const noexcept { return m_checkpointers.size(); }
    [[nodiscard]] const std::vector<std::string>& labels() const noexcept { return m_labels; }

private:
    std::vector<std::function<Transaction::Restorer()>> m_checkpointers;
    std::vector<std::string> m_labels;
};

//-------------------------------------------------------------------------

}  // namespace loopvault::simulation

//-------------------------------------------------------------------------
