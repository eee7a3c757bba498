/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "common.hpp"
#include "loopvault/accounting/common.hpp"

//-------------------------------------------------------------------------

namespace loopvault::accounting
{

//-------------------------------------------------------------------------

struct LedgerDesc
{
    std::string symbol;
    uint32_t decimals;
    std::string name = {};
};

// An empty 'from' is a mint, an empty 'to' is a burn.
struct TransferEvent
{
    AccountId from;
    AccountId to;
    decimal_t amount;
};

struct LedgerState
{
    std::map<AccountId, decimal_t> balances;
    std::map<AccountId, std::map<AccountId, decimal_t>> allowances;
    decimal_t totalSupply{};
};

//-------------------------------------------------------------------------

class Ledger : public JsonSerializable
{
public:
    using Snapshot = LedgerState;
    using TransferSignal = UnsyncSignal<void(const TransferEvent&)>;

    explicit Ledger(const LedgerDesc& desc);

    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    [[nodiscard]] const std::string& symbol() const noexcept { return m_symbol; }
    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] uint32_t decimals() const noexcept { return m_decimals; }
    [[nodiscard]] decimal_t totalSupply() const noexcept { return m_state.totalSupply; }
    [[nodiscard]] decimal_t balanceOf(const AccountId& account) const noexcept;
    [[nodiscard]] decimal_t allowance(
        const AccountId& owner, const AccountId& spender) const noexcept;
    [[nodiscard]] TransferSignal& transferSignal() noexcept { return m_transferSignal; }

    [[nodiscard]] decimal_t roundDown(decimal_t amount) const;
    [[nodiscard]] decimal_t roundUp(decimal_t amount) const;

    void mint(const AccountId& to, decimal_t amount);
    void burn(const AccountId& from, decimal_t amount);
    void transfer(const AccountId& from, const AccountId& to, decimal_t amount);
    void approve(const AccountId& owner, const AccountId& spender, decimal_t amount);
    void spendAllowance(const AccountId& owner, const AccountId& spender, decimal_t amount);

    [[nodiscard]] Snapshot snapshot() const { return m_state; }
    void restore(Snapshot snapshot) noexcept { m_state = std::move(snapshot); }

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    [[nodiscard]] static bool isUnlimited(decimal_t allowance) noexcept;
    [[nodiscard]] static LedgerDesc descFromXML(pugi::xml_node node);

private:
    [[nodiscard]] decimal_t checkAmount(decimal_t amount, std::source_location sl) const;
    void debit(const AccountId& account, decimal_t amount, std::source_location sl);
    void checkConsistency(const AccountId& account, std::source_location sl) const;

    std::string m_symbol;
    std::string m_name;
    uint32_t m_decimals;
    LedgerState m_state;
    TransferSignal m_transferSignal;
};

//-------------------------------------------------------------------------

}  // namespace loopvault::accounting

//-------------------------------------------------------------------------
