/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "loopvault/accounting/Ledger.hpp"

#include "VaultException.hpp"

//-------------------------------------------------------------------------

namespace loopvault::accounting
{

//-------------------------------------------------------------------------

Ledger::Ledger(const LedgerDesc& desc)
    : m_symbol{desc.symbol},
      m_name{desc.name.empty() ? desc.symbol : desc.name},
      m_decimals{validateDecimalPlaces(desc.decimals)}
{
    if (m_symbol.empty()) {
        throw std::invalid_argument{fmt::format(
            "{}: Ledger symbol must not be empty",
            std::source_location::current().function_name())};
    }
}

//-------------------------------------------------------------------------

decimal_t Ledger::balanceOf(const AccountId& account) const noexcept
{
    if (auto it = m_state.balances.find(account); it != m_state.balances.end()) {
        return it->second;
    }
    return {};
}

//-------------------------------------------------------------------------

decimal_t Ledger::allowance(const AccountId& owner, const AccountId& spender) const noexcept
{
    auto ownerIt = m_state.allowances.find(owner);
    if (ownerIt == m_state.allowances.end()) return {};
    auto it = ownerIt->second.find(spender);
    return it != ownerIt->second.end() ? it->second : decimal_t{};
}

//-------------------------------------------------------------------------

decimal_t Ledger::roundDown(decimal_t amount) const
{
    return util::round(amount, m_decimals, Rounding::DOWN);
}

//-------------------------------------------------------------------------

decimal_t Ledger::roundUp(decimal_t amount) const
{
    return util::round(amount, m_decimals, Rounding::UP);
}

//-------------------------------------------------------------------------

void Ledger::mint(const AccountId& to, decimal_t amount)
{
    static constexpr auto sl = std::source_location::current();

    amount = checkAmount(amount, sl);
    if (amount == 0_dec) return;

    m_state.balances[to] += amount;
    m_state.totalSupply += amount;
    checkConsistency(to, sl);

    m_transferSignal(TransferEvent{.from = {}, .to = to, .amount = amount});
}

//-------------------------------------------------------------------------

void Ledger::burn(const AccountId& from, decimal_t amount)
{
    static constexpr auto sl = std::source_location::current();

    amount = checkAmount(amount, sl);
    if (amount == 0_dec) return;

    debit(from, amount, sl);
    // Past 16 significant digits the running supply absorbs small mints, so
    // it can run out before the last holder burns.
    m_state.totalSupply = m_state.balances.empty()
        ? decimal_t{}
        : std::max(m_state.totalSupply - amount, decimal_t{});
    checkConsistency(from, sl);

    m_transferSignal(TransferEvent{.from = from, .to = {}, .amount = amount});
}

//-------------------------------------------------------------------------

void Ledger::transfer(const AccountId& from, const AccountId& to, decimal_t amount)
{
    static constexpr auto sl = std::source_location::current();

    amount = checkAmount(amount, sl);
    if (amount == 0_dec || from == to) return;

    debit(from, amount, sl);
    m_state.balances[to] += amount;
    checkConsistency(to, sl);

    m_transferSignal(TransferEvent{.from = from, .to = to, .amount = amount});
}

//-------------------------------------------------------------------------

void Ledger::approve(const AccountId& owner, const AccountId& spender, decimal_t amount)
{
    if (amount < 0_dec) {
        throw std::invalid_argument{fmt::format(
            "{}: Allowance cannot be negative, was {}",
            std::source_location::current().function_name(), amount)};
    }
    m_state.allowances[owner][spender] = isUnlimited(amount) ? amount : roundDown(amount);
}

//-------------------------------------------------------------------------

void Ledger::spendAllowance(const AccountId& owner, const AccountId& spender, decimal_t amount)
{
    static constexpr auto sl = std::source_location::current();

    amount = checkAmount(amount, sl);
    const decimal_t current = allowance(owner, spender);
    if (isUnlimited(current)) return;

    if (current < amount) {
        throw AllowanceError{fmt::format(
            "{}: {} may spend {} {} of {}, needs {}",
            sl.function_name(), spender, current, m_symbol, owner, amount)};
    }
    m_state.allowances[owner][spender] = current - amount;
}

//-------------------------------------------------------------------------

void Ledger::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("symbol", rapidjson::Value{m_symbol.c_str(), allocator}, allocator);
        json.AddMember("decimals", rapidjson::Value{m_decimals}, allocator);
        json::addDecimalMember(json, "totalSupply", m_state.totalSupply);
        json::serializeHelper(
            json,
            "balances",
            [this](rapidjson::Document& json) {
                json.SetObject();
                auto& allocator = json.GetAllocator();
                for (const auto& [account, balance] : m_state.balances) {
                    if (balance == 0_dec) continue;
                    json.AddMember(
                        rapidjson::Value{account.c_str(), allocator},
                        rapidjson::Value{util::decimal2double(balance)},
                        allocator);
                }
            });
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

bool Ledger::isUnlimited(decimal_t allowance) noexcept
{
    return allowance == util::maxDecimal();
}

//-------------------------------------------------------------------------

LedgerDesc Ledger::descFromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    pugi::xml_attribute attr;
    if (attr = node.attribute("symbol"); attr.empty()) {
        throw std::invalid_argument{fmt::format(
            "{}: Missing required attribute '{}'", ctx, "symbol")};
    }
    return {
        .symbol = attr.as_string(),
        .decimals = node.attribute("decimals").as_uint(kMaxTokenDecimals),
        .name = node.attribute("name").as_string()
    };
}

//-------------------------------------------------------------------------

decimal_t Ledger::checkAmount(decimal_t amount, std::source_location sl) const
{
    if (amount < 0_dec) {
        throw std::invalid_argument{fmt::format(
            "{}: {} amount cannot be negative, was {}", sl.function_name(), m_symbol, amount)};
    }
    return roundDown(amount);
}

//-------------------------------------------------------------------------

void Ledger::debit(const AccountId& account, decimal_t amount, std::source_location sl)
{
    auto it = m_state.balances.find(account);
    const decimal_t balance = it != m_state.balances.end() ? it->second : decimal_t{};
    if (balance < amount) {
        throw PreconditionError{
            ErrorCode::INSUFFICIENT_BALANCE,
            fmt::format(
                "{}: {} holds {} {}, needs {}",
                sl.function_name(), account, balance, m_symbol, amount)};
    }
    it->second -= amount;
    if (it->second == 0_dec) {
        m_state.balances.erase(it);
    }
}

//-------------------------------------------------------------------------

void Ledger::checkConsistency(const AccountId& account, std::source_location sl) const
{
    if (const decimal_t balance = balanceOf(account); balance < 0_dec) {
        throw std::runtime_error{fmt::format(
            "{}: Inconsistent {} ledger where {} holds negative balance {}",
            sl.function_name(), m_symbol, account, balance)};
    }
    if (m_state.totalSupply < 0_dec) {
        throw std::runtime_error{fmt::format(
            "{}: Inconsistent {} ledger with negative total supply {}",
            sl.function_name(), m_symbol, m_state.totalSupply)};
    }
}

//-------------------------------------------------------------------------

}  // namespace loopvault::accounting

//-------------------------------------------------------------------------
