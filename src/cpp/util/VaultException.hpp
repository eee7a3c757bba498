/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <fmt/format.h>
#include <magic_enum.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace loopvault
{

//-------------------------------------------------------------------------

enum class ErrorCode : uint32_t
{
    INVALID_CONFIGURATION,
    RESERVE_NOT_ELIGIBLE,
    ZERO_COLLATERAL,
    REBALANCE_NOT_DUE,
    INSUFFICIENT_BALANCE,
    INSUFFICIENT_LIQUIDITY,
    BORROW_CAPACITY_EXCEEDED,
    UNHEALTHY_POSITION,
    SLIPPAGE_EXCEEDED,
    ZERO_SHARES,
    ZERO_ASSETS,
    INSUFFICIENT_ALLOWANCE,
    ORACLE_PRICE_UNAVAILABLE,
    REENTRANT_CALL
};

enum class ErrorCategory : uint32_t
{
    CONFIGURATION,
    PRECONDITION,
    ROUNDING,
    ALLOWANCE,
    ORACLE,
    REENTRANCY
};

[[nodiscard]] ErrorCategory categoryOf(ErrorCode code) noexcept;

//-------------------------------------------------------------------------

class VaultException : public std::runtime_error
{
public:
    VaultException(ErrorCode code, const std::string& message);

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }
    [[nodiscard]] ErrorCategory category() const noexcept { return categoryOf(m_code); }
    [[nodiscard]] std::string_view reason() const noexcept;

private:
    ErrorCode m_code;
};

//-------------------------------------------------------------------------

class ConfigurationError : public VaultException
{
public:
    explicit ConfigurationError(const std::string& message)
        : VaultException{ErrorCode::INVALID_CONFIGURATION, message}
    {}
};

class PreconditionError : public VaultException
{
public:
    PreconditionError(ErrorCode code, const std::string& message);
};

class RoundingError : public VaultException
{
public:
    RoundingError(ErrorCode code, const std::string& message);
};

class AllowanceError : public VaultException
{
public:
    explicit AllowanceError(const std::string& message)
        : VaultException{ErrorCode::INSUFFICIENT_ALLOWANCE, message}
    {}
};

class OracleError : public VaultException
{
public:
    explicit OracleError(const std::string& message)
        : VaultException{ErrorCode::ORACLE_PRICE_UNAVAILABLE, message}
    {}
};

class ReentrancyError : public VaultException
{
public:
    explicit ReentrancyError(const std::string& message)
        : VaultException{ErrorCode::REENTRANT_CALL, message}
    {}
};

//-------------------------------------------------------------------------

}  // namespace loopvault

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<loopvault::ErrorCode>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(loopvault::ErrorCode code, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(code));
    }
};

//-------------------------------------------------------------------------
