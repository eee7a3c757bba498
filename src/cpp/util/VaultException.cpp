/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "VaultException.hpp"

#include <magic_enum.hpp>

#include <source_location>

//-------------------------------------------------------------------------

namespace loopvault
{

//-------------------------------------------------------------------------

ErrorCategory categoryOf(ErrorCode code) noexcept
{
    switch (code) {
        case ErrorCode::INVALID_CONFIGURATION:
            return ErrorCategory::CONFIGURATION;
        case ErrorCode::ZERO_SHARES:
        case ErrorCode::ZERO_ASSETS:
            return ErrorCategory::ROUNDING;
        case ErrorCode::INSUFFICIENT_ALLOWANCE:
            return ErrorCategory::ALLOWANCE;
        case ErrorCode::ORACLE_PRICE_UNAVAILABLE:
            return ErrorCategory::ORACLE;
        case ErrorCode::REENTRANT_CALL:
            return ErrorCategory::REENTRANCY;
        default:
            return ErrorCategory::PRECONDITION;
    }
}

//-------------------------------------------------------------------------

VaultException::VaultException(ErrorCode code, const std::string& message)
    : std::runtime_error{fmt::format("{}: {}", magic_enum::enum_name(code), message)},
      m_code{code}
{}

//-------------------------------------------------------------------------

std::string_view VaultException::reason() const noexcept
{
    return magic_enum::enum_name(m_code);
}

//-------------------------------------------------------------------------

PreconditionError::PreconditionError(ErrorCode code, const std::string& message)
    : VaultException{code, message}
{
    if (categoryOf(code) != ErrorCategory::PRECONDITION) {
        throw std::invalid_argument{fmt::format(
            "{}: {} is not a precondition failure",
            std::source_location::current().function_name(),
            magic_enum::enum_name(code))};
    }
}

//-------------------------------------------------------------------------

RoundingError::RoundingError(ErrorCode code, const std::string& message)
    : VaultException{code, message}
{
    if (categoryOf(code) != ErrorCategory::ROUNDING) {
        throw std::invalid_argument{fmt::format(
            "{}: {} is not a rounding failure",
            std::source_location::current().function_name(),
            magic_enum::enum_name(code))};
    }
}

//-------------------------------------------------------------------------

}  // namespace loopvault

//-------------------------------------------------------------------------
