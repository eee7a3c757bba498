/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "loopvault/oracle/FeedPriceOracle.hpp"

#include "VaultException.hpp"

//-------------------------------------------------------------------------

namespace loopvault::oracle
{

//-------------------------------------------------------------------------

FeedPriceOracle::FeedPriceOracle(const simulation::Clock* clock)
    : m_clock{clock}
{
    if (m_clock == nullptr) {
        throw std::invalid_argument{fmt::format(
            "{}: clock must not be null", std::source_location::current().function_name())};
    }
}

//-------------------------------------------------------------------------

PriceQuote FeedPriceOracle::getPrice(const AssetId& asset) const
{
    auto it = m_quotes.find(asset);
    if (it == m_quotes.end()) {
        throw OracleError{fmt::format(
            "{}: No feed for {}", std::source_location::current().function_name(), asset)};
    }
    return it->second;
}

//-------------------------------------------------------------------------

void FeedPriceOracle::setPrice(const AssetId& asset, decimal_t price)
{
    setQuote(asset, PriceQuote{.price = price, .updatedAt = m_clock->now()});
}

//-------------------------------------------------------------------------

void FeedPriceOracle::setQuote(const AssetId& asset, PriceQuote quote)
{
    m_quotes[asset] = quote;
}

//-------------------------------------------------------------------------

}  // namespace loopvault::oracle

//-------------------------------------------------------------------------
