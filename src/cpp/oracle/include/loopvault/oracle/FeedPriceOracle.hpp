/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "loopvault/oracle/PriceOracle.hpp"
#include "loopvault/simulation/Clock.hpp"

//-------------------------------------------------------------------------

namespace loopvault::oracle
{

//-------------------------------------------------------------------------

// Holds the last quote pushed for each asset, the way an aggregator feed
// does between updates.
class FeedPriceOracle : public PriceOracle
{
public:
    explicit FeedPriceOracle(const simulation::Clock* clock);

    [[nodiscard]] virtual PriceQuote getPrice(const AssetId& asset) const override;

    void setPrice(const AssetId& asset, decimal_t price);
    void setQuote(const AssetId& asset, PriceQuote quote);

    [[nodiscard]] std::map<AssetId, PriceQuote> snapshot() const { return m_quotes; }
    void restore(std::map<AssetId, PriceQuote> snapshot) noexcept { m_quotes = std::move(snapshot); }

private:
    const simulation::Clock* m_clock;
    std::map<AssetId, PriceQuote> m_quotes;
};

//-------------------------------------------------------------------------

}  // namespace loopvault::oracle

//-------------------------------------------------------------------------
