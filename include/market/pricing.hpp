#pragma once

#include "common/decimal.hpp"
#include "market/market_directory.hpp"
#include "persistence/database.hpp"

namespace thisthat {

struct Quote {
    Probability price;
    Credits shares;
    Credits potential_payout;
};

/**
 * Payout formula. Entry quotes fix shares and potential payout at bet time;
 * settlement_payout is what a winning bet is credited; exit_value is what an
 * early sale returns at the market's current price.
 */
class PricingModel {
public:
    virtual ~PricingModel() = default;

    virtual Quote quote_entry(const MarketRecord& market, Side side, Credits amount) const = 0;
    virtual Credits settlement_payout(const BetRecord& bet) const = 0;
    virtual Credits exit_value(const BetRecord& bet, const MarketRecord& market) const = 0;
};

/**
 * Fixed-price share model: shares = amount / price and each winning share
 * pays one credit. Prices must lie strictly inside (0, 1).
 */
class SharePricing : public PricingModel {
public:
    Quote quote_entry(const MarketRecord& market, Side side, Credits amount) const override;
    Credits settlement_payout(const BetRecord& bet) const override;
    Credits exit_value(const BetRecord& bet, const MarketRecord& market) const override;

    static Probability checked_price(const MarketRecord& market, Side side);
};

} // namespace thisthat
