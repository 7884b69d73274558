#include "market/pricing.hpp"
#include "common/errors.hpp"

#include <fmt/format.h>

namespace thisthat {

Probability SharePricing::checked_price(const MarketRecord& market, Side side) {
    Probability price = market.price_for(side);
    if (price <= Probability() || price >= Probability::from_whole(1)) {
        throw ServiceUnavailable(fmt::format(
            "Price {} for {} on market {} is outside (0, 1)",
            price.to_string(), to_string(side), market.id));
    }
    return price;
}

Quote SharePricing::quote_entry(const MarketRecord& market, Side side, Credits amount) const {
    Quote q;
    q.price = checked_price(market, side);
    q.shares = amount / q.price;
    q.potential_payout = q.shares;
    return q;
}

Credits SharePricing::settlement_payout(const BetRecord& bet) const {
    return bet.shares;
}

Credits SharePricing::exit_value(const BetRecord& bet, const MarketRecord& market) const {
    return bet.shares * checked_price(market, bet.side);
}

} // namespace thisthat
