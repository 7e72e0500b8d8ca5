#pragma once

#include <vector>
#include "common/types.hpp"
#include "amm/knot_store.hpp"

namespace cmm {

// w_k = 1 where the knot pays out (x >= threshold for LONG, x <= threshold
// for SHORT), 0 elsewhere. Aligned with state.knots.
std::vector<double> payoff_vector(const AmmState& state, double threshold, Direction direction);

// Instantaneous price of one contract: sum_k w_k * p_k
Price price_per_contract(const std::vector<Price>& prices, const std::vector<double>& w);

struct ThresholdQuote {
    double threshold{0.0};
    Direction direction{Direction::LONG};
    Size contracts{0.0};

    size_t knot_index{0};        // Index of the threshold knot in the grid
    size_t num_knots{0};         // Grid size after the threshold knot was inserted
    size_t paying_knots{0};      // Knots with w_k = 1
    double b{0.0};

    Price price{0.0};            // Instantaneous price per contract
    Notional payment{0.0};       // C(q + n*w) - C(q); negative when selling back
    std::vector<Price> prices;   // Knot prices before the trade
};

/**
 * Cumulative above/below contracts over a market's knot grid.
 *
 * Trading n contracts moves every paying knot by n at once and costs the
 * LMSR cost delta of that whole-vector move. n > 0 buys, n < 0 sells back.
 * Both quote() and execute() first insert the threshold as a knot so the
 * payoff boundary lands exactly on the requested value. |n| is capped at
 * max_contracts.
 */
class ThresholdPricer {
public:
    explicit ThresholdPricer(double knot_tolerance = 1e-6, Size max_contracts = 1e5);

    // Price on a scratch copy; `state` is untouched
    Result<ThresholdQuote> quote(const AmmState& state, double threshold,
                                 Direction direction, Size contracts) const;

    // Insert the threshold knot into `state` and apply q += n*w
    Result<ThresholdQuote> execute(AmmState& state, double threshold,
                                   Direction direction, Size contracts) const;

private:
    double knot_tolerance_;
    Size max_contracts_;
};

} // namespace cmm
