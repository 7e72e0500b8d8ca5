#pragma once

#include <vector>
#include "common/types.hpp"
#include "amm/knot_store.hpp"

namespace cmm {
namespace lmsr {

/**
 * LMSR cost engine. Pure functions over a quantity vector q and liquidity b.
 *
 *   C(q)   = max(q) + b * ln(sum_k exp((q_k - max(q)) / b))
 *   p_k(q) = exp((q_k - max(q)) / b) / sum_j exp((q_j - max(q)) / b)
 *
 * Every exponent is shifted by the largest quantity so no term exceeds 1.
 * A sum that still goes non-finite is reported as LIQUIDITY_EXHAUSTED.
 * An empty q or a non-positive b is an invariant violation and throws
 * std::invalid_argument.
 */

Result<double> cost(const std::vector<double>& q, double b);

Result<std::vector<Price>> prices(const std::vector<double>& q, double b);

/**
 * C(q_after) - C(q_before). Moves of at most b per knot use one shared shift
 * and per-knot expm1 terms so a small move on a large book does not cancel to
 * zero or go negative through rounding; knots that did not move contribute
 * exactly 0. Larger moves difference two independently shifted costs.
 */
Result<double> cost_delta(const std::vector<double>& q_before,
                          const std::vector<double>& q_after,
                          double b);

// C(q + s*e_k) - C(q). MATH fault if negative or non-finite.
Result<double> ask(const std::vector<double>& q, double b, size_t k, Size s);

// C(q) - C(q - s*e_k). MATH fault if negative or non-finite.
Result<double> bid(const std::vector<double>& q, double b, size_t k, Size s);

struct Quote {
    Price bid{0.0};       // Per-share proceeds for selling `size`
    Price mid{0.0};       // Instantaneous price p_k
    Price ask{0.0};       // Per-share cost for buying `size`
    double liquidity{0.0};  // b * ln(N), the market maker's worst-case loss
};

/**
 * Bid/mid/ask for `size` shares at knot k. bid and ask are per share.
 * If any member is non-finite the whole quote is the fault
 * "liquidity exhausted"; a partially valid quote is never returned.
 */
Result<Quote> quote(const AmmState& state, size_t k, Size size);

struct KnotQuote {
    double value{0.0};
    Price mid{0.0};
    Price bid{0.0};
    Price ask{0.0};
};

// Quote for every knot, ascending by value
Result<std::vector<KnotQuote>> bid_ask_ladder(const AmmState& state, Size size = 1.0);

} // namespace lmsr
} // namespace cmm
