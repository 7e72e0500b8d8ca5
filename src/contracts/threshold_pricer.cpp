#include "contracts/threshold_pricer.hpp"
#include "amm/lmsr.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <stdexcept>

namespace cmm {

std::vector<double> payoff_vector(const AmmState& state, double threshold, Direction direction) {
    std::vector<double> w;
    w.reserve(state.size());
    for (const auto& knot : state.knots) {
        bool pays = direction == Direction::LONG ? knot.x >= threshold : knot.x <= threshold;
        w.push_back(pays ? 1.0 : 0.0);
    }
    return w;
}

Price price_per_contract(const std::vector<Price>& prices, const std::vector<double>& w) {
    if (prices.size() != w.size()) {
        throw std::invalid_argument("payoff vector does not match the price vector");
    }
    Price p = 0.0;
    for (size_t k = 0; k < w.size(); k++) {
        p += w[k] * prices[k];
    }
    return p;
}

ThresholdPricer::ThresholdPricer(double knot_tolerance, Size max_contracts)
    : knot_tolerance_(knot_tolerance)
    , max_contracts_(max_contracts)
{
}

Result<ThresholdQuote> ThresholdPricer::quote(const AmmState& state, double threshold,
                                              Direction direction, Size contracts) const {
    AmmState scratch = state;
    return execute(scratch, threshold, direction, contracts);
}

Result<ThresholdQuote> ThresholdPricer::execute(AmmState& state, double threshold,
                                                Direction direction, Size contracts) const {
    if (!std::isfinite(contracts) || contracts == 0.0) {
        return configuration_fault(fmt::format("contract amount must be finite and non-zero, got {}",
                                               contracts));
    }
    if (std::abs(contracts) > max_contracts_) {
        return configuration_fault(fmt::format("contract amount {} exceeds the maximum of {}",
                                               contracts, max_contracts_));
    }

    auto index = insert_knot(state, threshold, knot_tolerance_);
    if (!index) {
        return index.fault();
    }

    auto q_before = state.quantities();
    auto w = payoff_vector(state, threshold, direction);

    auto p = lmsr::prices(q_before, state.b);
    if (!p) {
        return p.fault();
    }

    auto q_after = q_before;
    size_t paying = 0;
    for (size_t k = 0; k < w.size(); k++) {
        if (w[k] != 0.0) {
            q_after[k] += contracts * w[k];
            paying++;
        }
    }

    auto payment = lmsr::cost_delta(q_before, q_after, state.b);
    if (!payment) {
        spdlog::error("Threshold trade {} {} x{} failed: {}",
                      direction_to_string(direction), threshold, contracts, payment.fault().message);
        return payment.fault();
    }

    ThresholdQuote result;
    result.threshold = threshold;
    result.direction = direction;
    result.contracts = contracts;
    result.knot_index = *index;
    result.num_knots = state.size();
    result.paying_knots = paying;
    result.b = state.b;
    result.price = price_per_contract(*p, w);
    result.payment = *payment;
    result.prices = std::move(*p);

    state.set_quantities(q_after);

    spdlog::debug("Threshold {} @ {:.6g}: n={:.4f} price={:.6f} payment={:.6f} ({} of {} knots pay)",
                  direction_to_string(direction), threshold, contracts, result.price,
                  result.payment, paying, result.num_knots);

    return result;
}

} // namespace cmm
