#include "amm/lmsr.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace cmm {
namespace lmsr {

namespace {

// Moves up to this many b per knot take the expm1/log1p path
constexpr double SMALL_MOVE = 1.0;

void check_book(const std::vector<double>& q, double b) {
    if (q.empty()) {
        throw std::invalid_argument("LMSR evaluated on an empty knot grid");
    }
    if (!(b > 0.0)) {
        throw std::invalid_argument("LMSR liquidity parameter must be positive");
    }
}

double max_of(const std::vector<double>& q) {
    return *std::max_element(q.begin(), q.end());
}

// sum_k exp((q_k - shift) / b)
double shifted_sum(const std::vector<double>& q, double b, double shift) {
    double sum = 0.0;
    for (double qk : q) {
        sum += std::exp((qk - shift) / b);
    }
    return sum;
}

bool usable_sum(double sum) {
    return std::isfinite(sum) && sum > 0.0;
}

} // namespace

Result<double> cost(const std::vector<double>& q, double b) {
    check_book(q, b);

    double m = max_of(q);
    double sum = shifted_sum(q, b, m);
    if (!usable_sum(sum)) {
        return liquidity_exhausted();
    }

    double c = m + b * std::log(sum);
    if (!std::isfinite(c)) {
        return liquidity_exhausted();
    }
    return c;
}

Result<std::vector<Price>> prices(const std::vector<double>& q, double b) {
    check_book(q, b);

    double m = max_of(q);
    std::vector<Price> p;
    p.reserve(q.size());

    double sum = 0.0;
    for (double qk : q) {
        double e = std::exp((qk - m) / b);
        p.push_back(e);
        sum += e;
    }
    if (!usable_sum(sum)) {
        return liquidity_exhausted();
    }

    for (auto& pk : p) {
        pk /= sum;
        if (!std::isfinite(pk)) {
            return liquidity_exhausted();
        }
    }
    return p;
}

Result<double> cost_delta(const std::vector<double>& q_before,
                          const std::vector<double>& q_after,
                          double b) {
    check_book(q_before, b);
    if (q_after.size() != q_before.size()) {
        throw std::invalid_argument("LMSR cost delta over grids of different size");
    }

    double max_move = 0.0;
    for (size_t k = 0; k < q_before.size(); k++) {
        max_move = std::max(max_move, std::abs(q_after[k] - q_before[k]) / b);
    }

    if (!(max_move <= SMALL_MOVE)) {
        // Each side shifted by its own max: (m_a - m_b) + b * (ln S_a - ln S_b)
        double m_before = max_of(q_before);
        double m_after = max_of(q_after);
        double s_before = shifted_sum(q_before, b, m_before);
        double s_after = shifted_sum(q_after, b, m_after);
        if (!usable_sum(s_before) || !usable_sum(s_after)) {
            return liquidity_exhausted();
        }

        double delta = (m_after - m_before) + b * (std::log(s_after) - std::log(s_before));
        if (!std::isfinite(delta)) {
            return liquidity_exhausted();
        }
        return delta;
    }

    double m = std::max(max_of(q_before), max_of(q_after));

    double base = 0.0;
    double diff = 0.0;
    for (size_t k = 0; k < q_before.size(); k++) {
        double e = std::exp((q_before[k] - m) / b);
        base += e;
        if (q_after[k] != q_before[k]) {
            // exp(a) - exp(c) = exp(c) * expm1(a - c)
            diff += e * std::expm1((q_after[k] - q_before[k]) / b);
        }
    }
    if (!usable_sum(base) || !std::isfinite(diff)) {
        return liquidity_exhausted();
    }

    double delta = b * std::log1p(diff / base);
    if (!std::isfinite(delta)) {
        return liquidity_exhausted();
    }
    return delta;
}

Result<double> ask(const std::vector<double>& q, double b, size_t k, Size s) {
    if (k >= q.size()) {
        return configuration_fault(fmt::format("knot index {} out of range (N={})", k, q.size()));
    }
    if (!std::isfinite(s) || s <= 0.0) {
        return configuration_fault(fmt::format("quote size must be positive, got {}", s));
    }

    std::vector<double> q_plus = q;
    q_plus[k] += s;

    auto delta = cost_delta(q, q_plus, b);
    if (!delta) {
        return delta;
    }
    if (*delta < 0.0) {
        return math_fault(fmt::format("negative ask {} at knot {}", *delta, k));
    }
    return delta;
}

Result<double> bid(const std::vector<double>& q, double b, size_t k, Size s) {
    if (k >= q.size()) {
        return configuration_fault(fmt::format("knot index {} out of range (N={})", k, q.size()));
    }
    if (!std::isfinite(s) || s <= 0.0) {
        return configuration_fault(fmt::format("quote size must be positive, got {}", s));
    }

    std::vector<double> q_minus = q;
    q_minus[k] -= s;

    auto delta = cost_delta(q_minus, q, b);
    if (!delta) {
        return delta;
    }
    if (*delta < 0.0) {
        return math_fault(fmt::format("negative bid {} at knot {}", *delta, k));
    }
    return delta;
}

Result<Quote> quote(const AmmState& state, size_t k, Size size) {
    if (k >= state.size()) {
        return configuration_fault(fmt::format("knot index {} out of range (N={})", k, state.size()));
    }

    auto q = state.quantities();

    auto p = prices(q, state.b);
    if (!p) return p.fault();

    auto a = ask(q, state.b, k, size);
    if (!a) return a.fault();

    auto bd = bid(q, state.b, k, size);
    if (!bd) return bd.fault();

    Quote result;
    result.mid = (*p)[k];
    result.ask = *a / size;
    result.bid = *bd / size;
    result.liquidity = state.b * std::log(static_cast<double>(state.size()));

    if (!std::isfinite(result.bid) || !std::isfinite(result.mid) ||
        !std::isfinite(result.ask) || !std::isfinite(result.liquidity)) {
        spdlog::error("Non-finite quote at knot {}: bid={} mid={} ask={} liquidity={}",
                      k, result.bid, result.mid, result.ask, result.liquidity);
        return liquidity_exhausted();
    }
    return result;
}

Result<std::vector<KnotQuote>> bid_ask_ladder(const AmmState& state, Size size) {
    std::vector<KnotQuote> ladder;
    ladder.reserve(state.size());

    for (size_t k = 0; k < state.size(); k++) {
        auto qt = quote(state, k, size);
        if (!qt) {
            return qt.fault();
        }
        ladder.push_back({state.knots[k].x, qt->mid, qt->bid, qt->ask});
    }
    return ladder;
}

} // namespace lmsr
} // namespace cmm
