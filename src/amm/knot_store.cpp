#include "amm/knot_store.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace cmm {

std::vector<double> AmmState::quantities() const {
    std::vector<double> q;
    q.reserve(knots.size());
    for (const auto& knot : knots) {
        q.push_back(knot.q);
    }
    return q;
}

std::vector<double> AmmState::values() const {
    std::vector<double> x;
    x.reserve(knots.size());
    for (const auto& knot : knots) {
        x.push_back(knot.x);
    }
    return x;
}

void AmmState::set_quantities(const std::vector<double>& q) {
    if (q.size() != knots.size()) {
        throw std::invalid_argument("quantity vector does not match knot grid");
    }
    for (size_t i = 0; i < knots.size(); i++) {
        knots[i].q = q[i];
    }
}

MarketParams MarketParams::from_config(const AmmConfig& config) {
    MarketParams params;
    params.num_knots = config.default_knots;
    params.min_val = config.default_min_val;
    params.max_val = config.default_max_val;
    params.bankroll = config.default_bankroll;
    return params;
}

double liquidity_for(double bankroll, size_t n) {
    return bankroll / std::log(static_cast<double>(n));
}

namespace {

// Normalized prior weights, or a fault describing why they cannot be used
Result<std::vector<double>> prior_weights(const MarketParams& params) {
    const size_t n = static_cast<size_t>(params.num_knots);
    std::vector<double> weights;

    if (std::holds_alternative<UniformPrior>(params.prior)) {
        return std::vector<double>(n, 1.0 / static_cast<double>(n));
    }

    if (const auto* explicit_prior = std::get_if<ExplicitPrior>(&params.prior)) {
        if (explicit_prior->weights.size() != n) {
            return configuration_fault(fmt::format(
                "prior has {} weights for {} knots", explicit_prior->weights.size(), n));
        }
        weights = explicit_prior->weights;
    } else {
        const auto& generator = std::get<GeneratorPrior>(params.prior);
        if (!generator.fn) {
            return configuration_fault("prior generator is empty");
        }
        weights.reserve(n);
        for (size_t i = 0; i < n; i++) {
            weights.push_back(generator.fn(i, n, params.min_val, params.max_val));
        }
    }

    for (double w : weights) {
        // ln(0) would seed an infinitely short knot
        if (!std::isfinite(w) || w <= 0.0) {
            return configuration_fault(fmt::format("prior weight {} is not positive", w));
        }
    }

    double total = std::accumulate(weights.begin(), weights.end(), 0.0);
    if (!std::isfinite(total) || total <= 0.0) {
        return configuration_fault("prior weights do not sum to a positive value");
    }

    for (auto& w : weights) {
        w /= total;
    }
    return weights;
}

} // namespace

Result<AmmState> build_initial_state(const MarketParams& params) {
    if (params.num_knots < 2) {
        return configuration_fault(fmt::format("grid needs at least 2 knots, got {}", params.num_knots));
    }
    if (!std::isfinite(params.min_val) || !std::isfinite(params.max_val) ||
        params.min_val <= 0.0 || params.max_val <= params.min_val) {
        return configuration_fault(fmt::format(
            "invalid grid bounds [{}, {}]", params.min_val, params.max_val));
    }
    if (!std::isfinite(params.bankroll) || params.bankroll <= 0.0) {
        return configuration_fault(fmt::format("bankroll must be positive, got {}", params.bankroll));
    }

    auto weights = prior_weights(params);
    if (!weights) {
        return weights.fault();
    }

    const size_t n = static_cast<size_t>(params.num_knots);

    AmmState state;
    state.bankroll = params.bankroll;
    state.b = liquidity_for(params.bankroll, n);
    state.min_val = params.min_val;
    state.max_val = params.max_val;
    state.knots.reserve(n);

    double log_min = std::log(params.min_val);
    double log_max = std::log(params.max_val);

    for (size_t i = 0; i < n; i++) {
        double x;
        if (i == 0) {
            x = params.min_val;
        } else if (i == n - 1) {
            x = params.max_val;
        } else {
            x = std::exp(log_min + (log_max - log_min) * static_cast<double>(i) / static_cast<double>(n - 1));
        }
        // q_k = b * ln(p_k0) makes softmax(q / b) reproduce the prior
        state.knots.push_back({x, state.b * std::log((*weights)[i])});
    }

    return state;
}

std::optional<size_t> find_knot(const AmmState& state, double x, double tolerance) {
    for (size_t i = 0; i < state.knots.size(); i++) {
        if (std::abs(state.knots[i].x - x) < tolerance) {
            return i;
        }
    }
    return std::nullopt;
}

Result<size_t> insert_knot(AmmState& state, double x, double tolerance) {
    if (!std::isfinite(x) || x <= 0.0) {
        return configuration_fault(fmt::format("knot value must be positive, got {}", x));
    }
    if (x < state.min_val - tolerance || x > state.max_val + tolerance) {
        return configuration_fault(fmt::format(
            "knot value {} outside grid bounds [{}, {}]", x, state.min_val, state.max_val));
    }

    if (auto existing = find_knot(state, x, tolerance)) {
        return *existing;
    }

    auto it = std::lower_bound(state.knots.begin(), state.knots.end(), x,
                               [](const Knot& k, double v) { return k.x < v; });
    it = state.knots.insert(it, Knot{x, 0.0});
    size_t index = static_cast<size_t>(std::distance(state.knots.begin(), it));

    state.b = liquidity_for(state.bankroll, state.knots.size());

    spdlog::debug("Knot inserted at x={:.6g} (index {}), N={}, b={:.4f}",
                  x, index, state.knots.size(), state.b);
    return index;
}

// KnotStore implementation

KnotStore::KnotStore(double knot_tolerance)
    : knot_tolerance_(knot_tolerance)
{
}

KnotStore::MarketSlot& KnotStore::slot_for(const std::string& market_id) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto& slot = markets_[market_id];
    if (!slot) {
        slot = std::make_unique<MarketSlot>();
    }
    return *slot;
}

KnotStore::MarketSlot* KnotStore::find_slot(const std::string& market_id) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = markets_.find(market_id);
    return it == markets_.end() ? nullptr : it->second.get();
}

Result<MarketLock> KnotStore::get_or_init(const std::string& market_id, const MarketParams& params) {
    if (auto existing = acquire(market_id)) {
        return std::move(*existing);
    }

    // Built before the market is registered, so rejected params leave no slot
    auto built = build_initial_state(params);
    if (!built) {
        spdlog::error("Market {} not initialized: {}", market_id, built.fault().message);
        return built.fault();
    }

    // Slots are never erased, so the reference outlives the registry lock
    MarketSlot& slot = slot_for(market_id);
    std::unique_lock<std::mutex> lock(slot.mutex);

    // Another caller may have initialized the market since the lookup above
    if (!slot.state) {
        slot.state = std::move(built.value());
        spdlog::info("Market {} initialized: N={}, range=[{:.6g}, {:.6g}], bankroll={:.2f}, b={:.4f}",
                     market_id, slot.state->size(), params.min_val, params.max_val,
                     params.bankroll, slot.state->b);
    }

    return MarketLock(std::move(lock), *slot.state);
}

std::optional<MarketLock> KnotStore::acquire(const std::string& market_id) {
    MarketSlot* slot = find_slot(market_id);
    if (!slot) {
        return std::nullopt;
    }

    std::unique_lock<std::mutex> lock(slot->mutex);
    if (!slot->state) {
        return std::nullopt;
    }
    return MarketLock(std::move(lock), *slot->state);
}

bool KnotStore::contains(const std::string& market_id) const {
    MarketSlot* slot = find_slot(market_id);
    if (!slot) return false;
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->state.has_value();
}

std::vector<std::string> KnotStore::market_ids() const {
    std::vector<std::pair<std::string, MarketSlot*>> slots;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        for (const auto& [id, slot] : markets_) {
            slots.emplace_back(id, slot.get());
        }
    }

    // A slot is registered just before its state is stored
    std::vector<std::string> ids;
    for (const auto& [id, slot] : slots) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->state) {
            ids.push_back(id);
        }
    }
    return ids;
}

size_t KnotStore::size() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return markets_.size();
}

} // namespace cmm
