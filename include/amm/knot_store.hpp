#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <vector>
#include <string>
#include <variant>
#include <optional>
#include <functional>
#include "common/types.hpp"
#include "config/config.hpp"

namespace cmm {

/**
 * A discrete, addressable point on the continuous outcome axis.
 */
struct Knot {
    double x{0.0};   // Outcome value, positive
    double q{0.0};   // Signed LMSR quantity outstanding at this knot
};

/**
 * Sparse AMM state for one market. Knots are kept sorted by x and unique
 * within the store tolerance; b is always bankroll / ln(N).
 */
struct AmmState {
    std::vector<Knot> knots;
    double bankroll{0.0};
    double b{0.0};
    double min_val{0.0};
    double max_val{0.0};

    size_t size() const { return knots.size(); }
    std::vector<double> quantities() const;
    std::vector<double> values() const;

    // Write a quantity vector back onto the knots (same length required)
    void set_quantities(const std::vector<double>& q);
};

// ============================================================================
// PRIORS
// ============================================================================

struct UniformPrior {};

struct ExplicitPrior {
    std::vector<double> weights;  // Renormalized to sum to 1
};

struct GeneratorPrior {
    // (index, N, min_val, max_val) -> unnormalized weight
    std::function<double(size_t, size_t, double, double)> fn;
};

using Prior = std::variant<UniformPrior, ExplicitPrior, GeneratorPrior>;

struct MarketParams {
    int num_knots{21};
    double min_val{5e6};
    double max_val{1e12};
    double bankroll{5000.0};
    Prior prior{UniformPrior{}};

    static MarketParams from_config(const AmmConfig& config);
};

// Liquidity parameter for a bankroll spread over n knots
double liquidity_for(double bankroll, size_t n);

// Build the initial log-uniform grid seeded so that LMSR prices equal the prior
Result<AmmState> build_initial_state(const MarketParams& params);

// Index of the knot within tolerance of x, if any
std::optional<size_t> find_knot(const AmmState& state, double x, double tolerance);

// Insert a phantom (q = 0) knot at x unless one already exists within
// tolerance; recomputes b. Returns the knot's index either way.
Result<size_t> insert_knot(AmmState& state, double x, double tolerance);

/**
 * Exclusive access to one market's state. Holds that market's lock for its
 * whole lifetime, so a read-compute-write sequence done through one
 * MarketLock is linearized against every other request on the same market.
 */
class MarketLock {
public:
    MarketLock(std::unique_lock<std::mutex> lock, AmmState& state)
        : lock_(std::move(lock)), state_(&state) {}

    MarketLock(MarketLock&&) = default;
    MarketLock& operator=(MarketLock&&) = default;

    AmmState& state() { return *state_; }
    const AmmState& state() const { return *state_; }
    AmmState* operator->() { return state_; }
    const AmmState* operator->() const { return state_; }

private:
    std::unique_lock<std::mutex> lock_;
    AmmState* state_;
};

/**
 * Owns every market's knot grid, one mutex per market id.
 * The registry mutex only guards the map itself; it is never held while a
 * market lock is being waited on.
 */
class KnotStore {
public:
    explicit KnotStore(double knot_tolerance = 1e-6);

    // Non-copyable
    KnotStore(const KnotStore&) = delete;
    KnotStore& operator=(const KnotStore&) = delete;

    // Return the market's state (locked), creating it from params on first touch
    Result<MarketLock> get_or_init(const std::string& market_id, const MarketParams& params);

    // Locked state of an existing market; nullopt if the market was never initialized
    std::optional<MarketLock> acquire(const std::string& market_id);

    bool contains(const std::string& market_id) const;
    std::vector<std::string> market_ids() const;
    size_t size() const;   // Registered markets

    double knot_tolerance() const { return knot_tolerance_; }

private:
    struct MarketSlot {
        std::mutex mutex;
        std::optional<AmmState> state;
    };

    double knot_tolerance_;

    mutable std::mutex registry_mutex_;
    std::map<std::string, std::unique_ptr<MarketSlot>> markets_;

    MarketSlot& slot_for(const std::string& market_id);
    MarketSlot* find_slot(const std::string& market_id) const;
};

} // namespace cmm
