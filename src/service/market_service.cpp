#include "service/market_service.hpp"
#include "utils/time_utils.hpp"
#include "utils/uuid.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

namespace cmm {

namespace {

Fault no_market(const std::string& market_id) {
    return configuration_fault("No AMM state for market " + market_id);
}

Fault insufficient_funds(const std::string& user_id, Notional amount) {
    return Fault{FaultKind::INSUFFICIENT_FUNDS,
                 fmt::format("insufficient funds: {} cannot pay {:.6f}", user_id, amount)};
}

} // namespace

MarketService::MarketService(const Config& config,
                             std::shared_ptr<Wallet> wallet,
                             std::shared_ptr<TradeLedger> ledger)
    : config_(config)
    , store_(config.amm.knot_tolerance)
    , executor_(config.amm.max_fill_step, config.amm.max_order_size)
    , pricer_(config.amm.knot_tolerance, config.amm.max_order_size)
    , wallet_(std::move(wallet))
    , ledger_(std::move(ledger))
{
    spdlog::info("MarketService ready (wallet: {}, ledger: {})",
                 wallet_ ? "yes" : "no", ledger_ ? ledger_->path() : "none");
}

MarketParams MarketService::default_params() const {
    return MarketParams::from_config(config_.amm);
}

Result<MarketLock> MarketService::open_default(const std::string& market_id) {
    return store_.get_or_init(market_id, default_params());
}

Result<MarketSnapshot> MarketService::make_snapshot(const std::string& market_id, const AmmState& state) {
    auto p = lmsr::prices(state.quantities(), state.b);
    if (!p) {
        return p.fault();
    }

    MarketSnapshot snap;
    snap.market_id = market_id;
    snap.knots = state.knots;
    snap.prices = std::move(*p);
    snap.bankroll = state.bankroll;
    snap.b = state.b;
    snap.min_val = state.min_val;
    snap.max_val = state.max_val;
    return snap;
}

Result<MarketSnapshot> MarketService::open_market(const std::string& market_id, const MarketParams& params) {
    auto lock = store_.get_or_init(market_id, params);
    if (!lock) {
        return lock.fault();
    }
    return make_snapshot(market_id, lock->state());
}

// ============================================================================
// ORDERS
// ============================================================================

Result<FillReport> MarketService::settle_order(MarketLock& lock, AmmState scratch,
                                               const std::string& user_id,
                                               const OrderRequest& request) {
    auto executed = executor_.execute(scratch, request);
    if (!executed) {
        return executed.fault();
    }
    FillReport report = std::move(*executed);

    if (report.filled <= 0.0) {
        // Nothing to pay for and nothing to commit
        return report;
    }

    if (wallet_ && request.side == Side::BUY && report.total_payment > 0.0) {
        if (wallet_->debit(user_id, report.total_payment, report.order_id) != WalletStatus::OK) {
            spdlog::warn("Order {} for {} not committed: insufficient funds for {:.6f}",
                         report.order_id, user_id, report.total_payment);
            return insufficient_funds(user_id, report.total_payment);
        }
    }

    lock.state() = std::move(scratch);

    if (wallet_ && request.side == Side::SELL && report.total_payment > 0.0) {
        wallet_->credit(user_id, report.total_payment, report.order_id);
    }
    if (ledger_) {
        ledger_->record_fill(user_id, report);
    }

    return report;
}

Result<FillReport> MarketService::place_order(const std::string& user_id, const OrderRequest& request) {
    auto lock = store_.acquire(request.market_id);
    if (!lock) {
        spdlog::warn("Order rejected: no market {}", request.market_id);
        return no_market(request.market_id);
    }

    AmmState scratch = lock->state();
    return settle_order(*lock, std::move(scratch), user_id, request);
}

Result<FillReport> MarketService::place_order_at_value(const std::string& user_id,
                                                       const std::string& market_id,
                                                       double value,
                                                       Side side,
                                                       Size size,
                                                       OrderType type,
                                                       std::optional<Price> limit_price) {
    auto lock = open_default(market_id);
    if (!lock) {
        return lock.fault();
    }

    AmmState scratch = lock->state();
    auto index = insert_knot(scratch, value, store_.knot_tolerance());
    if (!index) {
        spdlog::warn("Order at value {} rejected: {}", value, index.fault().message);
        return index.fault();
    }

    OrderRequest request;
    request.market_id = market_id;
    request.bucket_index = *index;
    request.side = side;
    request.size = size;
    request.type = type;
    request.limit_price = limit_price;

    return settle_order(*lock, std::move(scratch), user_id, request);
}

// ============================================================================
// QUOTES
// ============================================================================

Result<lmsr::Quote> MarketService::get_quote(const std::string& market_id, size_t bucket_index, Size size) {
    auto lock = store_.acquire(market_id);
    if (!lock) {
        return no_market(market_id);
    }
    return lmsr::quote(lock->state(), bucket_index, size);
}

Result<ValueQuote> MarketService::get_quote_at_value(const std::string& market_id, double value, Size size) {
    auto lock = open_default(market_id);
    if (!lock) {
        return lock.fault();
    }

    AmmState scratch = lock->state();
    auto index = insert_knot(scratch, value, store_.knot_tolerance());
    if (!index) {
        return index.fault();
    }

    auto qt = lmsr::quote(scratch, *index, size);
    if (!qt) {
        return qt.fault();
    }

    ValueQuote result;
    result.value = value;
    result.knot_index = *index;
    result.num_knots = scratch.size();
    result.b = scratch.b;
    result.quote = *qt;
    return result;
}

Result<std::vector<lmsr::KnotQuote>> MarketService::get_bid_ask(const std::string& market_id) {
    auto lock = open_default(market_id);
    if (!lock) {
        return lock.fault();
    }
    return lmsr::bid_ask_ladder(lock->state(), config_.amm.quote_size);
}

// ============================================================================
// THRESHOLD CONTRACTS
// ============================================================================

Result<ThresholdTradeResult> MarketService::quote_and_trade(const std::string& user_id,
                                                            const std::string& market_id,
                                                            double value,
                                                            Direction direction,
                                                            Size contracts,
                                                            bool execute,
                                                            const std::string& expiry) {
    auto lock = open_default(market_id);
    if (!lock) {
        return lock.fault();
    }

    AmmState scratch = lock->state();
    auto traded = pricer_.execute(scratch, value, direction, contracts);
    if (!traded) {
        return traded.fault();
    }

    // Scenarios are read off the pre-trade prices on the grid that holds the threshold knot
    auto dist = ImpliedDistribution::calibrate(traded->prices, scratch.values(), config_.calibration);
    if (!dist) {
        return dist.fault();
    }
    auto scen = dist->scenarios(value);
    if (!scen) {
        return scen.fault();
    }

    ThresholdTradeResult result;
    result.quote = std::move(*traded);
    result.fit = dist->fit();
    result.scenarios = *scen;
    result.expiry = expiry;

    if (!execute) {
        return result;
    }

    result.trade_id = generate_uuid();
    Notional payment = result.quote.payment;

    if (wallet_ && payment > 0.0) {
        if (wallet_->debit(user_id, payment, result.trade_id) != WalletStatus::OK) {
            spdlog::warn("Threshold trade for {} on {} not committed: insufficient funds for {:.6f}",
                         user_id, market_id, payment);
            return insufficient_funds(user_id, payment);
        }
    }

    lock->state() = std::move(scratch);
    result.executed = true;

    if (wallet_ && payment < 0.0) {
        wallet_->credit(user_id, -payment, result.trade_id);
    }

    if (ledger_) {
        TradeRecord record;
        record.trade_id = result.trade_id;
        record.user_id = user_id;
        record.market_id = market_id;
        record.amount = contracts;
        record.price = result.quote.price;
        record.payment = payment;
        record.prediction = Prediction{value, direction, expiry};
        record.timestamp = time_utils::now_iso8601();
        ledger_->record_trade(record);
    }

    spdlog::info("Threshold trade {}: {} {} {:.4f} @ {:.6g} on {} paid {:.6f}",
                 result.trade_id, user_id, direction_to_string(direction), contracts,
                 value, market_id, payment);

    return result;
}

// ============================================================================
// DISTRIBUTION & SNAPSHOTS
// ============================================================================

Result<DistributionReport> MarketService::get_implied_distribution(const std::string& market_id,
                                                                   std::optional<double> threshold) {
    auto lock = open_default(market_id);
    if (!lock) {
        return lock.fault();
    }

    const AmmState& state = lock->state();
    auto p = lmsr::prices(state.quantities(), state.b);
    if (!p) {
        return p.fault();
    }

    auto dist = ImpliedDistribution::calibrate(*p, state.values(), config_.calibration);
    if (!dist) {
        return dist.fault();
    }

    DistributionReport report;
    report.market_id = market_id;
    report.fit = dist->fit();

    if (threshold) {
        auto scen = dist->scenarios(*threshold);
        if (!scen) {
            return scen.fault();
        }
        report.scenarios = *scen;
    }
    return report;
}

Result<MarketSnapshot> MarketService::snapshot(const std::string& market_id) {
    auto lock = store_.acquire(market_id);
    if (!lock) {
        return no_market(market_id);
    }
    return make_snapshot(market_id, lock->state());
}

} // namespace cmm
