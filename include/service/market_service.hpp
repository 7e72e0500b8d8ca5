#pragma once

#include <memory>
#include <string>
#include <vector>
#include <optional>
#include "common/types.hpp"
#include "config/config.hpp"
#include "amm/knot_store.hpp"
#include "amm/lmsr.hpp"
#include "execution/order.hpp"
#include "execution/order_executor.hpp"
#include "contracts/threshold_pricer.hpp"
#include "distribution/implied_distribution.hpp"
#include "wallet/wallet.hpp"
#include "persistence/trade_ledger.hpp"

namespace cmm {

struct MarketSnapshot {
    std::string market_id;
    std::vector<Knot> knots;
    std::vector<Price> prices;
    double bankroll{0.0};
    double b{0.0};
    double min_val{0.0};
    double max_val{0.0};
};

// Quote at an arbitrary value, priced as if the value were a knot
struct ValueQuote {
    double value{0.0};
    size_t knot_index{0};
    size_t num_knots{0};
    double b{0.0};
    lmsr::Quote quote;
};

struct ThresholdTradeResult {
    ThresholdQuote quote;
    DistributionFit fit;
    ScenarioProbabilities scenarios;
    bool executed{false};
    std::string trade_id;        // Set when executed
    std::string expiry;
};

struct DistributionReport {
    std::string market_id;
    DistributionFit fit;
    std::optional<ScenarioProbabilities> scenarios;
};

/**
 * Request surface of the market maker.
 *
 * Every operation on a market runs under that market's lock for its whole
 * read-compute-write sequence. Trades are planned on a copy of the state,
 * paid for, and only then written back:
 *
 *   1. plan the fill or threshold trade on a scratch copy
 *   2. debit the buyer (INSUFFICIENT_FUNDS leaves the market untouched)
 *   3. commit the scratch state
 *   4. credit sale proceeds, append to the trade ledger
 *
 * Index-addressed operations require an open market. Value-addressed
 * operations open the market with the configured defaults on first touch
 * and insert the value as a knot before resolving it.
 *
 * The wallet and ledger are optional; without a wallet no money moves.
 */
class MarketService {
public:
    explicit MarketService(const Config& config,
                           std::shared_ptr<Wallet> wallet = nullptr,
                           std::shared_ptr<TradeLedger> ledger = nullptr);

    // Non-copyable
    MarketService(const MarketService&) = delete;
    MarketService& operator=(const MarketService&) = delete;

    // Open a market with explicit parameters; an already open market is
    // returned unchanged
    Result<MarketSnapshot> open_market(const std::string& market_id, const MarketParams& params);

    Result<FillReport> place_order(const std::string& user_id, const OrderRequest& request);

    Result<FillReport> place_order_at_value(const std::string& user_id,
                                            const std::string& market_id,
                                            double value,
                                            Side side,
                                            Size size,
                                            OrderType type = OrderType::MARKET,
                                            std::optional<Price> limit_price = std::nullopt);

    Result<lmsr::Quote> get_quote(const std::string& market_id, size_t bucket_index, Size size = 1.0);

    // Does not mutate the market
    Result<ValueQuote> get_quote_at_value(const std::string& market_id, double value, Size size = 1.0);

    Result<ThresholdTradeResult> quote_and_trade(const std::string& user_id,
                                                 const std::string& market_id,
                                                 double value,
                                                 Direction direction,
                                                 Size contracts,
                                                 bool execute,
                                                 const std::string& expiry = "");

    Result<std::vector<lmsr::KnotQuote>> get_bid_ask(const std::string& market_id);

    Result<DistributionReport> get_implied_distribution(const std::string& market_id,
                                                        std::optional<double> threshold = std::nullopt);

    Result<MarketSnapshot> snapshot(const std::string& market_id);

    std::vector<std::string> market_ids() const { return store_.market_ids(); }

    const Config& config() const { return config_; }

private:
    Config config_;
    KnotStore store_;
    OrderExecutor executor_;
    ThresholdPricer pricer_;
    std::shared_ptr<Wallet> wallet_;
    std::shared_ptr<TradeLedger> ledger_;

    MarketParams default_params() const;
    Result<MarketLock> open_default(const std::string& market_id);

    // Plan on a copy of `lock`'s state, settle with the wallet, commit
    Result<FillReport> settle_order(MarketLock& lock, AmmState scratch,
                                    const std::string& user_id, const OrderRequest& request);

    static Result<MarketSnapshot> make_snapshot(const std::string& market_id, const AmmState& state);
};

} // namespace cmm
