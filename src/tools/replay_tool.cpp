#include <iostream>
#include <fstream>
#include <iomanip>
#include <filesystem>
#include <set>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "common/types.hpp"
#include "config/config.hpp"
#include "service/market_service.hpp"
#include "wallet/sqlite_wallet.hpp"
#include "persistence/trade_ledger.hpp"
#include "utils/logging.hpp"
#include "utils/time_utils.hpp"

using namespace cmm;

/**
 * Replay tool: drives a MarketService from a JSON-lines request file and
 * prints one JSON result per request.
 *
 * Usage:
 *   ./cmm_replay --input requests.jsonl --config configs/cmm.json --user alice
 *
 * Request lines:
 *   {"type":"open","market":"gdp","knots":21,"min":5e6,"max":1e12,"bankroll":5000,"prior":[...]}
 *   {"type":"order","market":"gdp","bucket":3,"side":"buy","size":5}
 *   {"type":"order","market":"gdp","value":2e9,"side":"sell","size":5,"order_type":"limit","limit_price":0.04}
 *   {"type":"quote","market":"gdp","bucket":3,"size":1}
 *   {"type":"threshold","market":"gdp","value":1e9,"direction":"long","n":2,"execute":true,"expiry":"2027-01-01"}
 *   {"type":"bid_ask","market":"gdp"}
 *   {"type":"distribution","market":"gdp","threshold":1e10}
 *   {"type":"snapshot","market":"gdp"}
 */

struct ReplayStats {
    int requests{0};
    int faults{0};
    int orders_filled{0};
    int threshold_trades{0};
    int malformed{0};
};

namespace {

nlohmann::json fault_json(const Fault& f) {
    return {{"kind", fault_kind_to_string(f.kind)}, {"message", f.message}};
}

nlohmann::json quote_json(const lmsr::Quote& q) {
    return {{"bid", q.bid}, {"mid", q.mid}, {"ask", q.ask}, {"liquidity", q.liquidity}};
}

nlohmann::json fit_json(const DistributionFit& f) {
    return {
        {"mu", f.mu}, {"sigma", f.sigma}, {"alpha", f.alpha},
        {"tau_index", f.tau_index}, {"x_tau", f.x_tau},
        {"tail_mass", f.tail_mass}, {"s_tau", f.s_tau}
    };
}

nlohmann::json scenario_json(const ScenarioProbabilities& s) {
    return {
        {"threshold", s.threshold}, {"base", s.base}, {"low", s.low}, {"high", s.high},
        {"alpha_low", s.alpha_low}, {"alpha_high", s.alpha_high}
    };
}

nlohmann::json snapshot_json(const MarketSnapshot& s) {
    nlohmann::json knots = nlohmann::json::array();
    for (size_t k = 0; k < s.knots.size(); k++) {
        knots.push_back({{"x", s.knots[k].x}, {"q", s.knots[k].q}, {"p", s.prices[k]}});
    }
    return {
        {"market_id", s.market_id}, {"bankroll", s.bankroll}, {"b", s.b},
        {"min_val", s.min_val}, {"max_val", s.max_val}, {"knots", knots}
    };
}

template <typename T, typename F>
nlohmann::json respond(const std::string& type, const Result<T>& r, F&& to_json_fn, ReplayStats& stats) {
    nlohmann::json out{{"type", type}, {"ok", r.ok()}};
    if (r) {
        out["result"] = to_json_fn(*r);
    } else {
        stats.faults++;
        out["fault"] = fault_json(r.fault());
    }
    return out;
}

MarketParams params_from_request(const nlohmann::json& j, const AmmConfig& defaults) {
    MarketParams params = MarketParams::from_config(defaults);
    params.num_knots = j.value("knots", params.num_knots);
    params.min_val = j.value("min", params.min_val);
    params.max_val = j.value("max", params.max_val);
    params.bankroll = j.value("bankroll", params.bankroll);
    if (j.contains("prior")) {
        params.prior = ExplicitPrior{j.at("prior").get<std::vector<double>>()};
    }
    return params;
}

nlohmann::json handle_request(MarketService& service, const nlohmann::json& j,
                              const std::string& user, ReplayStats& stats) {
    std::string type = j.value("type", "");
    std::string market = j.value("market", "");

    if (type == "open") {
        auto r = service.open_market(market, params_from_request(j, service.config().amm));
        return respond(type, r, snapshot_json, stats);
    }

    if (type == "order") {
        auto side = side_from_string(j.value("side", "buy"));
        auto order_type = order_type_from_string(j.value("order_type", "market"));
        if (!side || !order_type) {
            stats.faults++;
            return {{"type", type}, {"ok", false},
                    {"fault", fault_json(configuration_fault("unknown side or order type"))}};
        }
        std::optional<Price> limit;
        if (j.contains("limit_price")) {
            limit = j.at("limit_price").get<double>();
        }
        Size size = j.value("size", 0.0);

        Result<FillReport> r = j.contains("value")
            ? service.place_order_at_value(user, market, j.at("value").get<double>(),
                                           *side, size, *order_type, limit)
            : service.place_order(user, OrderRequest{market, j.value("bucket", size_t{0}),
                                                     *side, size, *order_type, limit});
        if (r && r->filled > 0.0) {
            stats.orders_filled++;
        }
        return respond(type, r, [](const FillReport& f) { return nlohmann::json(f); }, stats);
    }

    if (type == "quote") {
        Size size = j.value("size", service.config().amm.quote_size);
        if (j.contains("value")) {
            auto r = service.get_quote_at_value(market, j.at("value").get<double>(), size);
            return respond(type, r, [](const ValueQuote& v) {
                auto out = quote_json(v.quote);
                out["value"] = v.value;
                out["knot_index"] = v.knot_index;
                out["N"] = v.num_knots;
                out["b"] = v.b;
                return out;
            }, stats);
        }
        auto r = service.get_quote(market, j.value("bucket", size_t{0}), size);
        return respond(type, r, quote_json, stats);
    }

    if (type == "threshold") {
        auto direction = direction_from_string(j.value("direction", "long"));
        if (!direction) {
            stats.faults++;
            return {{"type", type}, {"ok", false},
                    {"fault", fault_json(configuration_fault("unknown direction"))}};
        }
        auto r = service.quote_and_trade(user, market, j.value("value", 0.0), *direction,
                                         j.value("n", 1.0), j.value("execute", false),
                                         j.value("expiry", ""));
        if (r && r->executed) {
            stats.threshold_trades++;
        }
        return respond(type, r, [](const ThresholdTradeResult& t) {
            nlohmann::json out{
                {"price", t.quote.price}, {"payment", t.quote.payment},
                {"b", t.quote.b}, {"N", t.quote.num_knots},
                {"executed", t.executed},
                {"scenario", scenario_json(t.scenarios)},
                {"fit", fit_json(t.fit)},
                {"probs", t.quote.prices}
            };
            if (t.executed) {
                out["trade_id"] = t.trade_id;
                out["expiry"] = t.expiry;
            }
            return out;
        }, stats);
    }

    if (type == "bid_ask") {
        auto r = service.get_bid_ask(market);
        return respond(type, r, [](const std::vector<lmsr::KnotQuote>& ladder) {
            nlohmann::json out = nlohmann::json::array();
            for (const auto& k : ladder) {
                out.push_back({{"value", k.value}, {"mid", k.mid}, {"bid", k.bid}, {"ask", k.ask}});
            }
            return out;
        }, stats);
    }

    if (type == "distribution") {
        std::optional<double> threshold;
        if (j.contains("threshold")) {
            threshold = j.at("threshold").get<double>();
        }
        auto r = service.get_implied_distribution(market, threshold);
        return respond(type, r, [](const DistributionReport& d) {
            nlohmann::json out{{"market_id", d.market_id}, {"fit", fit_json(d.fit)}};
            if (d.scenarios) {
                out["scenario"] = scenario_json(*d.scenarios);
            }
            return out;
        }, stats);
    }

    if (type == "snapshot") {
        auto r = service.snapshot(market);
        return respond(type, r, snapshot_json, stats);
    }

    stats.faults++;
    return {{"type", type}, {"ok", false},
            {"fault", fault_json(configuration_fault("unknown request type: " + type))}};
}

} // namespace

int run_replay(const std::string& input_file, const std::string& default_user,
               const Config& config, bool verbose) {
    spdlog::info("Starting replay from: {}", input_file);

    std::ifstream file(input_file);
    if (!file.is_open()) {
        spdlog::error("Failed to open input file: {}", input_file);
        return 1;
    }

    std::filesystem::path db_path(config.wallet.db_path);
    if (db_path.has_parent_path()) {
        std::filesystem::create_directories(db_path.parent_path());
    }

    auto wallet = std::make_shared<SqliteWallet>(config.wallet.db_path);
    auto ledger = std::make_shared<TradeLedger>(config.trade_ledger_path);
    MarketService service(config, wallet, ledger);

    ReplayStats stats;
    std::set<std::string> funded;

    std::string line;
    size_t line_no = 0;
    while (std::getline(file, line)) {
        line_no++;
        if (line.empty()) continue;

        nlohmann::json request = nlohmann::json::parse(line, nullptr, false);
        if (request.is_discarded() || !request.is_object()) {
            stats.malformed++;
            spdlog::warn("Skipping malformed request on line {}", line_no);
            continue;
        }

        std::string user = request.value("user", default_user);
        if (funded.insert(user).second) {
            wallet->ensure_account(user, config.wallet.starting_balance);
        }

        time_utils::LatencyTimer timer;
        timer.start();

        nlohmann::json response;
        try {
            response = handle_request(service, request, user, stats);
        } catch (const nlohmann::json::exception& e) {
            stats.malformed++;
            spdlog::warn("Bad field on line {}: {}", line_no, e.what());
            continue;
        }

        timer.stop();
        stats.requests++;

        if (verbose) {
            response["latency_us"] = timer.elapsed_us();
        }
        std::cout << response.dump() << "\n";
    }

    ledger->flush();

    std::cerr << "\n";
    std::cerr << "════════════════════════════════════════════════════════\n";
    std::cerr << "                    REPLAY RESULTS                       \n";
    std::cerr << "════════════════════════════════════════════════════════\n";
    std::cerr << "Requests processed: " << stats.requests << "\n";
    std::cerr << "Faults:             " << stats.faults << "\n";
    std::cerr << "Malformed lines:    " << stats.malformed << "\n";
    std::cerr << "Orders filled:      " << stats.orders_filled << "\n";
    std::cerr << "Threshold trades:   " << stats.threshold_trades << "\n";
    std::cerr << "────────────────────────────────────────────────────────\n";
    for (const auto& user : funded) {
        std::cerr << "Balance " << std::setw(12) << std::left << user << " "
                  << std::fixed << std::setprecision(6) << wallet->get_balance(user) << "\n";
    }
    std::cerr << "════════════════════════════════════════════════════════\n";

    return 0;
}

int main(int argc, char* argv[]) {
    CLI::App app{"cmm replay tool - drive the market maker from a request file"};

    std::string input_file;
    std::string config_path = "configs/cmm.json";
    std::string user = "demo";
    bool verbose = false;

    app.add_option("-i,--input", input_file, "JSON-lines request file")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option("-c,--config", config_path, "Path to configuration file");
    app.add_option("-u,--user", user, "User for requests that do not name one")
        ->default_val("demo");
    app.add_flag("-v,--verbose", verbose, "Debug logging and per-request latency");

    CLI11_PARSE(app, argc, argv);

    Config config;
    if (std::filesystem::exists(config_path)) {
        try {
            config = Config::load(config_path);
        } catch (const std::exception& e) {
            std::cerr << "Failed to load config " << config_path << ": " << e.what() << "\n";
            return 1;
        }
    }
    if (verbose) {
        config.logging.log_level = "debug";
    }

    setup_logging(config.logging, "cmm_replay");

    if (!config.validate()) {
        spdlog::error("Invalid configuration, aborting");
        return 1;
    }

    try {
        return run_replay(input_file, user, config, verbose);
    } catch (const std::exception& e) {
        spdlog::error("Replay failed: {}", e.what());
        return 1;
    }
}
