#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace cmm {

struct AmmConfig {
    double default_bankroll{5000.0};         // Max market-maker loss per market
    int default_knots{21};                   // Initial grid size
    double default_min_val{5e6};             // Lower grid bound ($5M)
    double default_max_val{1e12};            // Upper grid bound ($1T)
    double knot_tolerance{1e-6};             // Absolute dedup tolerance on x
    double max_fill_step{10.0};              // Max shares per fill step
    double max_order_size{1e5};              // Max shares per order or contracts per threshold trade
    double quote_size{1.0};                  // Size used for bid/ask ladders
};

struct CalibrationConfig {
    double tail_cutoff{0.10};                // Tail starts where upper mass exceeds 10%
    double alpha_delta{0.3};                 // Scenario bracket around fitted alpha
    double default_alpha{2.0};               // Used when the tail is too thin to fit
    double sigma2_floor{1e-8};               // Variance floor for the body fit
};

struct WalletConfig {
    std::string db_path{"./data/wallet.db"};
    double starting_balance{1000.0};         // Play money for new accounts
};

struct LoggingConfig {
    std::string log_dir{"./logs"};
    std::string log_level{"info"};           // debug, info, warn, error
    bool log_to_console{true};
    bool log_to_file{true};
    bool json_format{true};                  // JSON lines format
    int max_log_file_size_mb{100};
    int max_log_files{5};
};

struct Config {
    AmmConfig amm;
    CalibrationConfig calibration;
    WalletConfig wallet;
    LoggingConfig logging;

    std::string trade_ledger_path{"./data/trades.jsonl"};

    // Load from file
    static Config load(const std::string& path);

    // Save to file
    void save(const std::string& path) const;

    // Validate configuration
    bool validate() const;

    // Get environment variable with default
    static std::string get_env(const std::string& name, const std::string& default_val = "");
};

// JSON serialization
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace cmm
