#include "config/config.hpp"
#include <fstream>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace cmm {

void to_json(nlohmann::json& j, const AmmConfig& c) {
    j = nlohmann::json{
        {"default_bankroll", c.default_bankroll},
        {"default_knots", c.default_knots},
        {"default_min_val", c.default_min_val},
        {"default_max_val", c.default_max_val},
        {"knot_tolerance", c.knot_tolerance},
        {"max_fill_step", c.max_fill_step},
        {"max_order_size", c.max_order_size},
        {"quote_size", c.quote_size}
    };
}

void from_json(const nlohmann::json& j, AmmConfig& c) {
    if (j.contains("default_bankroll")) j.at("default_bankroll").get_to(c.default_bankroll);
    if (j.contains("default_knots")) j.at("default_knots").get_to(c.default_knots);
    if (j.contains("default_min_val")) j.at("default_min_val").get_to(c.default_min_val);
    if (j.contains("default_max_val")) j.at("default_max_val").get_to(c.default_max_val);
    if (j.contains("knot_tolerance")) j.at("knot_tolerance").get_to(c.knot_tolerance);
    if (j.contains("max_fill_step")) j.at("max_fill_step").get_to(c.max_fill_step);
    if (j.contains("max_order_size")) j.at("max_order_size").get_to(c.max_order_size);
    if (j.contains("quote_size")) j.at("quote_size").get_to(c.quote_size);
}

void to_json(nlohmann::json& j, const CalibrationConfig& c) {
    j = nlohmann::json{
        {"tail_cutoff", c.tail_cutoff},
        {"alpha_delta", c.alpha_delta},
        {"default_alpha", c.default_alpha},
        {"sigma2_floor", c.sigma2_floor}
    };
}

void from_json(const nlohmann::json& j, CalibrationConfig& c) {
    if (j.contains("tail_cutoff")) j.at("tail_cutoff").get_to(c.tail_cutoff);
    if (j.contains("alpha_delta")) j.at("alpha_delta").get_to(c.alpha_delta);
    if (j.contains("default_alpha")) j.at("default_alpha").get_to(c.default_alpha);
    if (j.contains("sigma2_floor")) j.at("sigma2_floor").get_to(c.sigma2_floor);
}

void to_json(nlohmann::json& j, const WalletConfig& c) {
    j = nlohmann::json{
        {"db_path", c.db_path},
        {"starting_balance", c.starting_balance}
    };
}

void from_json(const nlohmann::json& j, WalletConfig& c) {
    if (j.contains("db_path")) j.at("db_path").get_to(c.db_path);
    if (j.contains("starting_balance")) j.at("starting_balance").get_to(c.starting_balance);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = nlohmann::json{
        {"log_dir", c.log_dir},
        {"log_level", c.log_level},
        {"log_to_console", c.log_to_console},
        {"log_to_file", c.log_to_file},
        {"json_format", c.json_format},
        {"max_log_file_size_mb", c.max_log_file_size_mb},
        {"max_log_files", c.max_log_files}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    if (j.contains("log_dir")) j.at("log_dir").get_to(c.log_dir);
    if (j.contains("log_level")) j.at("log_level").get_to(c.log_level);
    if (j.contains("log_to_console")) j.at("log_to_console").get_to(c.log_to_console);
    if (j.contains("log_to_file")) j.at("log_to_file").get_to(c.log_to_file);
    if (j.contains("json_format")) j.at("json_format").get_to(c.json_format);
    if (j.contains("max_log_file_size_mb")) j.at("max_log_file_size_mb").get_to(c.max_log_file_size_mb);
    if (j.contains("max_log_files")) j.at("max_log_files").get_to(c.max_log_files);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"amm", c.amm},
        {"calibration", c.calibration},
        {"wallet", c.wallet},
        {"logging", c.logging},
        {"trade_ledger_path", c.trade_ledger_path}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("amm")) j.at("amm").get_to(c.amm);
    if (j.contains("calibration")) j.at("calibration").get_to(c.calibration);
    if (j.contains("wallet")) j.at("wallet").get_to(c.wallet);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
    if (j.contains("trade_ledger_path")) j.at("trade_ledger_path").get_to(c.trade_ledger_path);
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    nlohmann::json j;
    file >> j;

    Config config;
    from_json(j, config);

    if (!config.validate()) {
        throw std::runtime_error("Invalid configuration in: " + path);
    }

    return config;
}

void Config::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create config file: " + path);
    }

    nlohmann::json j;
    to_json(j, *this);
    file << j.dump(2);
}

bool Config::validate() const {
    if (amm.default_bankroll <= 0) {
        spdlog::error("default_bankroll must be positive");
        return false;
    }

    if (amm.default_knots < 2) {
        spdlog::error("default_knots must be at least 2");
        return false;
    }

    if (amm.default_min_val <= 0 || amm.default_max_val <= amm.default_min_val) {
        spdlog::error("grid bounds must satisfy 0 < default_min_val < default_max_val");
        return false;
    }

    if (amm.knot_tolerance <= 0) {
        spdlog::error("knot_tolerance must be positive");
        return false;
    }

    if (amm.max_fill_step <= 0) {
        spdlog::error("max_fill_step must be positive");
        return false;
    }

    if (!(amm.max_order_size >= amm.max_fill_step) || !std::isfinite(amm.max_order_size)) {
        spdlog::error("max_order_size must be finite and at least max_fill_step");
        return false;
    }

    if (amm.quote_size <= 0) {
        spdlog::error("quote_size must be positive");
        return false;
    }

    if (calibration.tail_cutoff <= 0 || calibration.tail_cutoff >= 1) {
        spdlog::error("tail_cutoff must be in (0, 1)");
        return false;
    }

    if (calibration.default_alpha <= 0 || calibration.sigma2_floor <= 0) {
        spdlog::error("default_alpha and sigma2_floor must be positive");
        return false;
    }

    if (calibration.alpha_delta < 0) {
        spdlog::error("alpha_delta must be non-negative");
        return false;
    }

    if (calibration.alpha_delta >= calibration.default_alpha) {
        spdlog::warn("alpha_delta >= default_alpha, low-alpha scenarios will be clamped");
    }

    if (wallet.starting_balance < 0) {
        spdlog::error("starting_balance must be non-negative");
        return false;
    }

    return true;
}

std::string Config::get_env(const std::string& name, const std::string& default_val) {
    const char* val = std::getenv(name.c_str());
    return val ? std::string(val) : default_val;
}

} // namespace cmm
