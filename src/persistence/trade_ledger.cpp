#include "persistence/trade_ledger.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace cmm {

// JSON serialization helpers

void to_json(nlohmann::json& j, const Prediction& p) {
    j = nlohmann::json{
        {"value", p.value},
        {"direction", direction_to_string(p.direction)},
        {"expiry", p.expiry}
    };
}

void from_json(const nlohmann::json& j, Prediction& p) {
    p.value = j.value("value", 0.0);
    p.direction = direction_from_string(j.value("direction", "long")).value_or(Direction::LONG);
    p.expiry = j.value("expiry", "");
}

void to_json(nlohmann::json& j, const TradeRecord& t) {
    j = nlohmann::json{
        {"trade_id", t.trade_id},
        {"user_id", t.user_id},
        {"market_id", t.market_id},
        {"amount", t.amount},
        {"price", t.price},
        {"payment", t.payment},
        {"prediction", t.prediction},
        {"timestamp", t.timestamp}
    };
}

void from_json(const nlohmann::json& j, TradeRecord& t) {
    t.trade_id = j.value("trade_id", "");
    t.user_id = j.value("user_id", "");
    t.market_id = j.value("market_id", "");
    t.amount = j.value("amount", 0.0);
    t.price = j.value("price", 0.0);
    t.payment = j.value("payment", 0.0);
    if (j.contains("prediction")) {
        j.at("prediction").get_to(t.prediction);
    }
    t.timestamp = j.value("timestamp", "");
}

void to_json(nlohmann::json& j, const FillReport& f) {
    j = nlohmann::json{
        {"order_id", f.order_id},
        {"market_id", f.market_id},
        {"bucket_index", f.bucket_index},
        {"knot_value", f.knot_value},
        {"side", side_to_string(f.side)},
        {"type", order_type_to_string(f.type)},
        {"requested", f.requested},
        {"filled", f.filled},
        {"remaining", f.remaining},
        {"total_payment", f.total_payment},
        {"avg_price", f.average_price()},
        {"steps", f.steps},
        {"state", order_state_to_string(f.state)}
    };
    if (f.fault) {
        j["fault"] = {
            {"kind", fault_kind_to_string(f.fault->kind)},
            {"message", f.fault->message}
        };
    }
}

void from_json(const nlohmann::json& j, FillReport& f) {
    f.order_id = j.value("order_id", "");
    f.market_id = j.value("market_id", "");
    f.bucket_index = j.value("bucket_index", size_t{0});
    f.knot_value = j.value("knot_value", 0.0);
    f.side = side_from_string(j.value("side", "BUY")).value_or(Side::BUY);
    f.type = order_type_from_string(j.value("type", "MARKET")).value_or(OrderType::MARKET);
    f.requested = j.value("requested", 0.0);
    f.filled = j.value("filled", 0.0);
    f.remaining = j.value("remaining", 0.0);
    f.total_payment = j.value("total_payment", 0.0);
    f.steps = j.value("steps", 0);

    std::string state = j.value("state", "PENDING");
    if (state == "FILLED") f.state = OrderState::FILLED;
    else if (state == "PARTIAL") f.state = OrderState::PARTIAL;
    else if (state == "REJECTED") f.state = OrderState::REJECTED;
    else f.state = OrderState::PENDING;

    if (j.contains("fault")) {
        const auto& fj = j.at("fault");
        std::string kind = fj.value("kind", "math");
        Fault fault;
        if (kind == "configuration") fault.kind = FaultKind::CONFIGURATION;
        else if (kind == "liquidity_exhausted") fault.kind = FaultKind::LIQUIDITY_EXHAUSTED;
        else if (kind == "insufficient_funds") fault.kind = FaultKind::INSUFFICIENT_FUNDS;
        else fault.kind = FaultKind::MATH;
        fault.message = fj.value("message", "");
        f.fault = fault;
    }
}

// TradeLedger implementation

TradeLedger::TradeLedger(const std::string& path)
    : path_(path)
{
    open_file();
}

TradeLedger::~TradeLedger() {
    flush();
    if (file_.is_open()) {
        file_.close();
    }
}

void TradeLedger::open_file() {
    // Create directory if needed
    std::filesystem::path p(path_);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }

    file_.open(path_, std::ios::app);
    if (!file_.is_open()) {
        spdlog::error("Failed to open trade ledger: {}", path_);
        throw std::runtime_error("Failed to open trade ledger: " + path_);
    }
    spdlog::info("Trade ledger opened: {}", path_);
}

void TradeLedger::write_line(const nlohmann::json& j) {
    std::lock_guard<std::mutex> lock(mutex_);
    file_ << j.dump() << "\n";
    if (!file_) {
        throw std::runtime_error("Failed to write trade ledger: " + path_);
    }
}

void TradeLedger::record_trade(const TradeRecord& trade) {
    nlohmann::json j;
    j["event_type"] = "threshold_trade";
    j["timestamp"] = time_utils::now_iso8601();
    j["data"] = trade;
    write_line(j);
}

void TradeLedger::record_fill(const std::string& user_id, const FillReport& fill) {
    nlohmann::json j;
    j["event_type"] = "fill";
    j["timestamp"] = time_utils::now_iso8601();
    j["data"] = fill;
    j["data"]["user_id"] = user_id;
    write_line(j);
}

void TradeLedger::record_event(const std::string& event_type, const nlohmann::json& data) {
    nlohmann::json j;
    j["event_type"] = event_type;
    j["timestamp"] = time_utils::now_iso8601();
    j["data"] = data;
    write_line(j);
}

void TradeLedger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

size_t TradeLedger::file_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    auto size = std::filesystem::file_size(path_, ec);
    return ec ? 0 : static_cast<size_t>(size);
}

template <typename T>
std::vector<T> TradeLedger::read_events(const std::string& event_type) const {
    std::vector<T> events;

    std::ifstream file(path_);
    std::string line;
    size_t line_no = 0;

    while (std::getline(file, line)) {
        line_no++;
        if (line.empty()) continue;

        auto j = nlohmann::json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object() || !j.contains("data")) {
            spdlog::warn("Skipping malformed ledger line {} in {}", line_no, path_);
            continue;
        }
        if (j.value("event_type", "") != event_type) continue;

        try {
            events.push_back(j.at("data").get<T>());
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("Skipping malformed {} record on line {}: {}", event_type, line_no, e.what());
        }
    }

    return events;
}

std::vector<TradeRecord> TradeLedger::read_trades() const {
    return read_events<TradeRecord>("threshold_trade");
}

std::vector<FillReport> TradeLedger::read_fills() const {
    return read_events<FillReport>("fill");
}

} // namespace cmm
