#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "execution/order.hpp"

namespace cmm {

/**
 * The bet a threshold trade expresses: the outcome lands at/above (long)
 * or at/below (short) `value` by `expiry`.
 */
struct Prediction {
    double value{0.0};
    Direction direction{Direction::LONG};
    std::string expiry;
};

struct TradeRecord {
    std::string trade_id;
    std::string user_id;
    std::string market_id;
    Size amount{0.0};          // Contracts; negative when selling back
    Price price{0.0};          // Instantaneous price per contract before the trade
    Notional payment{0.0};     // Cost delta paid (negative = received)
    Prediction prediction;
    std::string timestamp;     // ISO 8601
};

void to_json(nlohmann::json& j, const Prediction& p);
void from_json(const nlohmann::json& j, Prediction& p);
void to_json(nlohmann::json& j, const TradeRecord& t);
void from_json(const nlohmann::json& j, TradeRecord& t);
void to_json(nlohmann::json& j, const FillReport& f);
void from_json(const nlohmann::json& j, FillReport& f);

/**
 * Append-only trade ledger. Writes JSON lines of the form
 * {"event_type": ..., "timestamp": ..., "data": {...}}.
 */
class TradeLedger {
public:
    explicit TradeLedger(const std::string& path);
    ~TradeLedger();

    void record_trade(const TradeRecord& trade);
    void record_fill(const std::string& user_id, const FillReport& fill);

    // Generic event recording
    void record_event(const std::string& event_type, const nlohmann::json& data);

    // Read back; malformed lines are skipped
    std::vector<TradeRecord> read_trades() const;
    std::vector<FillReport> read_fills() const;

    void flush();
    size_t file_size() const;
    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::ofstream file_;
    mutable std::mutex mutex_;

    void open_file();
    void write_line(const nlohmann::json& j);

    template <typename T>
    std::vector<T> read_events(const std::string& event_type) const;
};

} // namespace cmm
