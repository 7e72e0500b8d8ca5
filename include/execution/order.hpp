#pragma once

#include <string>
#include <optional>
#include "common/types.hpp"

namespace cmm {

/**
 * Immediate-or-cancel order against one knot of a market's AMM.
 * Not persisted beyond its processing.
 */
struct OrderRequest {
    std::string market_id;
    size_t bucket_index{0};
    Side side{Side::BUY};
    Size size{0.0};
    OrderType type{OrderType::MARKET};
    std::optional<Price> limit_price;   // Required for LIMIT, per share
};

/**
 * Outcome of stepping an order through the AMM.
 */
struct FillReport {
    // Identifiers
    std::string order_id;
    std::string market_id;
    size_t bucket_index{0};
    double knot_value{0.0};

    // Order details
    Side side{Side::BUY};
    OrderType type{OrderType::MARKET};
    Size requested{0.0};

    // Fill accounting
    Size filled{0.0};
    Size remaining{0.0};
    Notional total_payment{0.0};   // Paid for buys, received for sells
    int steps{0};

    // State
    OrderState state{OrderState::PENDING};

    // Set when a step faulted after earlier steps were committed
    std::optional<Fault> fault;

    // Computed values
    Price average_price() const;
    bool is_filled() const { return state == OrderState::FILLED; }

    // State transitions
    void mark_step(Size step_size, Notional step_payment);
    void mark_stopped(std::optional<Fault> step_fault = std::nullopt);
};

/**
 * Generate unique client order ID.
 */
std::string generate_order_id();

} // namespace cmm
