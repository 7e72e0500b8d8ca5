#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <variant>
#include <cstdint>
#include <utility>

namespace cmm {

// Time types
using Timestamp = std::chrono::time_point<std::chrono::steady_clock>;
using WallClock = std::chrono::time_point<std::chrono::system_clock>;
using Duration = std::chrono::nanoseconds;

inline Timestamp now() {
    return std::chrono::steady_clock::now();
}

inline WallClock wall_now() {
    return std::chrono::system_clock::now();
}

// Prices are probabilities in [0, 1]; payments are in play-money units
using Price = double;
using Size = double;
using Notional = double;

// Side enum
enum class Side {
    BUY,
    SELL
};

inline std::string side_to_string(Side s) {
    return s == Side::BUY ? "BUY" : "SELL";
}

inline std::optional<Side> side_from_string(const std::string& s) {
    if (s == "buy" || s == "BUY") return Side::BUY;
    if (s == "sell" || s == "SELL") return Side::SELL;
    return std::nullopt;
}

// Order types. Every order is immediate-or-cancel against the AMM.
enum class OrderType {
    MARKET,
    LIMIT
};

inline std::string order_type_to_string(OrderType t) {
    switch (t) {
        case OrderType::MARKET: return "MARKET";
        case OrderType::LIMIT: return "LIMIT";
    }
    return "UNKNOWN";
}

inline std::optional<OrderType> order_type_from_string(const std::string& s) {
    if (s == "market" || s == "MARKET") return OrderType::MARKET;
    if (s == "limit" || s == "LIMIT") return OrderType::LIMIT;
    return std::nullopt;
}

// Order state
enum class OrderState {
    PENDING,      // Accepted, not yet stepped
    PARTIAL,      // Stopped before the full size (limit not met or fault)
    FILLED,       // Fully filled
    REJECTED      // Failed validation, nothing executed
};

inline std::string order_state_to_string(OrderState s) {
    switch (s) {
        case OrderState::PENDING: return "PENDING";
        case OrderState::PARTIAL: return "PARTIAL";
        case OrderState::FILLED: return "FILLED";
        case OrderState::REJECTED: return "REJECTED";
    }
    return "UNKNOWN";
}

// Threshold contract direction
enum class Direction {
    LONG,   // Pays 1 if the outcome resolves at or above the threshold
    SHORT   // Pays 1 if the outcome resolves at or below the threshold
};

inline std::string direction_to_string(Direction d) {
    return d == Direction::LONG ? "long" : "short";
}

inline std::optional<Direction> direction_from_string(const std::string& s) {
    if (s == "long" || s == "above" || s == "LONG") return Direction::LONG;
    if (s == "short" || s == "below" || s == "SHORT") return Direction::SHORT;
    return std::nullopt;
}

// ============================================================================
// FAULTS
//
// Core operations return Result<T>: either a value or a typed fault. Only
// invariant violations (empty grid, non-positive liquidity) throw.
// ============================================================================

enum class FaultKind {
    CONFIGURATION,        // Unknown market, bad grid bounds, bad request
    LIQUIDITY_EXHAUSTED,  // Cost function overflowed or went non-finite
    MATH,                 // Negative/non-finite quote, degenerate fit
    INSUFFICIENT_FUNDS    // Wallet refused the debit
};

inline std::string fault_kind_to_string(FaultKind k) {
    switch (k) {
        case FaultKind::CONFIGURATION: return "configuration";
        case FaultKind::LIQUIDITY_EXHAUSTED: return "liquidity_exhausted";
        case FaultKind::MATH: return "math";
        case FaultKind::INSUFFICIENT_FUNDS: return "insufficient_funds";
    }
    return "unknown";
}

struct Fault {
    FaultKind kind{FaultKind::MATH};
    std::string message;
};

inline Fault configuration_fault(std::string message) {
    return Fault{FaultKind::CONFIGURATION, std::move(message)};
}

inline Fault liquidity_exhausted() {
    return Fault{FaultKind::LIQUIDITY_EXHAUSTED, "liquidity exhausted"};
}

inline Fault math_fault(std::string message) {
    return Fault{FaultKind::MATH, std::move(message)};
}

template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Fault fault) : data_(std::move(fault)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }
    const Fault& fault() const { return std::get<Fault>(data_); }

    const T& operator*() const { return value(); }
    T& operator*() { return value(); }
    const T* operator->() const { return &value(); }
    T* operator->() { return &value(); }

private:
    std::variant<T, Fault> data_;
};

} // namespace cmm
