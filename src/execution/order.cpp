#include "execution/order.hpp"
#include <random>
#include <sstream>
#include <iomanip>

namespace cmm {

Price FillReport::average_price() const {
    if (filled <= 0.0) return 0.0;
    return total_payment / filled;
}

void FillReport::mark_step(Size step_size, Notional step_payment) {
    filled += step_size;
    remaining = requested - filled;
    total_payment += step_payment;
    steps++;

    if (remaining <= 0.0) {
        remaining = 0.0;
        state = OrderState::FILLED;
    } else {
        state = OrderState::PARTIAL;
    }
}

void FillReport::mark_stopped(std::optional<Fault> step_fault) {
    fault = std::move(step_fault);
    remaining = requested - filled;
    state = remaining <= 0.0 && !fault ? OrderState::FILLED : OrderState::PARTIAL;
}

std::string generate_order_id() {
    thread_local std::random_device rd;
    thread_local std::mt19937_64 gen(rd());
    thread_local std::uniform_int_distribution<uint64_t> dis;

    std::stringstream ss;
    ss << "ORD-" << std::hex << std::setw(16) << std::setfill('0') << dis(gen);
    return ss.str();
}

} // namespace cmm
