#include "execution/order_executor.hpp"
#include "amm/lmsr.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace cmm {

OrderExecutor::OrderExecutor(Size max_step, Size max_order_size)
    : max_step_(max_step)
    , max_order_size_(max_order_size)
{
    if (!(max_step_ > 0.0)) {
        throw std::invalid_argument("max fill step must be positive");
    }
    if (!(max_order_size_ >= max_step_) || !std::isfinite(max_order_size_)) {
        throw std::invalid_argument("max order size must be finite and at least the fill step");
    }
}

std::optional<Fault> OrderExecutor::validate(const AmmState& state, const OrderRequest& request) const {
    if (!std::isfinite(request.size) || request.size <= 0.0) {
        return configuration_fault(fmt::format("order size must be positive, got {}", request.size));
    }
    if (request.size > max_order_size_) {
        return configuration_fault(fmt::format("order size {} exceeds the maximum of {}",
                                               request.size, max_order_size_));
    }
    if (request.bucket_index >= state.size()) {
        return configuration_fault(fmt::format("bucket index {} out of range (N={})",
                                               request.bucket_index, state.size()));
    }
    if (request.type == OrderType::LIMIT &&
        (!request.limit_price || !std::isfinite(*request.limit_price))) {
        return configuration_fault("limit order requires a finite limit price");
    }
    return std::nullopt;
}

Result<FillReport> OrderExecutor::execute(AmmState& state, const OrderRequest& request) const {
    if (auto invalid = validate(state, request)) {
        spdlog::warn("Order rejected: {}", invalid->message);
        return *invalid;
    }

    const size_t k = request.bucket_index;

    FillReport report;
    report.order_id = generate_order_id();
    report.market_id = request.market_id;
    report.bucket_index = k;
    report.knot_value = state.knots[k].x;
    report.side = request.side;
    report.type = request.type;
    report.requested = request.size;
    report.remaining = request.size;

    std::optional<Fault> step_fault;

    while (report.remaining > 0.0) {
        Size dq = std::min(report.remaining, max_step_);

        auto q_before = state.quantities();
        auto q_after = q_before;

        // Buys pay C(after) - C(before); sells receive C(before) - C(after)
        Result<double> payment = 0.0;
        if (request.side == Side::BUY) {
            q_after[k] += dq;
            payment = lmsr::cost_delta(q_before, q_after, state.b);
        } else {
            q_after[k] -= dq;
            payment = lmsr::cost_delta(q_after, q_before, state.b);
        }

        if (!payment) {
            step_fault = payment.fault();
            break;
        }
        if (*payment < 0.0) {
            step_fault = math_fault(fmt::format("negative step cost {} at knot {}", *payment, k));
            break;
        }

        Price step_price = *payment / dq;

        if (request.type == OrderType::LIMIT) {
            Price limit = *request.limit_price;
            if ((request.side == Side::BUY && step_price > limit) ||
                (request.side == Side::SELL && step_price < limit)) {
                spdlog::debug("Limit not met: {} step @ {:.6f} vs limit {:.6f}",
                              side_to_string(request.side), step_price, limit);
                break;
            }
        }

        state.knots[k].q = q_after[k];
        report.mark_step(dq, *payment);

        spdlog::debug("Fill step {}: {} {:.4f} @ {:.6f} at x={:.6g}",
                      report.steps, side_to_string(request.side), dq, step_price, report.knot_value);
    }

    report.mark_stopped(step_fault);

    if (report.fault) {
        spdlog::error("Order {} stopped by fault after {:.4f}/{:.4f}: {}",
                      report.order_id, report.filled, report.requested, report.fault->message);
    } else {
        spdlog::info("Order {} {}: {} {} {:.4f}/{:.4f} at knot {} avg={:.6f}",
                     report.order_id, order_state_to_string(report.state),
                     order_type_to_string(request.type), side_to_string(request.side),
                     report.filled, report.requested, k, report.average_price());
    }

    return report;
}

} // namespace cmm
