#pragma once

#include "common/types.hpp"
#include "amm/knot_store.hpp"
#include "execution/order.hpp"

namespace cmm {

/**
 * Steps market and limit orders through the LMSR cost function.
 *
 * Each step moves the target knot by min(remaining, max_step) shares and is
 * priced as the cost delta of that move (per share: delta / step). A limit
 * order stops at the first step whose per-share price is worse than the
 * limit; there is no backtracking and nothing rests. Each accepted step is
 * written to the state immediately, so a fault on a later step leaves the
 * earlier ones in place and is reported on the FillReport.
 *
 * Orders larger than max_order_size are rejected up front, which bounds the
 * number of steps taken under the market's lock.
 *
 * The caller owns locking: execute() must run under the market's lock.
 */
class OrderExecutor {
public:
    explicit OrderExecutor(Size max_step = 10.0, Size max_order_size = 1e5);

    // CONFIGURATION fault (nothing mutated) for a malformed request
    Result<FillReport> execute(AmmState& state, const OrderRequest& request) const;

    Size max_step() const { return max_step_; }
    Size max_order_size() const { return max_order_size_; }

private:
    Size max_step_;
    Size max_order_size_;

    std::optional<Fault> validate(const AmmState& state, const OrderRequest& request) const;
};

} // namespace cmm
