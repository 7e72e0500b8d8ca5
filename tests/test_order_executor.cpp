#include <gtest/gtest.h>
#include "execution/order_executor.hpp"
#include "amm/lmsr.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>

using namespace cmm;

class OrderExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        // bankroll 10 over 5 knots: b = 10 / ln 5, so a 10-share step scales a knot's weight by 5
        MarketParams params;
        params.num_knots = 5;
        params.min_val = 1.0;
        params.max_val = 100.0;
        params.bankroll = 10.0;
        auto built = build_initial_state(params);
        ASSERT_TRUE(built.ok());
        state_ = *built;
    }

    AmmState state_;
    OrderExecutor executor_{10.0};

    OrderRequest market_order(Side side, Size size, size_t bucket = 0) {
        OrderRequest req;
        req.market_id = "test-market";
        req.bucket_index = bucket;
        req.side = side;
        req.size = size;
        req.type = OrderType::MARKET;
        return req;
    }

    OrderRequest limit_order(Side side, Size size, Price limit, size_t bucket = 0) {
        auto req = market_order(side, size, bucket);
        req.type = OrderType::LIMIT;
        req.limit_price = limit;
        return req;
    }
};

// ============================================================================
// Market orders
// ============================================================================

TEST_F(OrderExecutorTest, MarketBuyFillsInSteps) {
    double q0 = state_.knots[0].q;

    auto fill = executor_.execute(state_, market_order(Side::BUY, 25.0));
    ASSERT_TRUE(fill.ok());

    EXPECT_EQ(fill->state, OrderState::FILLED);
    EXPECT_DOUBLE_EQ(fill->filled, 25.0);
    EXPECT_DOUBLE_EQ(fill->remaining, 0.0);
    EXPECT_EQ(fill->steps, 3);
    EXPECT_FALSE(fill->fault.has_value());
    EXPECT_NEAR(state_.knots[0].q, q0 + 25.0, 1e-9);
    EXPECT_EQ(fill->knot_value, 1.0);
}

TEST_F(OrderExecutorTest, MarketBuyPaysTheCostDelta) {
    auto q_before = state_.quantities();
    auto fill = executor_.execute(state_, market_order(Side::BUY, 10.0));
    ASSERT_TRUE(fill.ok());

    auto expected = lmsr::cost_delta(q_before, state_.quantities(), state_.b);
    ASSERT_TRUE(expected.ok());
    EXPECT_NEAR(fill->total_payment, *expected, 1e-9);

    // One step: b * ln((4 + 5) / 5)
    EXPECT_NEAR(fill->total_payment, state_.b * std::log(9.0 / 5.0), 1e-9);
    EXPECT_NEAR(fill->average_price(), fill->total_payment / 10.0, 1e-12);
}

TEST_F(OrderExecutorTest, AveragePriceLiesBetweenMarginalPrices) {
    auto p_before = lmsr::prices(state_.quantities(), state_.b);
    auto fill = executor_.execute(state_, market_order(Side::BUY, 7.0, 2));
    auto p_after = lmsr::prices(state_.quantities(), state_.b);

    ASSERT_TRUE(fill.ok());
    ASSERT_TRUE(p_before.ok());
    ASSERT_TRUE(p_after.ok());
    EXPECT_GT(fill->average_price(), (*p_before)[2]);
    EXPECT_LT(fill->average_price(), (*p_after)[2]);
}

TEST_F(OrderExecutorTest, BuyThenSellRestoresQuantities) {
    auto q_before = state_.quantities();

    auto buy = executor_.execute(state_, market_order(Side::BUY, 12.0, 3));
    auto sell = executor_.execute(state_, market_order(Side::SELL, 12.0, 3));
    ASSERT_TRUE(buy.ok());
    ASSERT_TRUE(sell.ok());

    auto q_after = state_.quantities();
    for (size_t k = 0; k < q_before.size(); k++) {
        EXPECT_NEAR(q_after[k], q_before[k], 1e-9);
    }

    EXPECT_GT(buy->total_payment, 0.0);
    EXPECT_GT(sell->total_payment, 0.0);
    // Path-independent cost: what was paid comes back
    EXPECT_NEAR(buy->total_payment, sell->total_payment, 1e-9);
}

TEST_F(OrderExecutorTest, OrderIdsAreUnique) {
    auto a = executor_.execute(state_, market_order(Side::BUY, 1.0));
    auto b = executor_.execute(state_, market_order(Side::BUY, 1.0));
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_NE(a->order_id, b->order_id);
    EXPECT_EQ(a->order_id.rfind("ORD-", 0), 0u);
}

// ============================================================================
// Limit orders
// ============================================================================

TEST_F(OrderExecutorTest, LimitBuyBelowAskFillsNothing) {
    auto q_before = state_.quantities();

    auto fill = executor_.execute(state_, limit_order(Side::BUY, 5.0, 0.1));
    ASSERT_TRUE(fill.ok());

    EXPECT_EQ(fill->state, OrderState::PARTIAL);
    EXPECT_DOUBLE_EQ(fill->filled, 0.0);
    EXPECT_DOUBLE_EQ(fill->remaining, 5.0);
    EXPECT_DOUBLE_EQ(fill->average_price(), 0.0);
    EXPECT_FALSE(fill->fault.has_value());
    EXPECT_EQ(state_.quantities(), q_before);
}

TEST_F(OrderExecutorTest, LimitBuyStopsAtFirstStepAboveLimit) {
    // Step 1 costs ~0.365 per share, step 2 ~0.727
    auto fill = executor_.execute(state_, limit_order(Side::BUY, 30.0, 0.5));
    ASSERT_TRUE(fill.ok());

    EXPECT_EQ(fill->state, OrderState::PARTIAL);
    EXPECT_DOUBLE_EQ(fill->filled, 10.0);
    EXPECT_DOUBLE_EQ(fill->remaining, 20.0);
    EXPECT_EQ(fill->steps, 1);
    EXPECT_LE(fill->average_price(), 0.5);
}

TEST_F(OrderExecutorTest, GenerousLimitBuyFillsCompletely) {
    auto fill = executor_.execute(state_, limit_order(Side::BUY, 30.0, 0.99));
    ASSERT_TRUE(fill.ok());
    EXPECT_EQ(fill->state, OrderState::FILLED);
    EXPECT_DOUBLE_EQ(fill->filled, 30.0);
}

TEST_F(OrderExecutorTest, LimitSellAboveBidFillsNothing) {
    auto q_before = state_.quantities();

    auto fill = executor_.execute(state_, limit_order(Side::SELL, 5.0, 0.5));
    ASSERT_TRUE(fill.ok());

    EXPECT_EQ(fill->state, OrderState::PARTIAL);
    EXPECT_DOUBLE_EQ(fill->filled, 0.0);
    EXPECT_EQ(state_.quantities(), q_before);
}

TEST_F(OrderExecutorTest, LimitSellAtLowPriceFills) {
    auto fill = executor_.execute(state_, limit_order(Side::SELL, 5.0, 0.01, 1));
    ASSERT_TRUE(fill.ok());
    EXPECT_EQ(fill->state, OrderState::FILLED);
    EXPECT_GE(fill->average_price(), 0.01);
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(OrderExecutorTest, RejectsMalformedRequests) {
    auto q_before = state_.quantities();

    auto zero = executor_.execute(state_, market_order(Side::BUY, 0.0));
    ASSERT_FALSE(zero.ok());
    EXPECT_EQ(zero.fault().kind, FaultKind::CONFIGURATION);

    auto nan_size = executor_.execute(state_, market_order(Side::BUY, std::nan("")));
    ASSERT_FALSE(nan_size.ok());
    EXPECT_EQ(nan_size.fault().kind, FaultKind::CONFIGURATION);

    auto bad_bucket = executor_.execute(state_, market_order(Side::BUY, 1.0, 17));
    ASSERT_FALSE(bad_bucket.ok());
    EXPECT_EQ(bad_bucket.fault().kind, FaultKind::CONFIGURATION);

    auto no_limit = market_order(Side::BUY, 1.0);
    no_limit.type = OrderType::LIMIT;
    auto missing_limit = executor_.execute(state_, no_limit);
    ASSERT_FALSE(missing_limit.ok());
    EXPECT_EQ(missing_limit.fault().kind, FaultKind::CONFIGURATION);

    EXPECT_EQ(state_.quantities(), q_before);
}

TEST_F(OrderExecutorTest, OversizedOrderIsRejectedBeforeStepping) {
    OrderExecutor bounded(10.0, 1000.0);
    auto q_before = state_.quantities();

    auto fill = bounded.execute(state_, market_order(Side::BUY, 1e12, 2));
    ASSERT_FALSE(fill.ok());
    EXPECT_EQ(fill.fault().kind, FaultKind::CONFIGURATION);
    EXPECT_EQ(state_.quantities(), q_before);

    OrderRequest sell = market_order(Side::SELL, 1000.5, 2);
    EXPECT_FALSE(bounded.execute(state_, sell).ok());
}

TEST_F(OrderExecutorTest, OrderAtTheSizeCapFillsInBoundedSteps) {
    OrderExecutor bounded(10.0, 1000.0);

    auto fill = bounded.execute(state_, market_order(Side::BUY, 1000.0, 2));
    ASSERT_TRUE(fill.ok());
    EXPECT_EQ(fill->state, OrderState::FILLED);
    EXPECT_EQ(fill->steps, 100);
    EXPECT_NEAR(state_.knots[2].q, 1000.0 + std::log(0.2) * state_.b, 1e-9);
}

TEST_F(OrderExecutorTest, FaultDuringSteppingIsReportedOnTheFill) {
    state_.knots[0].q = std::numeric_limits<double>::infinity();

    auto fill = executor_.execute(state_, market_order(Side::BUY, 5.0, 4));
    ASSERT_TRUE(fill.ok());
    ASSERT_TRUE(fill->fault.has_value());
    EXPECT_EQ(fill->fault->kind, FaultKind::LIQUIDITY_EXHAUSTED);
    EXPECT_EQ(fill->state, OrderState::PARTIAL);
    EXPECT_DOUBLE_EQ(fill->filled, 0.0);
    EXPECT_DOUBLE_EQ(fill->remaining, 5.0);
}

TEST(OrderExecutorConfig, RejectsNonPositiveStep) {
    EXPECT_THROW(OrderExecutor(0.0), std::invalid_argument);
    EXPECT_THROW(OrderExecutor(10.0, 5.0), std::invalid_argument);
    EXPECT_THROW(OrderExecutor(10.0, std::numeric_limits<double>::infinity()), std::invalid_argument);
}
