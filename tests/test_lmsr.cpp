#include <gtest/gtest.h>
#include "amm/lmsr.hpp"
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

using namespace cmm;

class LmsrTest : public ::testing::Test {
protected:
    void SetUp() override {
        MarketParams params;
        params.num_knots = 5;
        params.min_val = 1.0;
        params.max_val = 100.0;
        params.bankroll = 100.0;
        auto built = build_initial_state(params);
        ASSERT_TRUE(built.ok());
        state_ = *built;
    }

    AmmState state_;

    // Direct evaluation without the max shift, for comparison on small books
    static double naive_cost(const std::vector<double>& q, double b) {
        double sum = 0.0;
        for (double qk : q) sum += std::exp(qk / b);
        return b * std::log(sum);
    }
};

// ============================================================================
// Cost and prices
// ============================================================================

TEST_F(LmsrTest, CostMatchesDirectFormula) {
    std::vector<double> q{1.0, -2.0, 3.5, 0.0};
    auto c = lmsr::cost(q, 2.0);
    ASSERT_TRUE(c.ok());
    EXPECT_NEAR(*c, naive_cost(q, 2.0), 1e-12);
}

TEST_F(LmsrTest, PricesSumToOne) {
    std::vector<double> q{10.0, -4.0, 0.5, 7.0, 3.0};
    auto p = lmsr::prices(q, 3.0);
    ASSERT_TRUE(p.ok());

    double total = std::accumulate(p->begin(), p->end(), 0.0);
    EXPECT_NEAR(total, 1.0, 1e-6);
    for (double pk : *p) {
        EXPECT_GE(pk, 0.0);
        EXPECT_LE(pk, 1.0);
    }
}

TEST_F(LmsrTest, LargeQuantitiesDoNotOverflow) {
    std::vector<double> q{1e6, 0.0, 0.0};
    auto c = lmsr::cost(q, 1.0);
    ASSERT_TRUE(c.ok());
    EXPECT_NEAR(*c, 1e6, 1e-6);

    auto p = lmsr::prices(q, 1.0);
    ASSERT_TRUE(p.ok());
    EXPECT_NEAR((*p)[0], 1.0, 1e-12);
    EXPECT_NEAR((*p)[1], 0.0, 1e-12);
}

TEST_F(LmsrTest, NonFiniteBookIsLiquidityExhausted) {
    std::vector<double> q{std::numeric_limits<double>::infinity(), 0.0};

    auto c = lmsr::cost(q, 1.0);
    ASSERT_FALSE(c.ok());
    EXPECT_EQ(c.fault().kind, FaultKind::LIQUIDITY_EXHAUSTED);

    auto p = lmsr::prices(q, 1.0);
    ASSERT_FALSE(p.ok());
    EXPECT_EQ(p.fault().kind, FaultKind::LIQUIDITY_EXHAUSTED);
}

TEST_F(LmsrTest, EmptyBookOrBadLiquidityThrows) {
    EXPECT_THROW(lmsr::cost({}, 1.0), std::invalid_argument);
    EXPECT_THROW(lmsr::prices({1.0}, 0.0), std::invalid_argument);
    EXPECT_THROW(lmsr::cost_delta({1.0}, {1.0, 2.0}, 1.0), std::invalid_argument);
}

// ============================================================================
// Cost delta
// ============================================================================

TEST_F(LmsrTest, CostDeltaMatchesCostDifference) {
    std::vector<double> before{1.0, 2.0, -1.0};
    std::vector<double> after{1.0, 4.5, -1.0};

    auto delta = lmsr::cost_delta(before, after, 2.0);
    ASSERT_TRUE(delta.ok());
    EXPECT_NEAR(*delta, naive_cost(after, 2.0) - naive_cost(before, 2.0), 1e-10);
}

TEST_F(LmsrTest, CostDeltaIsZeroWithoutMovement) {
    auto q = state_.quantities();
    auto delta = lmsr::cost_delta(q, q, state_.b);
    ASSERT_TRUE(delta.ok());
    EXPECT_EQ(*delta, 0.0);
}

TEST_F(LmsrTest, TinyMoveOnLargeBookStaysPositive) {
    std::vector<double> before{5e5, 5e5 - 1.0, 0.0};
    std::vector<double> after = before;
    after[1] += 1e-6;

    auto delta = lmsr::cost_delta(before, after, 10.0);
    ASSERT_TRUE(delta.ok());
    EXPECT_GT(*delta, 0.0);

    auto p = lmsr::prices(before, 10.0);
    ASSERT_TRUE(p.ok());
    EXPECT_NEAR(*delta / 1e-6, (*p)[1], 1e-6);
}

TEST_F(LmsrTest, MoveOfThousandsOfLiquidityUnitsIsFinite) {
    const size_t n = 21;
    const double b = 5000.0 / std::log(static_cast<double>(n));
    std::vector<double> before(n, 0.0);

    for (double move : {1e3 * b, 1.2e6, 5e6}) {
        std::vector<double> after = before;
        after[n - 1] += move;

        auto delta = lmsr::cost_delta(before, after, b);
        ASSERT_TRUE(delta.ok()) << "move " << move << ": " << delta.fault().message;

        // C(before) = b ln n; C(after) = move + b ln(1 + (n-1) e^(-move/b)) ~ move
        EXPECT_NEAR(*delta, move - 5000.0, 1e-9 * move);
    }
}

TEST_F(LmsrTest, LargeMoveBothWaysCancels) {
    const double b = 2.0;
    std::vector<double> before{0.0, 3.0, -4.0};
    std::vector<double> after = before;
    after[2] += 5000.0;

    auto up = lmsr::cost_delta(before, after, b);
    auto down = lmsr::cost_delta(after, before, b);
    ASSERT_TRUE(up.ok());
    ASSERT_TRUE(down.ok());
    EXPECT_GT(*up, 0.0);
    EXPECT_NEAR(*up + *down, 0.0, 1e-9);

    auto direct_after = lmsr::cost(after, b);
    auto direct_before = lmsr::cost(before, b);
    ASSERT_TRUE(direct_after.ok());
    ASSERT_TRUE(direct_before.ok());
    EXPECT_NEAR(*up, *direct_after - *direct_before, 1e-9);
}

// ============================================================================
// Bid / ask
// ============================================================================

TEST_F(LmsrTest, AskAndBidAreNonNegative) {
    auto q = state_.quantities();
    for (size_t k = 0; k < q.size(); k++) {
        auto a = lmsr::ask(q, state_.b, k, 3.0);
        auto b = lmsr::bid(q, state_.b, k, 3.0);
        ASSERT_TRUE(a.ok());
        ASSERT_TRUE(b.ok());
        EXPECT_GE(*a, 0.0);
        EXPECT_GE(*b, 0.0);
    }
}

TEST_F(LmsrTest, AskAndBidBracketMid) {
    auto quote = lmsr::quote(state_, 2, 5.0);
    ASSERT_TRUE(quote.ok());
    EXPECT_GT(quote->ask, quote->mid);
    EXPECT_LT(quote->bid, quote->mid);
    EXPECT_NEAR(quote->mid, 0.2, 1e-8);
    EXPECT_NEAR(quote->liquidity, 100.0, 1e-9);
}

TEST_F(LmsrTest, SmallSizeQuotesConvergeToMarginalPrice) {
    auto q = state_.quantities();
    const double s = 1e-6;

    auto a = lmsr::ask(q, state_.b, 1, s);
    auto b = lmsr::bid(q, state_.b, 1, s);
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_NEAR(*a / s, 0.2, 1e-6);
    EXPECT_NEAR(*b / s, 0.2, 1e-6);
}

TEST_F(LmsrTest, QuoteRejectsBadRequests) {
    auto out_of_range = lmsr::quote(state_, 99, 1.0);
    ASSERT_FALSE(out_of_range.ok());
    EXPECT_EQ(out_of_range.fault().kind, FaultKind::CONFIGURATION);

    auto bad_size = lmsr::quote(state_, 0, 0.0);
    ASSERT_FALSE(bad_size.ok());
    EXPECT_EQ(bad_size.fault().kind, FaultKind::CONFIGURATION);
}

TEST_F(LmsrTest, NonFiniteQuoteIsWholeFault) {
    state_.knots[0].q = std::numeric_limits<double>::infinity();
    auto quote = lmsr::quote(state_, 1, 1.0);
    ASSERT_FALSE(quote.ok());
    EXPECT_EQ(quote.fault().kind, FaultKind::LIQUIDITY_EXHAUSTED);
    EXPECT_EQ(quote.fault().message, "liquidity exhausted");
}

TEST_F(LmsrTest, LadderCoversEveryKnotAscending) {
    auto ladder = lmsr::bid_ask_ladder(state_);
    ASSERT_TRUE(ladder.ok());
    ASSERT_EQ(ladder->size(), state_.size());

    double mid_total = 0.0;
    for (size_t k = 0; k < ladder->size(); k++) {
        const auto& row = (*ladder)[k];
        EXPECT_EQ(row.value, state_.knots[k].x);
        EXPECT_LE(row.bid, row.mid);
        EXPECT_GE(row.ask, row.mid);
        mid_total += row.mid;
        if (k > 0) {
            EXPECT_LT((*ladder)[k - 1].value, row.value);
        }
    }
    EXPECT_NEAR(mid_total, 1.0, 1e-6);
}
