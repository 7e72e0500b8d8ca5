#include <gtest/gtest.h>
#include "persistence/trade_ledger.hpp"
#include "utils/uuid.hpp"
#include <filesystem>
#include <fstream>

using namespace cmm;

class TradeLedgerTest : public ::testing::Test {
protected:
    std::string path_;

    void SetUp() override {
        path_ = "/tmp/test_ledger_" + generate_uuid() + "/trades.jsonl";
    }

    void TearDown() override {
        std::filesystem::remove_all(std::filesystem::path(path_).parent_path());
    }

    TradeRecord make_trade(const std::string& user, Size amount) {
        TradeRecord t;
        t.trade_id = generate_uuid();
        t.user_id = user;
        t.market_id = "gdp-2030";
        t.amount = amount;
        t.price = 0.42;
        t.payment = 1.234567;
        t.prediction = Prediction{2.5e9, Direction::SHORT, "2030-12-31"};
        t.timestamp = "2026-01-01T00:00:00.000Z";
        return t;
    }
};

TEST_F(TradeLedgerTest, CreatesDirectoryAndFile) {
    TradeLedger ledger(path_);
    EXPECT_TRUE(std::filesystem::exists(path_));
}

TEST_F(TradeLedgerTest, ThresholdTradesReadBack) {
    TradeLedger ledger(path_);
    auto first = make_trade("alice", 3.0);
    ledger.record_trade(first);
    ledger.record_trade(make_trade("bob", -1.0));
    ledger.flush();

    auto trades = ledger.read_trades();
    ASSERT_EQ(trades.size(), 2u);
    EXPECT_EQ(trades[0].trade_id, first.trade_id);
    EXPECT_EQ(trades[0].user_id, "alice");
    EXPECT_DOUBLE_EQ(trades[0].amount, 3.0);
    EXPECT_DOUBLE_EQ(trades[0].payment, 1.234567);
    EXPECT_DOUBLE_EQ(trades[0].prediction.value, 2.5e9);
    EXPECT_EQ(trades[0].prediction.direction, Direction::SHORT);
    EXPECT_EQ(trades[0].prediction.expiry, "2030-12-31");
    EXPECT_EQ(trades[1].user_id, "bob");
}

TEST_F(TradeLedgerTest, FillsAreSeparateFromTrades) {
    TradeLedger ledger(path_);

    FillReport fill;
    fill.order_id = "ORD-1";
    fill.market_id = "gdp-2030";
    fill.bucket_index = 4;
    fill.side = Side::SELL;
    fill.type = OrderType::LIMIT;
    fill.requested = 10.0;
    fill.mark_step(4.0, 0.8);
    fill.mark_stopped();

    ledger.record_fill("alice", fill);
    ledger.record_trade(make_trade("alice", 1.0));
    ledger.flush();

    auto fills = ledger.read_fills();
    ASSERT_EQ(fills.size(), 1u);
    EXPECT_EQ(fills[0].order_id, "ORD-1");
    EXPECT_EQ(fills[0].side, Side::SELL);
    EXPECT_EQ(fills[0].type, OrderType::LIMIT);
    EXPECT_EQ(fills[0].state, OrderState::PARTIAL);
    EXPECT_DOUBLE_EQ(fills[0].filled, 4.0);
    EXPECT_DOUBLE_EQ(fills[0].remaining, 6.0);
    EXPECT_FALSE(fills[0].fault.has_value());

    EXPECT_EQ(ledger.read_trades().size(), 1u);
}

TEST_F(TradeLedgerTest, MalformedLinesAreSkipped) {
    {
        TradeLedger ledger(path_);
        ledger.record_trade(make_trade("alice", 1.0));
    }
    {
        std::ofstream out(path_, std::ios::app);
        out << "not json at all\n";
        out << "{\"event_type\":\"threshold_trade\",\"data\":{\"amount\":\"lots\"}}\n";
    }

    TradeLedger ledger(path_);
    ledger.record_trade(make_trade("bob", 2.0));
    ledger.flush();

    auto trades = ledger.read_trades();
    ASSERT_EQ(trades.size(), 2u);
    EXPECT_EQ(trades[0].user_id, "alice");
    EXPECT_EQ(trades[1].user_id, "bob");
}

TEST_F(TradeLedgerTest, FileSizeGrowsWithEvents) {
    TradeLedger ledger(path_);
    ledger.flush();
    size_t empty = ledger.file_size();

    ledger.record_event("note", {{"text", "hello"}});
    ledger.flush();
    EXPECT_GT(ledger.file_size(), empty);
}
