#include <gtest/gtest.h>
#include "wallet/sqlite_wallet.hpp"
#include "utils/uuid.hpp"
#include <filesystem>
#include <stdexcept>

using namespace cmm;

class SqliteWalletTest : public ::testing::Test {
protected:
    std::string test_db_path_;

    void SetUp() override {
        test_db_path_ = "/tmp/test_wallet_" + generate_uuid() + ".db";
    }

    void TearDown() override {
        std::filesystem::remove(test_db_path_);
        std::filesystem::remove(test_db_path_ + "-wal");
        std::filesystem::remove(test_db_path_ + "-shm");
    }
};

TEST_F(SqliteWalletTest, OpensEmpty) {
    SqliteWallet wallet(test_db_path_);
    EXPECT_TRUE(wallet.is_open());
    EXPECT_DOUBLE_EQ(wallet.get_balance("alice"), 0.0);
    EXPECT_FALSE(wallet.has_account("alice"));
}

TEST_F(SqliteWalletTest, CreditThenDebit) {
    SqliteWallet wallet(test_db_path_);

    wallet.credit("alice", 100.0, "test-credit");
    EXPECT_DOUBLE_EQ(wallet.get_balance("alice"), 100.0);

    EXPECT_EQ(wallet.debit("alice", 30.0, "test-debit"), WalletStatus::OK);
    EXPECT_DOUBLE_EQ(wallet.get_balance("alice"), 70.0);
}

TEST_F(SqliteWalletTest, OverdraftIsRefusedWithoutWrite) {
    SqliteWallet wallet(test_db_path_);
    wallet.credit("alice", 70.0, "seed");

    EXPECT_EQ(wallet.debit("alice", 100.0, "fail"), WalletStatus::INSUFFICIENT_FUNDS);
    EXPECT_DOUBLE_EQ(wallet.get_balance("alice"), 70.0);
    EXPECT_EQ(wallet.history("alice").size(), 1u);

    EXPECT_EQ(wallet.debit("nobody", 1.0, "fail"), WalletStatus::INSUFFICIENT_FUNDS);
}

TEST_F(SqliteWalletTest, AmountsRoundDownToMicros) {
    SqliteWallet wallet(test_db_path_);

    wallet.credit("alice", 0.1234567, "odd");
    EXPECT_DOUBLE_EQ(wallet.get_balance("alice"), 0.123456);

    EXPECT_EQ(SqliteWallet::to_micros(0.29), 290000);
    EXPECT_EQ(SqliteWallet::to_micros(1.0000009), 1000000);
}

TEST_F(SqliteWalletTest, TransferMovesFundsAtomically) {
    SqliteWallet wallet(test_db_path_);
    wallet.credit("alice", 50.0, "seed");

    EXPECT_EQ(wallet.transfer("alice", "bob", 20.0, "gift"), WalletStatus::OK);
    EXPECT_DOUBLE_EQ(wallet.get_balance("alice"), 30.0);
    EXPECT_DOUBLE_EQ(wallet.get_balance("bob"), 20.0);

    EXPECT_EQ(wallet.transfer("alice", "bob", 31.0, "too-much"), WalletStatus::INSUFFICIENT_FUNDS);
    EXPECT_DOUBLE_EQ(wallet.get_balance("alice"), 30.0);
    EXPECT_DOUBLE_EQ(wallet.get_balance("bob"), 20.0);
}

TEST_F(SqliteWalletTest, EnsureAccountOpensOnce) {
    SqliteWallet wallet(test_db_path_);

    EXPECT_TRUE(wallet.ensure_account("carol", 1000.0));
    EXPECT_TRUE(wallet.debit("carol", 400.0, "spend") == WalletStatus::OK);
    EXPECT_FALSE(wallet.ensure_account("carol", 1000.0));
    EXPECT_DOUBLE_EQ(wallet.get_balance("carol"), 600.0);
}

TEST_F(SqliteWalletTest, HistoryRecordsEveryMovement) {
    SqliteWallet wallet(test_db_path_);
    wallet.credit("alice", 10.0, "c1");
    ASSERT_EQ(wallet.debit("alice", 4.0, "d1"), WalletStatus::OK);
    ASSERT_EQ(wallet.transfer("alice", "bob", 1.0, "t1"), WalletStatus::OK);

    auto txs = wallet.history("alice");
    ASSERT_EQ(txs.size(), 3u);

    EXPECT_EQ(txs[0].ref, "c1");
    EXPECT_TRUE(txs[0].from_id.empty());
    EXPECT_EQ(txs[0].to_id, "alice");

    EXPECT_EQ(txs[1].ref, "d1");
    EXPECT_EQ(txs[1].from_id, "alice");
    EXPECT_TRUE(txs[1].to_id.empty());
    EXPECT_DOUBLE_EQ(txs[1].amount, 4.0);

    EXPECT_EQ(txs[2].ref, "t1");

    auto bob = wallet.history("bob");
    ASSERT_EQ(bob.size(), 1u);
    EXPECT_EQ(bob[0].to_id, "bob");
}

TEST_F(SqliteWalletTest, BalancesSurviveReopen) {
    {
        SqliteWallet wallet(test_db_path_);
        wallet.credit("alice", 12.5, "seed");
    }

    SqliteWallet reopened(test_db_path_);
    EXPECT_DOUBLE_EQ(reopened.get_balance("alice"), 12.5);
}

TEST_F(SqliteWalletTest, NegativeAmountsThrow) {
    SqliteWallet wallet(test_db_path_);
    EXPECT_THROW(wallet.credit("alice", -1.0, "bad"), std::invalid_argument);
    EXPECT_THROW(wallet.debit("alice", -1.0, "bad"), std::invalid_argument);
}

TEST_F(SqliteWalletTest, AmountsBeyondTheMicroRangeThrow) {
    SqliteWallet wallet(test_db_path_);
    const Notional too_big = 1e13;

    EXPECT_THROW(SqliteWallet::to_micros(too_big), std::invalid_argument);
    EXPECT_THROW(wallet.credit("alice", too_big, "big"), std::invalid_argument);
    EXPECT_THROW(wallet.debit("alice", too_big, "big"), std::invalid_argument);
    EXPECT_THROW(wallet.transfer("alice", "bob", too_big, "big"), std::invalid_argument);
    EXPECT_THROW(wallet.ensure_account("alice", too_big), std::invalid_argument);
    EXPECT_FALSE(wallet.has_account("alice"));

    wallet.credit("alice", SqliteWallet::MAX_AMOUNT, "max");
    EXPECT_DOUBLE_EQ(wallet.get_balance("alice"), SqliteWallet::MAX_AMOUNT);
}

TEST_F(SqliteWalletTest, BalanceOverflowRollsBack) {
    SqliteWallet wallet(test_db_path_);
    for (int i = 0; i < 9; i++) {
        wallet.credit("whale", SqliteWallet::MAX_AMOUNT, "top-up");
    }

    EXPECT_THROW(wallet.credit("whale", SqliteWallet::MAX_AMOUNT, "top-up"), std::overflow_error);
    EXPECT_DOUBLE_EQ(wallet.get_balance("whale"), 9 * SqliteWallet::MAX_AMOUNT);
    EXPECT_EQ(wallet.history("whale").size(), 9u);
}
