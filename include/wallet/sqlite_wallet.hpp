#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <cstdint>
#include "wallet/wallet.hpp"

// Forward declare sqlite3
struct sqlite3;
struct sqlite3_stmt;

namespace cmm {

struct WalletTx {
    std::string tx_id;
    int64_t timestamp{0};      // UTC microseconds
    std::string from_id;       // Empty for a credit
    std::string to_id;         // Empty for a debit
    Notional amount{0.0};
    std::string ref;
};

/**
 * Wallet backed by a SQLite file.
 *
 * Balances are stored as integer micro-units; every amount is rounded down
 * to 6 decimals before it touches a balance. Each operation runs in its own
 * transaction and appends to tx_log. Infrastructure errors throw
 * std::runtime_error.
 */
class SqliteWallet : public Wallet {
public:
    explicit SqliteWallet(const std::string& db_path);
    ~SqliteWallet() override;

    // Non-copyable
    SqliteWallet(const SqliteWallet&) = delete;
    SqliteWallet& operator=(const SqliteWallet&) = delete;

    Notional get_balance(const std::string& user_id) override;
    WalletStatus debit(const std::string& user_id, Notional amount, const std::string& ref) override;
    void credit(const std::string& user_id, Notional amount, const std::string& ref) override;
    WalletStatus transfer(const std::string& from_id, const std::string& to_id,
                          Notional amount, const std::string& ref) override;

    // Opens the account with `starting_balance` if it does not exist yet.
    // Returns true when the account was created.
    bool ensure_account(const std::string& user_id, Notional starting_balance);

    bool has_account(const std::string& user_id);

    // Transactions touching the user, oldest first
    std::vector<WalletTx> history(const std::string& user_id);

    bool is_open() const;
    void close();

    // Largest amount accepted by any single call; larger amounts throw
    // std::invalid_argument so micro-unit values stay inside int64
    static constexpr Notional MAX_AMOUNT = 1e12;

    // Throws std::invalid_argument outside [0, MAX_AMOUNT]
    static int64_t to_micros(Notional amount);
    static Notional from_micros(int64_t micros);

private:
    sqlite3* db_{nullptr};
    std::string db_path_;
    std::mutex mutex_;

    void initialize_schema();
    void execute(const std::string& sql);

    sqlite3_stmt* prepare(const std::string& sql);
    void bind_text(sqlite3_stmt* stmt, int index, const std::string& value);
    void bind_int64(sqlite3_stmt* stmt, int index, int64_t value);
    void finalize(sqlite3_stmt* stmt);
    std::string get_text(sqlite3_stmt* stmt, int col);

    // Unlocked helpers; callers hold mutex_ and the transaction
    bool read_balance(const std::string& user_id, int64_t& micros);
    void write_balance(const std::string& user_id, int64_t micros);
    void log_tx(const std::string& from_id, const std::string& to_id,
                int64_t micros, const std::string& ref);
    bool apply_debit(const std::string& user_id, int64_t micros, const std::string& ref);
    void apply_credit(const std::string& user_id, int64_t micros, const std::string& ref);
};

} // namespace cmm
