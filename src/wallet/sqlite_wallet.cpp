#include "wallet/sqlite_wallet.hpp"
#include "utils/time_utils.hpp"
#include "utils/uuid.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace cmm {

namespace {

void check_amount(Notional amount) {
    if (!std::isfinite(amount) || amount < 0.0) {
        throw std::invalid_argument(fmt::format("wallet amount must be non-negative, got {}", amount));
    }
    if (amount > SqliteWallet::MAX_AMOUNT) {
        throw std::invalid_argument(fmt::format("wallet amount {} exceeds the maximum of {}",
                                                amount, SqliteWallet::MAX_AMOUNT));
    }
}

} // namespace

int64_t SqliteWallet::to_micros(Notional amount) {
    check_amount(amount);
    // Round down to 6 decimals; the epsilon absorbs binary representation error
    return static_cast<int64_t>(std::floor(amount * 1e6 + 1e-6));
}

Notional SqliteWallet::from_micros(int64_t micros) {
    return static_cast<Notional>(micros) / 1e6;
}

SqliteWallet::SqliteWallet(const std::string& db_path)
    : db_path_(db_path)
{
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open wallet database: " + error);
    }

    execute("PRAGMA journal_mode = WAL;");
    initialize_schema();

    spdlog::info("Wallet opened: {}", db_path);
}

SqliteWallet::~SqliteWallet() {
    close();
}

bool SqliteWallet::is_open() const {
    return db_ != nullptr;
}

void SqliteWallet::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
        spdlog::info("Wallet closed");
    }
}

void SqliteWallet::execute(const std::string& sql) {
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string error = errmsg ? errmsg : "Unknown error";
        sqlite3_free(errmsg);
        throw std::runtime_error("SQL error: " + error + " in: " + sql);
    }
}

sqlite3_stmt* SqliteWallet::prepare(const std::string& sql) {
    if (!db_) {
        throw std::runtime_error("Wallet database is closed");
    }
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare statement: " +
                                 std::string(sqlite3_errmsg(db_)));
    }
    return stmt;
}

void SqliteWallet::bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void SqliteWallet::bind_int64(sqlite3_stmt* stmt, int index, int64_t value) {
    sqlite3_bind_int64(stmt, index, value);
}

void SqliteWallet::finalize(sqlite3_stmt* stmt) {
    sqlite3_finalize(stmt);
}

std::string SqliteWallet::get_text(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

// ============================================================================
// SCHEMA
// ============================================================================

void SqliteWallet::initialize_schema() {
    execute(R"(
        CREATE TABLE IF NOT EXISTS balances (
            user_id TEXT PRIMARY KEY,
            balance_micros INTEGER NOT NULL DEFAULT 0
        );
    )");

    execute(R"(
        CREATE TABLE IF NOT EXISTS tx_log (
            id TEXT PRIMARY KEY,
            ts INTEGER NOT NULL,
            from_id TEXT,
            to_id TEXT,
            amount_micros INTEGER NOT NULL,
            ref TEXT NOT NULL
        );
    )");

    execute("CREATE INDEX IF NOT EXISTS idx_tx_from ON tx_log(from_id);");
    execute("CREATE INDEX IF NOT EXISTS idx_tx_to ON tx_log(to_id);");
}

// ============================================================================
// UNLOCKED HELPERS
// ============================================================================

bool SqliteWallet::read_balance(const std::string& user_id, int64_t& micros) {
    auto stmt = prepare("SELECT balance_micros FROM balances WHERE user_id = ?;");
    bind_text(stmt, 1, user_id);

    bool found = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        micros = sqlite3_column_int64(stmt, 0);
        found = true;
    }
    finalize(stmt);
    return found;
}

void SqliteWallet::write_balance(const std::string& user_id, int64_t micros) {
    auto stmt = prepare(R"(
        INSERT INTO balances (user_id, balance_micros) VALUES (?, ?)
        ON CONFLICT(user_id) DO UPDATE SET balance_micros = excluded.balance_micros;
    )");
    bind_text(stmt, 1, user_id);
    bind_int64(stmt, 2, micros);

    int rc = sqlite3_step(stmt);
    finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to write balance: " + std::string(sqlite3_errmsg(db_)));
    }
}

void SqliteWallet::log_tx(const std::string& from_id, const std::string& to_id,
                          int64_t micros, const std::string& ref) {
    auto stmt = prepare(R"(
        INSERT INTO tx_log (id, ts, from_id, to_id, amount_micros, ref)
        VALUES (?, ?, ?, ?, ?, ?);
    )");
    bind_text(stmt, 1, generate_uuid());
    bind_int64(stmt, 2, time_utils::now_micros());
    if (from_id.empty()) {
        sqlite3_bind_null(stmt, 3);
    } else {
        bind_text(stmt, 3, from_id);
    }
    if (to_id.empty()) {
        sqlite3_bind_null(stmt, 4);
    } else {
        bind_text(stmt, 4, to_id);
    }
    bind_int64(stmt, 5, micros);
    bind_text(stmt, 6, ref);

    int rc = sqlite3_step(stmt);
    finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to log wallet transaction: " + std::string(sqlite3_errmsg(db_)));
    }
}

bool SqliteWallet::apply_debit(const std::string& user_id, int64_t micros, const std::string& ref) {
    int64_t balance = 0;
    if (!read_balance(user_id, balance) || balance < micros) {
        return false;
    }
    write_balance(user_id, balance - micros);
    log_tx(user_id, "", micros, ref);
    return true;
}

void SqliteWallet::apply_credit(const std::string& user_id, int64_t micros, const std::string& ref) {
    int64_t balance = 0;
    read_balance(user_id, balance);
    if (micros > std::numeric_limits<int64_t>::max() - balance) {
        throw std::overflow_error(fmt::format("balance of {} would overflow", user_id));
    }
    write_balance(user_id, balance + micros);
    log_tx("", user_id, micros, ref);
}

// ============================================================================
// WALLET OPERATIONS
// ============================================================================

Notional SqliteWallet::get_balance(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t micros = 0;
    read_balance(user_id, micros);
    return from_micros(micros);
}

bool SqliteWallet::has_account(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t micros = 0;
    return read_balance(user_id, micros);
}

WalletStatus SqliteWallet::debit(const std::string& user_id, Notional amount, const std::string& ref) {
    check_amount(amount);
    int64_t micros = to_micros(amount);

    std::lock_guard<std::mutex> lock(mutex_);
    execute("BEGIN IMMEDIATE;");
    try {
        if (!apply_debit(user_id, micros, ref)) {
            execute("ROLLBACK;");
            spdlog::warn("Insufficient funds: {} debit {:.6f} ({})", user_id, from_micros(micros), ref);
            return WalletStatus::INSUFFICIENT_FUNDS;
        }
        execute("COMMIT;");
    } catch (const std::exception& e) {
        spdlog::error("Wallet debit failed for {}: {}", user_id, e.what());
        execute("ROLLBACK;");
        throw;
    }

    spdlog::debug("Debited {:.6f} from {} ({})", from_micros(micros), user_id, ref);
    return WalletStatus::OK;
}

void SqliteWallet::credit(const std::string& user_id, Notional amount, const std::string& ref) {
    check_amount(amount);
    int64_t micros = to_micros(amount);

    std::lock_guard<std::mutex> lock(mutex_);
    execute("BEGIN IMMEDIATE;");
    try {
        apply_credit(user_id, micros, ref);
        execute("COMMIT;");
    } catch (const std::exception& e) {
        spdlog::error("Wallet credit failed for {}: {}", user_id, e.what());
        execute("ROLLBACK;");
        throw;
    }

    spdlog::debug("Credited {:.6f} to {} ({})", from_micros(micros), user_id, ref);
}

WalletStatus SqliteWallet::transfer(const std::string& from_id, const std::string& to_id,
                                    Notional amount, const std::string& ref) {
    check_amount(amount);
    int64_t micros = to_micros(amount);

    std::lock_guard<std::mutex> lock(mutex_);
    execute("BEGIN IMMEDIATE;");
    try {
        if (!apply_debit(from_id, micros, ref)) {
            execute("ROLLBACK;");
            spdlog::warn("Insufficient funds: {} transfer {:.6f} to {} ({})",
                         from_id, from_micros(micros), to_id, ref);
            return WalletStatus::INSUFFICIENT_FUNDS;
        }
        apply_credit(to_id, micros, ref);
        execute("COMMIT;");
    } catch (const std::exception& e) {
        spdlog::error("Wallet transfer {} -> {} failed: {}", from_id, to_id, e.what());
        execute("ROLLBACK;");
        throw;
    }

    spdlog::debug("Transferred {:.6f} from {} to {} ({})", from_micros(micros), from_id, to_id, ref);
    return WalletStatus::OK;
}

bool SqliteWallet::ensure_account(const std::string& user_id, Notional starting_balance) {
    check_amount(starting_balance);

    std::lock_guard<std::mutex> lock(mutex_);
    int64_t existing = 0;
    if (read_balance(user_id, existing)) {
        return false;
    }

    execute("BEGIN IMMEDIATE;");
    try {
        apply_credit(user_id, to_micros(starting_balance), "account-open");
        execute("COMMIT;");
    } catch (const std::exception& e) {
        spdlog::error("Failed to open account {}: {}", user_id, e.what());
        execute("ROLLBACK;");
        throw;
    }

    spdlog::info("Opened play account {} with {:.2f}", user_id, starting_balance);
    return true;
}

std::vector<WalletTx> SqliteWallet::history(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto stmt = prepare(R"(
        SELECT id, ts, from_id, to_id, amount_micros, ref FROM tx_log
        WHERE from_id = ? OR to_id = ?
        ORDER BY ts ASC, rowid ASC;
    )");
    bind_text(stmt, 1, user_id);
    bind_text(stmt, 2, user_id);

    std::vector<WalletTx> txs;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        WalletTx tx;
        tx.tx_id = get_text(stmt, 0);
        tx.timestamp = sqlite3_column_int64(stmt, 1);
        tx.from_id = get_text(stmt, 2);
        tx.to_id = get_text(stmt, 3);
        tx.amount = from_micros(sqlite3_column_int64(stmt, 4));
        tx.ref = get_text(stmt, 5);
        txs.push_back(tx);
    }
    finalize(stmt);
    return txs;
}

} // namespace cmm
