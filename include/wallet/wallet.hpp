#pragma once

#include <string>
#include "common/types.hpp"

namespace cmm {

enum class WalletStatus {
    OK,
    INSUFFICIENT_FUNDS
};

inline std::string wallet_status_to_string(WalletStatus s) {
    return s == WalletStatus::OK ? "ok" : "insufficient_funds";
}

/**
 * Play-money balances. Amounts are non-negative; passing a negative amount
 * is a programming error and throws std::invalid_argument.
 */
class Wallet {
public:
    virtual ~Wallet() = default;

    virtual Notional get_balance(const std::string& user_id) = 0;

    // Leaves the balance untouched and returns INSUFFICIENT_FUNDS if short
    virtual WalletStatus debit(const std::string& user_id, Notional amount, const std::string& ref) = 0;

    virtual void credit(const std::string& user_id, Notional amount, const std::string& ref) = 0;

    // Debit and credit as one unit
    virtual WalletStatus transfer(const std::string& from_id, const std::string& to_id,
                                  Notional amount, const std::string& ref) = 0;
};

} // namespace cmm
