#pragma once

#include "common/decimal.hpp"
#include "common/types.hpp"
#include "config/config.hpp"
#include "persistence/database.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace thisthat {

struct Balance {
    Credits balance;     // credit_balance as stored
    Credits available;   // balance minus active, unexpired holds
    Credits held;
};

struct TransactionPage {
    std::vector<CreditTransaction> transactions;
    int64_t total{0};
    int limit{0};
    int offset{0};
};

struct LedgerAudit {
    bool consistent{true};
    Credits replayed_balance;
    Credits stored_balance;
    size_t transaction_count{0};
    std::optional<std::string> first_divergent_transaction;
};

/**
 * Ledger - Authoritative record of user credit balances.
 *
 * DESIGN:
 * - Every balance change appends an immutable CreditTransaction whose
 *   balance_after is the post-mutation balance; replaying a user's rows in
 *   sequence order reconstructs credit_balance.
 * - Each mutation is one BEGIN IMMEDIATE transaction, so read-modify-append
 *   is serialized across threads and processes sharing the database file.
 * - A mutation issued while the connection already has a transaction open
 *   joins it, letting callers make the ledger change and their own row
 *   changes a single atomic unit.
 * - Holds reserve credits: they reduce available credits without touching
 *   the balance until captured (debited) or released.
 *
 * Not thread-safe: one Ledger per Database connection per thread.
 */
class Ledger {
public:
    struct Config {
        std::chrono::seconds default_hold_ttl{300};
        int default_page_size{50};
        int max_page_size{200};
        Credits signup_bonus{Credits::from_micros(1'000'000'000)};
    };

    explicit Ledger(std::shared_ptr<Database> db, ClockFn clock = system_clock_fn());
    Ledger(std::shared_ptr<Database> db, Config config, ClockFn clock = system_clock_fn());

    // Creates the account; a non-zero grant is booked as signup_bonus.
    // Opening an existing account returns its current balance unchanged.
    Balance open_account(const std::string& user_id, Credits initial_credits);
    // Grants the configured signup_bonus.
    Balance open_account(const std::string& user_id);

    CreditTransaction credit(const std::string& user_id, Credits amount,
                             TransactionType type, const std::string& reference_id);

    // Throws InsufficientFunds when amount exceeds available credits.
    CreditTransaction debit(const std::string& user_id, Credits amount,
                            TransactionType type, const std::string& reference_id);

    Balance get_balance(const std::string& user_id);

    // Holds
    HoldRecord place_hold(const std::string& user_id, Credits amount,
                          const std::string& reason, const std::string& reference_id,
                          std::optional<std::chrono::seconds> ttl = std::nullopt);
    // Returns false when the hold was no longer active.
    bool release_hold(const std::string& hold_id);
    CreditTransaction capture_hold(const std::string& hold_id, TransactionType type,
                                   const std::string& reference_id);

    // Newest first. limit defaults to the configured page size and is
    // clamped to max_page_size. Throws NotFound for an unknown user.
    TransactionPage list_transactions(const std::string& user_id,
                                      std::optional<TransactionType> type = std::nullopt,
                                      std::optional<int> limit = std::nullopt,
                                      int offset = 0);

    LedgerAudit verify_user(const std::string& user_id);

    Database& database() { return *db_; }
    int64_t now() const { return clock_(); }

private:
    std::shared_ptr<Database> db_;
    Config config_;
    ClockFn clock_;

    UserRecord require_user(const std::string& user_id);
    CreditTransaction apply(const std::string& user_id, Credits delta,
                            TransactionType type, const std::string& reference_id);
};

// Ledger settings taken from the economy and betting sections.
Ledger::Config ledger_config_from(const Config& config);

} // namespace thisthat
