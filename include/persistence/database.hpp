#pragma once

#include "common/decimal.hpp"
#include "common/types.hpp"

#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <cstdint>

// Forward declare sqlite3
struct sqlite3;
struct sqlite3_stmt;

namespace thisthat {

// ============================================================================
// DURABLE STORE
//
// Single source of truth for balances, ledger rows, holds, bets and skip
// records. One Database wraps one SQLite connection and is used by one thread
// at a time; concurrent workers open their own connection on the same file.
//
// Conventions:
// 1. Money and prices are INTEGER micro-units (see Decimal)
// 2. All timestamps are UTC microseconds
// 3. UUIDs for all primary keys
// 4. credit_balance >= 0 is enforced by a CHECK constraint
// ============================================================================

std::string generate_uuid();

// ============================================================================
// DATA STRUCTURES
// ============================================================================

struct UserRecord {
    std::string id;
    Credits credit_balance;
    Credits overall_pnl;
    Credits total_volume;
    Credits biggest_win;
    std::optional<int64_t> rank_by_pnl;
    std::optional<int64_t> rank_by_volume;
    int consecutive_days_online{0};
    std::optional<int64_t> last_daily_reward_at;
    int64_t created_at{0};
};

struct CreditTransaction {
    std::string id;
    std::string user_id;
    Credits amount;                 // signed: positive credits, negative debits
    TransactionType type{TransactionType::ADJUSTMENT};
    std::string reference_id;
    Credits balance_after;
    int64_t created_at{0};
    int64_t sequence{0};            // per-user, strictly increasing from 1
};

struct HoldRecord {
    std::string id;
    std::string user_id;
    Credits amount;
    std::string reason;
    std::string reference_id;
    int64_t created_at{0};
    int64_t expires_at{0};
    HoldStatus status{HoldStatus::ACTIVE};
};

struct BetRecord {
    std::string id;
    std::string user_id;
    std::string market_id;
    Side side{Side::THIS};
    Credits amount;
    Credits shares;
    Probability price_at_bet;
    Credits potential_payout;
    std::optional<std::string> idempotency_key;
    BetStatus status{BetStatus::PENDING};
    std::optional<Credits> actual_payout;
    int64_t created_at{0};
    std::optional<int64_t> resolved_at;
};

struct PurchaseRecord {
    std::string id;
    std::string user_id;
    std::string package_id;
    Credits credits_granted;
    Decimal usd_amount;
    std::string status{"completed"};
    std::string provider{"manual"};
    std::optional<std::string> external_id;   // payment provider reference
    int64_t created_at{0};
};

struct InteractionRecord {
    std::string user_id;
    std::string market_id;
    std::string action{"skip"};
    int64_t timestamp{0};
    int64_t expires_at{0};
};

// ============================================================================
// DATABASE CLASS
// ============================================================================

class Database {
public:
    explicit Database(const std::string& db_path, int busy_timeout_ms = 5000);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    bool is_open() const;
    void close();
    const std::string& path() const { return db_path_; }

    // Schema management
    void initialize_schema();
    int get_schema_version();

    // Transactions. begin_immediate() takes the write lock up front; a call
    // while a transaction is already open on this connection is a no-op.
    void begin_immediate();
    void commit();
    void rollback();
    bool in_transaction() const { return in_transaction_; }

    // Users
    bool insert_user(const UserRecord& user);
    std::optional<UserRecord> get_user(const std::string& user_id);
    std::vector<UserRecord> list_users();
    void set_user_balance(const std::string& user_id, Credits balance);
    void add_user_stats(const std::string& user_id, Credits pnl_delta, Credits volume_delta);
    void raise_biggest_win(const std::string& user_id, Credits candidate);
    bool set_rank_by_pnl(const std::string& user_id, int64_t rank);
    bool set_rank_by_volume(const std::string& user_id, int64_t rank);
    void update_daily_reward(const std::string& user_id, int consecutive_days, int64_t claimed_at);

    // Credit transactions. insert_transaction assigns the next per-user
    // sequence and returns it.
    int64_t insert_transaction(const CreditTransaction& tx);
    std::vector<CreditTransaction> get_transactions_for_user(
        const std::string& user_id,
        const std::optional<TransactionType>& type,
        int limit, int offset);
    int64_t count_transactions_for_user(const std::string& user_id,
                                        const std::optional<TransactionType>& type);
    std::vector<CreditTransaction> get_transaction_history(const std::string& user_id);

    // Holds
    void insert_hold(const HoldRecord& hold);
    std::optional<HoldRecord> get_hold(const std::string& hold_id);
    bool transition_hold(const std::string& hold_id, HoldStatus from, HoldStatus to);
    Credits sum_active_holds(const std::string& user_id, int64_t now);
    std::optional<HoldRecord> find_active_hold(const std::string& user_id, const std::string& reason,
                                               const std::string& reference_id, int64_t now);

    // Bets
    void insert_bet(const BetRecord& bet);
    std::optional<BetRecord> get_bet(const std::string& bet_id);
    std::optional<BetRecord> find_bet_by_idempotency_key(const std::string& user_id,
                                                         const std::string& key);
    std::vector<BetRecord> get_pending_bets_for_market(const std::string& market_id);
    std::vector<BetRecord> list_bets_for_user(const std::string& user_id,
                                              const std::optional<BetStatus>& status,
                                              int limit, int offset);
    int64_t count_pending_bets_for_user(const std::string& user_id);
    Credits pending_stake_for_market(const std::string& user_id, const std::string& market_id);
    // Moves a pending bet to a terminal status. Returns false when the bet is
    // no longer pending.
    bool settle_bet(const std::string& bet_id, BetStatus status,
                    const std::optional<Credits>& actual_payout, int64_t resolved_at);

    // Credit purchases
    void insert_purchase(const PurchaseRecord& purchase);
    std::optional<PurchaseRecord> find_purchase_by_external_id(const std::string& provider,
                                                               const std::string& external_id);
    std::vector<PurchaseRecord> list_purchases_for_user(const std::string& user_id);

    // Market interactions
    void upsert_interaction(const InteractionRecord& record);
    std::optional<InteractionRecord> get_interaction(const std::string& user_id,
                                                     const std::string& market_id);
    std::vector<InteractionRecord> get_active_skips(const std::string& user_id, int64_t now);
    bool remove_interaction(const std::string& user_id, const std::string& market_id);
    int delete_expired_interactions(int64_t now);

    void execute(const std::string& sql);

private:
    struct StatementDeleter {
        void operator()(sqlite3_stmt* stmt) const;
    };
    using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

    sqlite3* db_{nullptr};
    std::string db_path_;
    bool in_transaction_{false};

    // Statement preparation helpers
    Statement prepare(const std::string& sql);
    void bind_text(sqlite3_stmt* stmt, int index, const std::string& value);
    void bind_optional_text(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value);
    void bind_int64(sqlite3_stmt* stmt, int index, int64_t value);
    void bind_credits(sqlite3_stmt* stmt, int index, Credits value);
    void bind_null(sqlite3_stmt* stmt, int index);

    // Returns true on SQLITE_ROW, false on SQLITE_DONE, throws otherwise.
    bool step(sqlite3_stmt* stmt, const char* context);
    int changes() const;
    [[noreturn]] void throw_store_error(int rc, const std::string& context);

    // Result extraction helpers
    std::string get_text(sqlite3_stmt* stmt, int col);
    int64_t get_int64(sqlite3_stmt* stmt, int col);
    Credits get_credits(sqlite3_stmt* stmt, int col);
    bool is_null(sqlite3_stmt* stmt, int col);

    UserRecord read_user(sqlite3_stmt* stmt);
    CreditTransaction read_transaction(sqlite3_stmt* stmt);
    HoldRecord read_hold(sqlite3_stmt* stmt);
    BetRecord read_bet(sqlite3_stmt* stmt);
    PurchaseRecord read_purchase(sqlite3_stmt* stmt);
    InteractionRecord read_interaction(sqlite3_stmt* stmt);

    // Schema creation
    void create_tables();
    void create_indexes();
};

/**
 * Scoped write transaction.
 *
 * Begins an IMMEDIATE transaction unless the connection already has one open,
 * in which case the guard joins it and leaves commit/rollback to the owner.
 * An owning guard that is destroyed without commit() rolls back.
 */
class TransactionGuard {
public:
    explicit TransactionGuard(Database& db);
    ~TransactionGuard();

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    void commit();
    bool owns() const { return owns_; }

private:
    Database& db_;
    bool owns_{false};
    bool done_{false};
};

} // namespace thisthat
