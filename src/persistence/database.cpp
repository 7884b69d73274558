#include "persistence/database.hpp"
#include "common/errors.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <random>
#include <sstream>
#include <iomanip>

namespace thisthat {

namespace {

constexpr int kSchemaVersion = 2;

constexpr const char* kUserColumns =
    "id, credit_balance, overall_pnl, total_volume, biggest_win, rank_by_pnl, "
    "rank_by_volume, consecutive_days_online, last_daily_reward_at, created_at";

constexpr const char* kTransactionColumns =
    "id, user_id, sequence, amount, transaction_type, reference_id, balance_after, created_at";

constexpr const char* kHoldColumns =
    "id, user_id, amount, reason, reference_id, created_at, expires_at, status";

constexpr const char* kBetColumns =
    "id, user_id, market_id, side, amount, shares, price_at_bet, potential_payout, "
    "idempotency_key, status, actual_payout, created_at, resolved_at";

constexpr const char* kPurchaseColumns =
    "id, user_id, package_id, credits_granted, usd_amount, status, provider, external_id, created_at";

constexpr const char* kInteractionColumns =
    "user_id, market_id, action, timestamp, expires_at";

template <typename T>
T require(const std::optional<T>& value, const char* column, const std::string& raw) {
    if (!value) {
        throw StoreError(fmt::format("Unrecognized {} value in store: '{}'", column, raw));
    }
    return *value;
}

} // namespace

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

std::string generate_uuid() {
    thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t a = dis(gen);
    uint64_t b = dis(gen);

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(8) << ((a >> 32) & 0xFFFFFFFF);
    ss << "-";
    ss << std::setw(4) << ((a >> 16) & 0xFFFF);
    ss << "-";
    ss << std::setw(4) << (((a & 0xFFFF) & 0x0FFF) | 0x4000);  // Version 4
    ss << "-";
    ss << std::setw(4) << (((b >> 48) & 0x3FFF) | 0x8000);  // Variant
    ss << "-";
    ss << std::setw(12) << (b & 0xFFFFFFFFFFFF);

    return ss.str();
}

// ============================================================================
// CONNECTION
// ============================================================================

Database::Database(const std::string& db_path, int busy_timeout_ms)
    : db_path_(db_path)
{
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError("Failed to open database: " + error);
    }

    sqlite3_busy_timeout(db_, busy_timeout_ms);

    execute("PRAGMA foreign_keys = ON;");

    // WAL lets readers proceed while one writer holds the lock
    execute("PRAGMA journal_mode = WAL;");

    spdlog::debug("Database opened: {}", db_path);
}

Database::~Database() {
    if (in_transaction_) {
        try {
            rollback();
        } catch (const std::exception& e) {
            spdlog::error("Rollback on close failed: {}", e.what());
        }
    }
    close();
}

bool Database::is_open() const {
    return db_ != nullptr;
}

void Database::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
        spdlog::debug("Database closed: {}", db_path_);
    }
}

void Database::execute(const std::string& sql) {
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string error = errmsg ? errmsg : "Unknown error";
        sqlite3_free(errmsg);
        throw_store_error(rc, "SQL error: " + error + " in: " + sql);
    }
}

void Database::begin_immediate() {
    if (!in_transaction_) {
        execute("BEGIN IMMEDIATE;");
        in_transaction_ = true;
    }
}

void Database::commit() {
    if (in_transaction_) {
        execute("COMMIT;");
        in_transaction_ = false;
    }
}

void Database::rollback() {
    if (!in_transaction_) {
        return;
    }
    in_transaction_ = false;
    // SQLite may already have rolled back on its own after certain errors
    if (sqlite3_get_autocommit(db_) == 0) {
        execute("ROLLBACK;");
    }
}

// ============================================================================
// STATEMENT HELPERS
// ============================================================================

void Database::StatementDeleter::operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
}

Database::Statement Database::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        throw_store_error(rc, "Failed to prepare statement: " + error);
    }
    return Statement(stmt);
}

void Database::bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void Database::bind_optional_text(sqlite3_stmt* stmt, int index,
                                  const std::optional<std::string>& value) {
    if (value) {
        bind_text(stmt, index, *value);
    } else {
        bind_null(stmt, index);
    }
}

void Database::bind_int64(sqlite3_stmt* stmt, int index, int64_t value) {
    sqlite3_bind_int64(stmt, index, value);
}

void Database::bind_credits(sqlite3_stmt* stmt, int index, Credits value) {
    sqlite3_bind_int64(stmt, index, value.micros());
}

void Database::bind_null(sqlite3_stmt* stmt, int index) {
    sqlite3_bind_null(stmt, index);
}

bool Database::step(sqlite3_stmt* stmt, const char* context) {
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw_store_error(rc, fmt::format("{}: {}", context, sqlite3_errmsg(db_)));
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

void Database::throw_store_error(int rc, const std::string& context) {
    int primary = rc & 0xFF;
    if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) {
        throw TransientStoreError(context);
    }
    throw StoreError(context);
}

std::string Database::get_text(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

int64_t Database::get_int64(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_int64(stmt, col);
}

Credits Database::get_credits(sqlite3_stmt* stmt, int col) {
    return Credits::from_micros(sqlite3_column_int64(stmt, col));
}

bool Database::is_null(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_type(stmt, col) == SQLITE_NULL;
}

// ============================================================================
// SCHEMA
// ============================================================================

void Database::initialize_schema() {
    create_tables();
    create_indexes();
    spdlog::debug("Database schema initialized (version {})", get_schema_version());
}

void Database::create_tables() {
    execute(R"(
        CREATE TABLE IF NOT EXISTS users (
            id TEXT PRIMARY KEY,
            credit_balance INTEGER NOT NULL DEFAULT 0 CHECK (credit_balance >= 0),
            overall_pnl INTEGER NOT NULL DEFAULT 0,
            total_volume INTEGER NOT NULL DEFAULT 0,
            biggest_win INTEGER NOT NULL DEFAULT 0,
            rank_by_pnl INTEGER,
            rank_by_volume INTEGER,
            consecutive_days_online INTEGER NOT NULL DEFAULT 0,
            last_daily_reward_at INTEGER,
            created_at INTEGER NOT NULL
        );
    )");

    execute(R"(
        CREATE TABLE IF NOT EXISTS credit_transactions (
            id TEXT PRIMARY KEY,
            user_id TEXT NOT NULL,
            sequence INTEGER NOT NULL,
            amount INTEGER NOT NULL,
            transaction_type TEXT NOT NULL,
            reference_id TEXT,
            balance_after INTEGER NOT NULL CHECK (balance_after >= 0),
            created_at INTEGER NOT NULL,
            FOREIGN KEY (user_id) REFERENCES users(id),
            UNIQUE (user_id, sequence)
        );
    )");

    execute(R"(
        CREATE TABLE IF NOT EXISTS credit_holds (
            id TEXT PRIMARY KEY,
            user_id TEXT NOT NULL,
            amount INTEGER NOT NULL CHECK (amount > 0),
            reason TEXT NOT NULL,
            reference_id TEXT,
            created_at INTEGER NOT NULL,
            expires_at INTEGER NOT NULL,
            status TEXT NOT NULL,
            FOREIGN KEY (user_id) REFERENCES users(id)
        );
    )");

    execute(R"(
        CREATE TABLE IF NOT EXISTS bets (
            id TEXT PRIMARY KEY,
            user_id TEXT NOT NULL,
            market_id TEXT NOT NULL,
            side TEXT NOT NULL,
            amount INTEGER NOT NULL CHECK (amount > 0),
            shares INTEGER NOT NULL,
            price_at_bet INTEGER NOT NULL,
            potential_payout INTEGER NOT NULL,
            idempotency_key TEXT,
            status TEXT NOT NULL,
            actual_payout INTEGER,
            created_at INTEGER NOT NULL,
            resolved_at INTEGER,
            FOREIGN KEY (user_id) REFERENCES users(id)
        );
    )");

    execute(R"(
        CREATE TABLE IF NOT EXISTS credit_purchases (
            id TEXT PRIMARY KEY,
            user_id TEXT NOT NULL,
            package_id TEXT NOT NULL,
            credits_granted INTEGER NOT NULL CHECK (credits_granted > 0),
            usd_amount INTEGER NOT NULL CHECK (usd_amount >= 0),
            status TEXT NOT NULL DEFAULT 'completed',
            provider TEXT NOT NULL,
            external_id TEXT,
            created_at INTEGER NOT NULL,
            FOREIGN KEY (user_id) REFERENCES users(id)
        );
    )");

    execute(R"(
        CREATE TABLE IF NOT EXISTS user_market_interactions (
            user_id TEXT NOT NULL,
            market_id TEXT NOT NULL,
            action TEXT NOT NULL,
            timestamp INTEGER NOT NULL,
            expires_at INTEGER NOT NULL,
            PRIMARY KEY (user_id, market_id)
        );
    )");

    execute(R"(
        CREATE TABLE IF NOT EXISTS schema_version (
            version INTEGER PRIMARY KEY
        );
    )");

    execute(fmt::format("INSERT OR IGNORE INTO schema_version (version) VALUES ({});",
                        kSchemaVersion));
}

void Database::create_indexes() {
    execute("CREATE INDEX IF NOT EXISTS idx_tx_user_created ON credit_transactions(user_id, created_at DESC);");
    execute("CREATE INDEX IF NOT EXISTS idx_holds_user_status ON credit_holds(user_id, status);");
    execute("CREATE INDEX IF NOT EXISTS idx_bets_market_status ON bets(market_id, status);");
    execute("CREATE INDEX IF NOT EXISTS idx_bets_user_status ON bets(user_id, status);");
    execute("CREATE UNIQUE INDEX IF NOT EXISTS ux_bets_user_idempotency "
            "ON bets(user_id, idempotency_key) WHERE idempotency_key IS NOT NULL;");
    execute("CREATE INDEX IF NOT EXISTS idx_holds_user_reference ON credit_holds(user_id, reference_id);");
    execute("CREATE INDEX IF NOT EXISTS idx_purchases_user_created ON credit_purchases(user_id, created_at DESC);");
    execute("CREATE UNIQUE INDEX IF NOT EXISTS ux_purchases_provider_external "
            "ON credit_purchases(provider, external_id) WHERE external_id IS NOT NULL;");
    execute("CREATE INDEX IF NOT EXISTS idx_interactions_expires ON user_market_interactions(expires_at);");
}

int Database::get_schema_version() {
    auto stmt = prepare("SELECT MAX(version) FROM schema_version;");
    int version = 0;
    if (step(stmt.get(), "Failed to read schema version")) {
        version = static_cast<int>(get_int64(stmt.get(), 0));
    }
    return version;
}

// ============================================================================
// USERS
// ============================================================================

UserRecord Database::read_user(sqlite3_stmt* stmt) {
    UserRecord u;
    u.id = get_text(stmt, 0);
    u.credit_balance = get_credits(stmt, 1);
    u.overall_pnl = get_credits(stmt, 2);
    u.total_volume = get_credits(stmt, 3);
    u.biggest_win = get_credits(stmt, 4);
    if (!is_null(stmt, 5)) u.rank_by_pnl = get_int64(stmt, 5);
    if (!is_null(stmt, 6)) u.rank_by_volume = get_int64(stmt, 6);
    u.consecutive_days_online = static_cast<int>(get_int64(stmt, 7));
    if (!is_null(stmt, 8)) u.last_daily_reward_at = get_int64(stmt, 8);
    u.created_at = get_int64(stmt, 9);
    return u;
}

bool Database::insert_user(const UserRecord& user) {
    auto stmt = prepare(R"(
        INSERT OR IGNORE INTO users (
            id, credit_balance, overall_pnl, total_volume, biggest_win,
            consecutive_days_online, created_at
        ) VALUES (?, ?, ?, ?, ?, ?, ?);
    )");

    bind_text(stmt.get(), 1, user.id);
    bind_credits(stmt.get(), 2, user.credit_balance);
    bind_credits(stmt.get(), 3, user.overall_pnl);
    bind_credits(stmt.get(), 4, user.total_volume);
    bind_credits(stmt.get(), 5, user.biggest_win);
    bind_int64(stmt.get(), 6, user.consecutive_days_online);
    bind_int64(stmt.get(), 7, user.created_at ? user.created_at : now_micros());

    step(stmt.get(), "Failed to insert user");
    return changes() == 1;
}

std::optional<UserRecord> Database::get_user(const std::string& user_id) {
    auto stmt = prepare(fmt::format("SELECT {} FROM users WHERE id = ?;", kUserColumns));
    bind_text(stmt.get(), 1, user_id);

    if (!step(stmt.get(), "Failed to read user")) {
        return std::nullopt;
    }
    return read_user(stmt.get());
}

std::vector<UserRecord> Database::list_users() {
    auto stmt = prepare(fmt::format("SELECT {} FROM users ORDER BY id;", kUserColumns));

    std::vector<UserRecord> result;
    while (step(stmt.get(), "Failed to list users")) {
        result.push_back(read_user(stmt.get()));
    }
    return result;
}

void Database::set_user_balance(const std::string& user_id, Credits balance) {
    auto stmt = prepare("UPDATE users SET credit_balance = ? WHERE id = ?;");
    bind_credits(stmt.get(), 1, balance);
    bind_text(stmt.get(), 2, user_id);
    step(stmt.get(), "Failed to update balance");
}

void Database::add_user_stats(const std::string& user_id, Credits pnl_delta, Credits volume_delta) {
    auto stmt = prepare(R"(
        UPDATE users SET overall_pnl = overall_pnl + ?, total_volume = total_volume + ?
        WHERE id = ?;
    )");
    bind_credits(stmt.get(), 1, pnl_delta);
    bind_credits(stmt.get(), 2, volume_delta);
    bind_text(stmt.get(), 3, user_id);
    step(stmt.get(), "Failed to update user stats");
}

void Database::raise_biggest_win(const std::string& user_id, Credits candidate) {
    auto stmt = prepare("UPDATE users SET biggest_win = ?1 WHERE id = ?2 AND biggest_win < ?1;");
    bind_credits(stmt.get(), 1, candidate);
    bind_text(stmt.get(), 2, user_id);
    step(stmt.get(), "Failed to update biggest win");
}

bool Database::set_rank_by_pnl(const std::string& user_id, int64_t rank) {
    auto stmt = prepare("UPDATE users SET rank_by_pnl = ? WHERE id = ?;");
    bind_int64(stmt.get(), 1, rank);
    bind_text(stmt.get(), 2, user_id);
    step(stmt.get(), "Failed to update PnL rank");
    return changes() == 1;
}

bool Database::set_rank_by_volume(const std::string& user_id, int64_t rank) {
    auto stmt = prepare("UPDATE users SET rank_by_volume = ? WHERE id = ?;");
    bind_int64(stmt.get(), 1, rank);
    bind_text(stmt.get(), 2, user_id);
    step(stmt.get(), "Failed to update volume rank");
    return changes() == 1;
}

void Database::update_daily_reward(const std::string& user_id, int consecutive_days,
                                   int64_t claimed_at) {
    auto stmt = prepare(R"(
        UPDATE users SET consecutive_days_online = ?, last_daily_reward_at = ?
        WHERE id = ?;
    )");
    bind_int64(stmt.get(), 1, consecutive_days);
    bind_int64(stmt.get(), 2, claimed_at);
    bind_text(stmt.get(), 3, user_id);
    step(stmt.get(), "Failed to update daily reward");
}

// ============================================================================
// CREDIT TRANSACTIONS
// ============================================================================

CreditTransaction Database::read_transaction(sqlite3_stmt* stmt) {
    CreditTransaction tx;
    tx.id = get_text(stmt, 0);
    tx.user_id = get_text(stmt, 1);
    tx.sequence = get_int64(stmt, 2);
    tx.amount = get_credits(stmt, 3);
    std::string type = get_text(stmt, 4);
    tx.type = require(transaction_type_from_string(type), "transaction_type", type);
    tx.reference_id = get_text(stmt, 5);
    tx.balance_after = get_credits(stmt, 6);
    tx.created_at = get_int64(stmt, 7);
    return tx;
}

int64_t Database::insert_transaction(const CreditTransaction& tx) {
    int64_t sequence = 1;
    {
        auto stmt = prepare("SELECT COALESCE(MAX(sequence), 0) + 1 FROM credit_transactions WHERE user_id = ?;");
        bind_text(stmt.get(), 1, tx.user_id);
        if (step(stmt.get(), "Failed to read transaction sequence")) {
            sequence = get_int64(stmt.get(), 0);
        }
    }

    auto stmt = prepare(R"(
        INSERT INTO credit_transactions (
            id, user_id, sequence, amount, transaction_type, reference_id,
            balance_after, created_at
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?);
    )");

    bind_text(stmt.get(), 1, tx.id.empty() ? generate_uuid() : tx.id);
    bind_text(stmt.get(), 2, tx.user_id);
    bind_int64(stmt.get(), 3, sequence);
    bind_credits(stmt.get(), 4, tx.amount);
    bind_text(stmt.get(), 5, to_string(tx.type));
    bind_text(stmt.get(), 6, tx.reference_id);
    bind_credits(stmt.get(), 7, tx.balance_after);
    bind_int64(stmt.get(), 8, tx.created_at ? tx.created_at : now_micros());

    step(stmt.get(), "Failed to insert credit transaction");
    return sequence;
}

std::vector<CreditTransaction> Database::get_transactions_for_user(
    const std::string& user_id,
    const std::optional<TransactionType>& type,
    int limit, int offset)
{
    auto stmt = prepare(fmt::format(R"(
        SELECT {} FROM credit_transactions
        WHERE user_id = ?1 AND (?2 IS NULL OR transaction_type = ?2)
        ORDER BY created_at DESC, sequence DESC
        LIMIT ?3 OFFSET ?4;
    )", kTransactionColumns));

    bind_text(stmt.get(), 1, user_id);
    if (type) {
        bind_text(stmt.get(), 2, to_string(*type));
    } else {
        bind_null(stmt.get(), 2);
    }
    bind_int64(stmt.get(), 3, limit);
    bind_int64(stmt.get(), 4, offset);

    std::vector<CreditTransaction> result;
    while (step(stmt.get(), "Failed to list transactions")) {
        result.push_back(read_transaction(stmt.get()));
    }
    return result;
}

int64_t Database::count_transactions_for_user(const std::string& user_id,
                                              const std::optional<TransactionType>& type) {
    auto stmt = prepare(R"(
        SELECT COUNT(*) FROM credit_transactions
        WHERE user_id = ?1 AND (?2 IS NULL OR transaction_type = ?2);
    )");
    bind_text(stmt.get(), 1, user_id);
    if (type) {
        bind_text(stmt.get(), 2, to_string(*type));
    } else {
        bind_null(stmt.get(), 2);
    }

    int64_t count = 0;
    if (step(stmt.get(), "Failed to count transactions")) {
        count = get_int64(stmt.get(), 0);
    }
    return count;
}

std::vector<CreditTransaction> Database::get_transaction_history(const std::string& user_id) {
    auto stmt = prepare(fmt::format(
        "SELECT {} FROM credit_transactions WHERE user_id = ? ORDER BY sequence ASC;",
        kTransactionColumns));
    bind_text(stmt.get(), 1, user_id);

    std::vector<CreditTransaction> result;
    while (step(stmt.get(), "Failed to read transaction history")) {
        result.push_back(read_transaction(stmt.get()));
    }
    return result;
}

// ============================================================================
// HOLDS
// ============================================================================

HoldRecord Database::read_hold(sqlite3_stmt* stmt) {
    HoldRecord h;
    h.id = get_text(stmt, 0);
    h.user_id = get_text(stmt, 1);
    h.amount = get_credits(stmt, 2);
    h.reason = get_text(stmt, 3);
    h.reference_id = get_text(stmt, 4);
    h.created_at = get_int64(stmt, 5);
    h.expires_at = get_int64(stmt, 6);
    std::string status = get_text(stmt, 7);
    h.status = require(hold_status_from_string(status), "hold status", status);
    return h;
}

void Database::insert_hold(const HoldRecord& hold) {
    auto stmt = prepare(R"(
        INSERT INTO credit_holds (
            id, user_id, amount, reason, reference_id, created_at, expires_at, status
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?);
    )");

    bind_text(stmt.get(), 1, hold.id);
    bind_text(stmt.get(), 2, hold.user_id);
    bind_credits(stmt.get(), 3, hold.amount);
    bind_text(stmt.get(), 4, hold.reason);
    bind_text(stmt.get(), 5, hold.reference_id);
    bind_int64(stmt.get(), 6, hold.created_at);
    bind_int64(stmt.get(), 7, hold.expires_at);
    bind_text(stmt.get(), 8, to_string(hold.status));

    step(stmt.get(), "Failed to insert hold");
}

std::optional<HoldRecord> Database::get_hold(const std::string& hold_id) {
    auto stmt = prepare(fmt::format("SELECT {} FROM credit_holds WHERE id = ?;", kHoldColumns));
    bind_text(stmt.get(), 1, hold_id);

    if (!step(stmt.get(), "Failed to read hold")) {
        return std::nullopt;
    }
    return read_hold(stmt.get());
}

bool Database::transition_hold(const std::string& hold_id, HoldStatus from, HoldStatus to) {
    auto stmt = prepare("UPDATE credit_holds SET status = ? WHERE id = ? AND status = ?;");
    bind_text(stmt.get(), 1, to_string(to));
    bind_text(stmt.get(), 2, hold_id);
    bind_text(stmt.get(), 3, to_string(from));
    step(stmt.get(), "Failed to update hold");
    return changes() == 1;
}

Credits Database::sum_active_holds(const std::string& user_id, int64_t now) {
    auto stmt = prepare(R"(
        SELECT COALESCE(SUM(amount), 0) FROM credit_holds
        WHERE user_id = ? AND status = 'active' AND expires_at > ?;
    )");
    bind_text(stmt.get(), 1, user_id);
    bind_int64(stmt.get(), 2, now);

    Credits total;
    if (step(stmt.get(), "Failed to sum holds")) {
        total = get_credits(stmt.get(), 0);
    }
    return total;
}

std::optional<HoldRecord> Database::find_active_hold(const std::string& user_id,
                                                    const std::string& reason,
                                                    const std::string& reference_id,
                                                    int64_t now) {
    auto stmt = prepare(fmt::format(R"(
        SELECT {} FROM credit_holds
        WHERE user_id = ? AND reason = ? AND reference_id = ?
          AND status = 'active' AND expires_at > ?
        LIMIT 1;
    )", kHoldColumns));
    bind_text(stmt.get(), 1, user_id);
    bind_text(stmt.get(), 2, reason);
    bind_text(stmt.get(), 3, reference_id);
    bind_int64(stmt.get(), 4, now);

    if (!step(stmt.get(), "Failed to find hold")) {
        return std::nullopt;
    }
    return read_hold(stmt.get());
}

// ============================================================================
// BETS
// ============================================================================

BetRecord Database::read_bet(sqlite3_stmt* stmt) {
    BetRecord b;
    b.id = get_text(stmt, 0);
    b.user_id = get_text(stmt, 1);
    b.market_id = get_text(stmt, 2);
    std::string side = get_text(stmt, 3);
    b.side = require(side_from_string(side), "side", side);
    b.amount = get_credits(stmt, 4);
    b.shares = get_credits(stmt, 5);
    b.price_at_bet = get_credits(stmt, 6);
    b.potential_payout = get_credits(stmt, 7);
    if (!is_null(stmt, 8)) b.idempotency_key = get_text(stmt, 8);
    std::string status = get_text(stmt, 9);
    b.status = require(bet_status_from_string(status), "bet status", status);
    if (!is_null(stmt, 10)) b.actual_payout = get_credits(stmt, 10);
    b.created_at = get_int64(stmt, 11);
    if (!is_null(stmt, 12)) b.resolved_at = get_int64(stmt, 12);
    return b;
}

void Database::insert_bet(const BetRecord& bet) {
    auto stmt = prepare(R"(
        INSERT INTO bets (
            id, user_id, market_id, side, amount, shares, price_at_bet,
            potential_payout, idempotency_key, status, created_at
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )");

    bind_text(stmt.get(), 1, bet.id);
    bind_text(stmt.get(), 2, bet.user_id);
    bind_text(stmt.get(), 3, bet.market_id);
    bind_text(stmt.get(), 4, to_string(bet.side));
    bind_credits(stmt.get(), 5, bet.amount);
    bind_credits(stmt.get(), 6, bet.shares);
    bind_credits(stmt.get(), 7, bet.price_at_bet);
    bind_credits(stmt.get(), 8, bet.potential_payout);
    bind_optional_text(stmt.get(), 9, bet.idempotency_key);
    bind_text(stmt.get(), 10, to_string(bet.status));
    bind_int64(stmt.get(), 11, bet.created_at);

    step(stmt.get(), "Failed to insert bet");
}

std::optional<BetRecord> Database::get_bet(const std::string& bet_id) {
    auto stmt = prepare(fmt::format("SELECT {} FROM bets WHERE id = ?;", kBetColumns));
    bind_text(stmt.get(), 1, bet_id);

    if (!step(stmt.get(), "Failed to read bet")) {
        return std::nullopt;
    }
    return read_bet(stmt.get());
}

std::optional<BetRecord> Database::find_bet_by_idempotency_key(const std::string& user_id,
                                                               const std::string& key) {
    auto stmt = prepare(fmt::format(
        "SELECT {} FROM bets WHERE user_id = ? AND idempotency_key = ?;", kBetColumns));
    bind_text(stmt.get(), 1, user_id);
    bind_text(stmt.get(), 2, key);

    if (!step(stmt.get(), "Failed to look up idempotency key")) {
        return std::nullopt;
    }
    return read_bet(stmt.get());
}

std::vector<BetRecord> Database::get_pending_bets_for_market(const std::string& market_id) {
    auto stmt = prepare(fmt::format(
        "SELECT {} FROM bets WHERE market_id = ? AND status = 'pending' ORDER BY created_at ASC;",
        kBetColumns));
    bind_text(stmt.get(), 1, market_id);

    std::vector<BetRecord> result;
    while (step(stmt.get(), "Failed to list pending bets")) {
        result.push_back(read_bet(stmt.get()));
    }
    return result;
}

std::vector<BetRecord> Database::list_bets_for_user(const std::string& user_id,
                                                    const std::optional<BetStatus>& status,
                                                    int limit, int offset) {
    auto stmt = prepare(fmt::format(R"(
        SELECT {} FROM bets
        WHERE user_id = ?1 AND (?2 IS NULL OR status = ?2)
        ORDER BY created_at DESC
        LIMIT ?3 OFFSET ?4;
    )", kBetColumns));

    bind_text(stmt.get(), 1, user_id);
    if (status) {
        bind_text(stmt.get(), 2, to_string(*status));
    } else {
        bind_null(stmt.get(), 2);
    }
    bind_int64(stmt.get(), 3, limit);
    bind_int64(stmt.get(), 4, offset);

    std::vector<BetRecord> result;
    while (step(stmt.get(), "Failed to list bets")) {
        result.push_back(read_bet(stmt.get()));
    }
    return result;
}

int64_t Database::count_pending_bets_for_user(const std::string& user_id) {
    auto stmt = prepare("SELECT COUNT(*) FROM bets WHERE user_id = ? AND status = 'pending';");
    bind_text(stmt.get(), 1, user_id);

    int64_t count = 0;
    if (step(stmt.get(), "Failed to count pending bets")) {
        count = get_int64(stmt.get(), 0);
    }
    return count;
}

Credits Database::pending_stake_for_market(const std::string& user_id,
                                           const std::string& market_id) {
    auto stmt = prepare(R"(
        SELECT COALESCE(SUM(amount), 0) FROM bets
        WHERE user_id = ? AND market_id = ? AND status = 'pending';
    )");
    bind_text(stmt.get(), 1, user_id);
    bind_text(stmt.get(), 2, market_id);

    Credits total;
    if (step(stmt.get(), "Failed to sum pending stake")) {
        total = get_credits(stmt.get(), 0);
    }
    return total;
}

bool Database::settle_bet(const std::string& bet_id, BetStatus status,
                          const std::optional<Credits>& actual_payout, int64_t resolved_at) {
    auto stmt = prepare(R"(
        UPDATE bets SET status = ?, actual_payout = ?, resolved_at = ?
        WHERE id = ? AND status = 'pending';
    )");

    bind_text(stmt.get(), 1, to_string(status));
    if (actual_payout) {
        bind_credits(stmt.get(), 2, *actual_payout);
    } else {
        bind_null(stmt.get(), 2);
    }
    bind_int64(stmt.get(), 3, resolved_at);
    bind_text(stmt.get(), 4, bet_id);

    step(stmt.get(), "Failed to settle bet");
    return changes() == 1;
}

// ============================================================================
// MARKET INTERACTIONS
// ============================================================================

InteractionRecord Database::read_interaction(sqlite3_stmt* stmt) {
    InteractionRecord r;
    r.user_id = get_text(stmt, 0);
    r.market_id = get_text(stmt, 1);
    r.action = get_text(stmt, 2);
    r.timestamp = get_int64(stmt, 3);
    r.expires_at = get_int64(stmt, 4);
    return r;
}

void Database::upsert_interaction(const InteractionRecord& record) {
    auto stmt = prepare(R"(
        INSERT INTO user_market_interactions (user_id, market_id, action, timestamp, expires_at)
        VALUES (?, ?, ?, ?, ?)
        ON CONFLICT (user_id, market_id) DO UPDATE SET
            action = excluded.action,
            timestamp = excluded.timestamp,
            expires_at = excluded.expires_at;
    )");

    bind_text(stmt.get(), 1, record.user_id);
    bind_text(stmt.get(), 2, record.market_id);
    bind_text(stmt.get(), 3, record.action);
    bind_int64(stmt.get(), 4, record.timestamp);
    bind_int64(stmt.get(), 5, record.expires_at);

    step(stmt.get(), "Failed to upsert interaction");
}

std::optional<InteractionRecord> Database::get_interaction(const std::string& user_id,
                                                           const std::string& market_id) {
    auto stmt = prepare(fmt::format(
        "SELECT {} FROM user_market_interactions WHERE user_id = ? AND market_id = ?;",
        kInteractionColumns));
    bind_text(stmt.get(), 1, user_id);
    bind_text(stmt.get(), 2, market_id);

    if (!step(stmt.get(), "Failed to read interaction")) {
        return std::nullopt;
    }
    return read_interaction(stmt.get());
}

std::vector<InteractionRecord> Database::get_active_skips(const std::string& user_id, int64_t now) {
    auto stmt = prepare(fmt::format(R"(
        SELECT {} FROM user_market_interactions
        WHERE user_id = ? AND action = 'skip' AND expires_at > ?;
    )", kInteractionColumns));
    bind_text(stmt.get(), 1, user_id);
    bind_int64(stmt.get(), 2, now);

    std::vector<InteractionRecord> result;
    while (step(stmt.get(), "Failed to list skips")) {
        result.push_back(read_interaction(stmt.get()));
    }
    return result;
}

bool Database::remove_interaction(const std::string& user_id, const std::string& market_id) {
    auto stmt = prepare("DELETE FROM user_market_interactions WHERE user_id = ? AND market_id = ?;");
    bind_text(stmt.get(), 1, user_id);
    bind_text(stmt.get(), 2, market_id);
    step(stmt.get(), "Failed to remove interaction");
    return changes() > 0;
}

int Database::delete_expired_interactions(int64_t now) {
    auto stmt = prepare("DELETE FROM user_market_interactions WHERE expires_at <= ?;");
    bind_int64(stmt.get(), 1, now);
    step(stmt.get(), "Failed to delete expired interactions");
    return changes();
}

// ============================================================================
// CREDIT PURCHASES
// ============================================================================

PurchaseRecord Database::read_purchase(sqlite3_stmt* stmt) {
    PurchaseRecord p;
    p.id = get_text(stmt, 0);
    p.user_id = get_text(stmt, 1);
    p.package_id = get_text(stmt, 2);
    p.credits_granted = get_credits(stmt, 3);
    p.usd_amount = get_credits(stmt, 4);
    p.status = get_text(stmt, 5);
    p.provider = get_text(stmt, 6);
    if (!is_null(stmt, 7)) {
        p.external_id = get_text(stmt, 7);
    }
    p.created_at = get_int64(stmt, 8);
    return p;
}

void Database::insert_purchase(const PurchaseRecord& purchase) {
    auto stmt = prepare(R"(
        INSERT INTO credit_purchases (
            id, user_id, package_id, credits_granted, usd_amount, status, provider,
            external_id, created_at
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);
    )");

    bind_text(stmt.get(), 1, purchase.id);
    bind_text(stmt.get(), 2, purchase.user_id);
    bind_text(stmt.get(), 3, purchase.package_id);
    bind_credits(stmt.get(), 4, purchase.credits_granted);
    bind_credits(stmt.get(), 5, purchase.usd_amount);
    bind_text(stmt.get(), 6, purchase.status);
    bind_text(stmt.get(), 7, purchase.provider);
    bind_optional_text(stmt.get(), 8, purchase.external_id);
    bind_int64(stmt.get(), 9, purchase.created_at);

    step(stmt.get(), "Failed to insert purchase");
}

std::optional<PurchaseRecord> Database::find_purchase_by_external_id(const std::string& provider,
                                                                    const std::string& external_id) {
    auto stmt = prepare(fmt::format(
        "SELECT {} FROM credit_purchases WHERE provider = ? AND external_id = ?;",
        kPurchaseColumns));
    bind_text(stmt.get(), 1, provider);
    bind_text(stmt.get(), 2, external_id);

    if (!step(stmt.get(), "Failed to read purchase")) {
        return std::nullopt;
    }
    return read_purchase(stmt.get());
}

std::vector<PurchaseRecord> Database::list_purchases_for_user(const std::string& user_id) {
    auto stmt = prepare(fmt::format(
        "SELECT {} FROM credit_purchases WHERE user_id = ? ORDER BY created_at DESC, rowid DESC;",
        kPurchaseColumns));
    bind_text(stmt.get(), 1, user_id);

    std::vector<PurchaseRecord> result;
    while (step(stmt.get(), "Failed to list purchases")) {
        result.push_back(read_purchase(stmt.get()));
    }
    return result;
}

// ============================================================================
// TRANSACTION GUARD
// ============================================================================

TransactionGuard::TransactionGuard(Database& db)
    : db_(db)
{
    if (!db_.in_transaction()) {
        db_.begin_immediate();
        owns_ = true;
    }
}

TransactionGuard::~TransactionGuard() {
    if (owns_ && !done_) {
        try {
            db_.rollback();
        } catch (const std::exception& e) {
            spdlog::error("Transaction rollback failed: {}", e.what());
        }
    }
}

void TransactionGuard::commit() {
    if (owns_ && !done_) {
        db_.commit();
        done_ = true;
    }
}

} // namespace thisthat
