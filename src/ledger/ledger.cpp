#include "ledger/ledger.hpp"
#include "common/errors.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <stdexcept>

namespace thisthat {

Ledger::Config ledger_config_from(const Config& config) {
    Ledger::Config ledger_config;
    ledger_config.signup_bonus = config.economy.signup_bonus;
    ledger_config.default_hold_ttl = std::chrono::seconds(config.betting.hold_ttl_seconds);
    return ledger_config;
}

Ledger::Ledger(std::shared_ptr<Database> db, ClockFn clock)
    : Ledger(std::move(db), Config{}, std::move(clock))
{
}

Ledger::Ledger(std::shared_ptr<Database> db, Config config, ClockFn clock)
    : db_(std::move(db))
    , config_(config)
    , clock_(clock ? std::move(clock) : system_clock_fn())
{
    if (!db_) {
        throw std::invalid_argument("Ledger requires a database");
    }
}

// ============================================================================
// ACCOUNTS
// ============================================================================

Balance Ledger::open_account(const std::string& user_id, Credits initial_credits) {
    if (user_id.empty()) {
        throw ValidationError("user_id must not be empty");
    }
    if (initial_credits.is_negative()) {
        throw ValidationError("initial credits must not be negative");
    }

    TransactionGuard guard(*db_);

    UserRecord user;
    user.id = user_id;
    user.created_at = clock_();
    if (!db_->insert_user(user)) {
        guard.commit();
        spdlog::debug("Account {} already exists", user_id);
        return get_balance(user_id);
    }

    if (initial_credits.is_positive()) {
        apply(user_id, initial_credits, TransactionType::SIGNUP_BONUS, user_id);
    }
    guard.commit();

    spdlog::info("Opened account {} with {} credits", user_id, initial_credits.to_string());
    return get_balance(user_id);
}

Balance Ledger::open_account(const std::string& user_id) {
    return open_account(user_id, config_.signup_bonus);
}

UserRecord Ledger::require_user(const std::string& user_id) {
    auto user = db_->get_user(user_id);
    if (!user) {
        throw NotFound("Unknown user: " + user_id);
    }
    return *user;
}

// ============================================================================
// CREDIT / DEBIT
// ============================================================================

CreditTransaction Ledger::credit(const std::string& user_id, Credits amount,
                                 TransactionType type, const std::string& reference_id) {
    if (!amount.is_positive()) {
        throw ValidationError("credit amount must be positive, got " + amount.to_string());
    }
    return apply(user_id, amount, type, reference_id);
}

CreditTransaction Ledger::debit(const std::string& user_id, Credits amount,
                                TransactionType type, const std::string& reference_id) {
    if (!amount.is_positive()) {
        throw ValidationError("debit amount must be positive, got " + amount.to_string());
    }
    return apply(user_id, -amount, type, reference_id);
}

CreditTransaction Ledger::apply(const std::string& user_id, Credits delta,
                                TransactionType type, const std::string& reference_id) {
    TransactionGuard guard(*db_);

    int64_t now = clock_();
    UserRecord user = require_user(user_id);

    if (delta.is_negative()) {
        Credits available = user.credit_balance - db_->sum_active_holds(user_id, now);
        if (-delta > available) {
            throw InsufficientFunds(fmt::format(
                "User {} has {} available, needs {}",
                user_id, available.to_string(), (-delta).to_string()));
        }
    }

    CreditTransaction tx;
    tx.id = generate_uuid();
    tx.user_id = user_id;
    tx.amount = delta;
    tx.type = type;
    tx.reference_id = reference_id;
    tx.balance_after = user.credit_balance + delta;
    tx.created_at = now;

    db_->set_user_balance(user_id, tx.balance_after);
    tx.sequence = db_->insert_transaction(tx);
    guard.commit();

    spdlog::debug("Ledger {} {} {} -> balance {} (ref {})",
                  user_id, to_string(type), delta.to_string(),
                  tx.balance_after.to_string(), reference_id);
    return tx;
}

Balance Ledger::get_balance(const std::string& user_id) {
    UserRecord user = require_user(user_id);
    Balance b;
    b.balance = user.credit_balance;
    b.held = db_->sum_active_holds(user_id, clock_());
    b.available = max(Credits(), b.balance - b.held);
    return b;
}

// ============================================================================
// HOLDS
// ============================================================================

HoldRecord Ledger::place_hold(const std::string& user_id, Credits amount,
                              const std::string& reason, const std::string& reference_id,
                              std::optional<std::chrono::seconds> ttl) {
    if (!amount.is_positive()) {
        throw ValidationError("hold amount must be positive, got " + amount.to_string());
    }

    TransactionGuard guard(*db_);

    int64_t now = clock_();
    UserRecord user = require_user(user_id);
    Credits available = user.credit_balance - db_->sum_active_holds(user_id, now);
    if (amount > available) {
        throw InsufficientFunds(fmt::format(
            "User {} has {} available, hold needs {}",
            user_id, available.to_string(), amount.to_string()));
    }

    auto hold_ttl = ttl.value_or(config_.default_hold_ttl);

    HoldRecord hold;
    hold.id = generate_uuid();
    hold.user_id = user_id;
    hold.amount = amount;
    hold.reason = reason;
    hold.reference_id = reference_id;
    hold.created_at = now;
    hold.expires_at = now + std::chrono::duration_cast<std::chrono::microseconds>(hold_ttl).count();
    hold.status = HoldStatus::ACTIVE;

    db_->insert_hold(hold);
    guard.commit();

    spdlog::debug("Hold {} placed for {}: {}", hold.id, user_id, amount.to_string());
    return hold;
}

bool Ledger::release_hold(const std::string& hold_id) {
    TransactionGuard guard(*db_);

    if (!db_->get_hold(hold_id)) {
        throw NotFound("Unknown hold: " + hold_id);
    }
    bool released = db_->transition_hold(hold_id, HoldStatus::ACTIVE, HoldStatus::RELEASED);
    guard.commit();

    if (released) {
        spdlog::debug("Hold {} released", hold_id);
    }
    return released;
}

CreditTransaction Ledger::capture_hold(const std::string& hold_id, TransactionType type,
                                       const std::string& reference_id) {
    TransactionGuard guard(*db_);

    auto hold = db_->get_hold(hold_id);
    if (!hold) {
        throw NotFound("Unknown hold: " + hold_id);
    }
    if (!db_->transition_hold(hold_id, HoldStatus::ACTIVE, HoldStatus::CAPTURED)) {
        throw ValidationError(fmt::format("Hold {} is {}, cannot capture",
                                          hold_id, to_string(hold->status)));
    }

    // The hold no longer counts against available credits once captured
    CreditTransaction tx = apply(hold->user_id, -hold->amount, type, reference_id);
    guard.commit();
    return tx;
}

// ============================================================================
// QUERIES
// ============================================================================

TransactionPage Ledger::list_transactions(const std::string& user_id,
                                          std::optional<TransactionType> type,
                                          std::optional<int> limit,
                                          int offset) {
    if (offset < 0) {
        throw ValidationError("offset must not be negative");
    }
    if (limit && *limit < 0) {
        throw ValidationError("limit must not be negative");
    }
    require_user(user_id);

    TransactionPage page;
    page.limit = std::min(limit.value_or(config_.default_page_size), config_.max_page_size);
    page.offset = offset;
    page.transactions = db_->get_transactions_for_user(user_id, type, page.limit, offset);
    page.total = db_->count_transactions_for_user(user_id, type);
    return page;
}

LedgerAudit Ledger::verify_user(const std::string& user_id) {
    UserRecord user = require_user(user_id);
    auto history = db_->get_transaction_history(user_id);

    LedgerAudit audit;
    audit.stored_balance = user.credit_balance;
    audit.transaction_count = history.size();

    Credits running;
    for (const auto& tx : history) {
        running += tx.amount;
        if (running != tx.balance_after && !audit.first_divergent_transaction) {
            audit.first_divergent_transaction = tx.id;
        }
    }
    audit.replayed_balance = running;
    audit.consistent = !audit.first_divergent_transaction && running == user.credit_balance;

    if (!audit.consistent) {
        spdlog::error("Ledger divergence for {}: replayed {} stored {} (first bad tx {})",
                      user_id, running.to_string(), user.credit_balance.to_string(),
                      audit.first_divergent_transaction.value_or("none"));
    }
    return audit;
}

} // namespace thisthat
