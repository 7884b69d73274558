#include "economy/credit_purchases.hpp"
#include "common/errors.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace thisthat {

const std::vector<CreditPackage>& credit_packages() {
    static const std::vector<CreditPackage> packages = {
        {"starter", Credits::from_whole(500), Decimal::parse("4.99"), "Starter"},
        {"boost", Credits::from_whole(1000), Decimal::parse("9.99"), "Boost"},
        {"pro", Credits::from_whole(2500), Decimal::parse("19.99"), "Pro"},
        {"whale", Credits::from_whole(5000), Decimal::parse("34.99"), "Whale"},
    };
    return packages;
}

std::optional<CreditPackage> find_credit_package(const std::string& package_id) {
    for (const auto& package : credit_packages()) {
        if (package.id == package_id) {
            return package;
        }
    }
    return std::nullopt;
}

CreditPurchases::CreditPurchases(std::shared_ptr<Ledger> ledger)
    : ledger_(std::move(ledger))
{
    if (!ledger_) {
        throw std::invalid_argument("CreditPurchases requires a ledger");
    }
}

PurchaseResult CreditPurchases::purchase(const PurchaseRequest& request) {
    auto package = find_credit_package(request.package_id);
    if (!package) {
        throw ValidationError("Invalid credit package: " + request.package_id);
    }
    if (request.provider.empty()) {
        throw ValidationError("provider must not be empty");
    }
    if (request.external_id && request.external_id->empty()) {
        throw ValidationError("external_id must not be empty when present");
    }

    Database& db = ledger_->database();
    TransactionGuard guard(db);

    if (!db.get_user(request.user_id)) {
        throw NotFound("Unknown user: " + request.user_id);
    }

    if (request.external_id) {
        auto existing = db.find_purchase_by_external_id(request.provider, *request.external_id);
        if (existing) {
            guard.commit();
            spdlog::info("Purchase {}/{} already recorded as {}",
                         request.provider, *request.external_id, existing->id);
            return PurchaseResult{*existing, ledger_->get_balance(request.user_id).balance, true};
        }
    }

    PurchaseRecord record;
    record.id = generate_uuid();
    record.user_id = request.user_id;
    record.package_id = package->id;
    record.credits_granted = package->credits;
    record.usd_amount = package->usd;
    record.provider = request.provider;
    record.external_id = request.external_id;
    record.created_at = ledger_->now();

    db.insert_purchase(record);
    CreditTransaction tx = ledger_->credit(request.user_id, package->credits,
                                           TransactionType::CREDIT_PURCHASE, record.id);
    guard.commit();

    spdlog::info("User {} purchased {} ({} credits)", request.user_id, package->id,
                 package->credits.to_string());
    return PurchaseResult{record, tx.balance_after, false};
}

std::vector<PurchaseRecord> CreditPurchases::list_purchases(const std::string& user_id) {
    Database& db = ledger_->database();
    if (!db.get_user(user_id)) {
        throw NotFound("Unknown user: " + user_id);
    }
    return db.list_purchases_for_user(user_id);
}

} // namespace thisthat
