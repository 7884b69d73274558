#pragma once

#include "common/decimal.hpp"
#include "ledger/ledger.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace thisthat {

struct CreditPackage {
    std::string id;
    Credits credits;
    Decimal usd;
    std::string label;
};

// starter 500, boost 1000, pro 2500, whale 5000
const std::vector<CreditPackage>& credit_packages();
std::optional<CreditPackage> find_credit_package(const std::string& package_id);

struct PurchaseRequest {
    std::string user_id;
    std::string package_id;
    std::string provider{"manual"};
    std::optional<std::string> external_id;   // provider's payment reference
};

struct PurchaseResult {
    PurchaseRecord purchase;
    Credits new_balance;
    bool duplicate{false};   // external_id was already recorded
};

/**
 * CreditPurchases - Grants purchased credit packages.
 *
 * DESIGN:
 * - The purchase row and its credit_purchase ledger entry (referencing the
 *   purchase id) commit together or not at all.
 * - A provider callback replayed with the same external_id returns the
 *   recorded purchase instead of granting twice.
 */
class CreditPurchases {
public:
    explicit CreditPurchases(std::shared_ptr<Ledger> ledger);

    // Throws ValidationError for an unknown package, NotFound for an unknown user.
    PurchaseResult purchase(const PurchaseRequest& request);

    // Newest first.
    std::vector<PurchaseRecord> list_purchases(const std::string& user_id);

private:
    std::shared_ptr<Ledger> ledger_;
};

} // namespace thisthat
