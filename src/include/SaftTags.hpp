#pragma once

#include <string>
#include <unordered_set>

namespace saft {

// Structural element names of the audit file, as local names.
namespace tags {
constexpr const char *HEADER = "Header";
constexpr const char *TAX_TABLE_ENTRY = "TaxTableEntry";
constexpr const char *TAX_CODE_DETAILS = "TaxCodeDetails";
constexpr const char *CUSTOMER = "Customer";
constexpr const char *SUPPLIER = "Supplier";
constexpr const char *JOURNAL = "Journal";
constexpr const char *TRANSACTION = "Transaction";
constexpr const char *ANALYSIS = "Analysis";
constexpr const char *INVOICE = "Invoice";
constexpr const char *SALES_INVOICES = "SalesInvoices";
constexpr const char *PURCHASE_INVOICES = "PurchaseInvoices";
constexpr const char *BALANCE_ACCOUNT = "BalanceAccount";
constexpr const char *BALANCE_ACCOUNT_STRUCTURE = "BalanceAccountStructure";
} // namespace tags

bool IsAccountTag(const std::string &name);
bool IsLineTag(const std::string &name);

// Grouping elements that only wrap records (MasterFiles, Customers, ...).
bool IsSectionTag(const std::string &name);

// Element names that bucket the unknown-element census: sections and record elements.
bool IsStructuralTag(const std::string &name);

// Every element name the engine expects: structural tags, alias spellings and the
// standard's common leaf names. Anything else counts as schema drift.
const std::unordered_set<std::string> &KnownTags();

inline bool IsKnownTag(const std::string &name) {
	return KnownTags().count(name) > 0;
}

} // namespace saft
