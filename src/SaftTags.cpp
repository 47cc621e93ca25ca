#include "SaftTags.hpp"
#include "AliasTable.hpp"

namespace saft {

namespace {

const std::unordered_set<std::string> SECTION_TAGS = {
    "AuditFile",     "MasterFiles",      "GeneralLedgerAccounts", "TaxTable",        "Customers",
    "Suppliers",     "GeneralLedgerEntries", "SourceDocuments",   "SalesInvoices", "PurchaseInvoices"};

const std::unordered_set<std::string> RECORD_TAGS = {
    "Header",   "Account",     "GeneralLedgerAccount", "TaxTableEntry", "TaxCodeDetails", "Customer",
    "Supplier", "Journal",     "Transaction",          "Line",          "TransactionLine", "JournalLine",
    "Analysis", "Invoice",     "BalanceAccount",       "BalanceAccountStructure"};

// Common leaf and grouping names of the standard that no alias spells out.
const char *const STANDARD_TAGS[] = {
    "Company",          "Address",       "StreetName",        "Number",          "AdditionalAddressDetail",
    "Building",         "Region",        "Contact",           "ContactPerson",   "FirstName",
    "LastName",         "Fax",           "Website",           "TaxRegistration", "TaxAuthority",
    "TaxVerificationDate", "BankAccount", "IBANNumber",       "BankAccountNumber", "BankAccountName",
    "SortCode",         "BIC",           "SelectionCriteria", "HeaderComment",   "TaxAccountingBasis",
    "TaxEntity",        "UserID",        "NumberOfEntries",   "TotalDebit",      "TotalCredit",
    "TaxInformation",   "TaxBase",       "TaxBaseDescription", "TaxExemptionReason", "TaxDeclarationPeriod",
    "CustomerInfo",     "SupplierInfo",  "BillingAddress",    "ShipToAddress",   "ShipFromAddress",
    "DocumentTotals",   "Settlement",    "Payment",           "PaymentTerms",    "Quantity",
    "UnitPrice",        "UnitOfMeasure", "ProductCode",       "TaxPointDate",    "Type",
    "Amount",           "FiscalYear",    "Year",              "TransactionLine", "JournalLine"};

std::unordered_set<std::string> BuildKnownTags() {
	std::unordered_set<std::string> known = AliasTable::Default().AllSpellings();
	known.insert(SECTION_TAGS.begin(), SECTION_TAGS.end());
	known.insert(RECORD_TAGS.begin(), RECORD_TAGS.end());
	for (const char *tag : STANDARD_TAGS) {
		known.insert(tag);
	}
	return known;
}

} // namespace

bool IsAccountTag(const std::string &name) {
	return name == "Account" || name == "GeneralLedgerAccount";
}

bool IsLineTag(const std::string &name) {
	return name == "Line" || name == "TransactionLine" || name == "JournalLine";
}

bool IsSectionTag(const std::string &name) {
	return SECTION_TAGS.count(name) > 0;
}

bool IsStructuralTag(const std::string &name) {
	return SECTION_TAGS.count(name) > 0 || RECORD_TAGS.count(name) > 0;
}

const std::unordered_set<std::string> &KnownTags() {
	static const std::unordered_set<std::string> known = BuildKnownTags();
	return known;
}

} // namespace saft
