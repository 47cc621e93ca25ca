#include "AliasTable.hpp"

#include <stdexcept>

namespace saft {

namespace {

AliasEntry Text(std::vector<std::string> spellings) {
	return AliasEntry {std::move(spellings), std::nullopt, false};
}

AliasEntry Shallow(std::vector<std::string> spellings, int depth) {
	return AliasEntry {std::move(spellings), depth, false};
}

AliasEntry Money(std::vector<std::string> spellings, std::optional<int> depth = std::nullopt) {
	return AliasEntry {std::move(spellings), depth, true};
}

AliasTable BuildDefault() {
	AliasTable t;

	// Header
	t.Define("CompanyName", Text({"CompanyName", "Name"}));
	t.Define("CompanyID", Text({"CompanyID", "RegistrationNumber"}));
	t.Define("TaxRegistrationNumber", Text({"TaxRegistrationNumber", "VATNumber"}));
	t.Define("FunctionalCurrency", Text({"FunctionalCurrency", "DefaultCurrencyCode"}));
	t.Define("DefaultCurrencyCode", Text({"DefaultCurrencyCode", "CurrencyCode"}));
	t.Define("FileCreationDate", Text({"FileCreationDateTime", "AuditFileDateCreated", "FileCreationDate"}));
	t.Define("AuditFileVersion", Text({"AuditFileVersion"}));
	t.Define("AuditFileCountry", Text({"AuditFileCountry"}));
	t.Define("SoftwareCompanyName", Text({"SoftwareCompanyName"}));
	t.Define("SoftwareID", Text({"SoftwareID"}));
	t.Define("SoftwareVersion", Text({"SoftwareVersion", "ProductVersion"}));
	t.Define("SoftwareCertificateNumber", Text({"SoftwareCertificateNumber"}));
	t.Define("SelectionStart", Text({"SelectionStart", "SelectionStartDate"}));
	t.Define("SelectionEnd", Text({"SelectionEnd", "SelectionEndDate"}));
	t.Define("PeriodStart", Text({"PeriodStart"}));
	t.Define("PeriodStartYear", Text({"PeriodStartYear"}));
	t.Define("PeriodEnd", Text({"PeriodEnd"}));
	t.Define("PeriodEndYear", Text({"PeriodEndYear"}));
	t.Define("StartDate", Text({"StartDate", "FromDate"}));
	t.Define("EndDate", Text({"EndDate", "ToDate"}));

	// General ledger accounts
	t.Define("AccountID", Text({"AccountID", "GLAccountID"}));
	t.Define("AccountDescription", Text({"AccountDescription", "Description"}));
	t.Define("AccountType", Text({"AccountType"}));
	t.Define("ParentAccountID", Text({"ParentAccountID", "ParentID"}));
	t.Define("StandardAccountID", Text({"StandardAccountID"}));
	t.Define("GroupingCategory", Text({"GroupingCategory"}));
	t.Define("GroupingCode", Text({"GroupingCode", "GroupingCategoryCode"}));
	t.Define("OpeningDebitBalance", Money({"OpeningDebitBalance"}));
	t.Define("OpeningCreditBalance", Money({"OpeningCreditBalance"}));
	t.Define("ClosingDebitBalance", Money({"ClosingDebitBalance"}));
	t.Define("ClosingCreditBalance", Money({"ClosingCreditBalance"}));

	// Tax table
	t.Define("TaxType", Text({"TaxType"}));
	t.Define("TaxCode", Text({"TaxCode"}));
	t.Define("StandardTaxCode", Text({"StandardTaxCode"}));
	t.Define("TaxPercentage", Text({"TaxPercentage", "Rate"}));
	t.Define("TaxCountryRegion", Text({"TaxCountryRegion", "CountryRegion"}));
	t.Define("TaxDescription", Text({"Description", "TaxDescription"}));

	// Customers and suppliers
	t.Define("CustomerID", Text({"CustomerID", "Customer"}));
	t.Define("SupplierID", Text({"SupplierID", "Supplier", "VendorID", "Vendor"}));
	t.Define("PartyID", Shallow({"ID"}, 1));
	t.Define("CustomerName", Text({"CompanyName", "CustomerName", "Name"}));
	t.Define("SupplierName", Text({"CompanyName", "SupplierName", "Name"}));
	t.Define("VATNumber", Text({"VATNumber", "VATRegistrationNumber", "TaxRegistrationNumber"}));
	t.Define("Country", Text({"Country"}));
	t.Define("City", Text({"City"}));
	t.Define("PostalCode", Text({"PostalCode"}));
	t.Define("Email", Text({"Email"}));
	t.Define("Telephone", Text({"Telephone", "MobilePhone"}));
	t.Define("PartyAccountID", Shallow({"AccountID"}, 1));

	// Journals and vouchers
	t.Define("JournalID", Text({"JournalID", "Journal", "JournalNo", "JournalCode"}));
	t.Define("JournalDescription", Shallow({"Description"}, 1));
	t.Define("JournalType", Shallow({"Type", "JournalType"}, 1));
	t.Define("VoucherID", Text({"TransactionID", "TransactionNo", "VoucherID", "EntryID"}));
	t.Define("VoucherNo", Text({"VoucherNo", "TransactionNo", "TransactionID", "EntryNumber"}));
	t.Define("TransactionDate", Text({"TransactionDate", "EntryDate"}));
	t.Define("PostingDate", Text({"PostingDate", "GLPostingDate", "GLDate", "ValueDate"}));
	t.Define("Period", Text({"Period"}));
	t.Define("PeriodYear", Text({"PeriodYear", "FiscalYear", "Year"}));
	t.Define("SourceDocumentID", Text({"SourceDocumentID", "SourceID", "DocumentNumber", "DocumentNo", "ReferenceNumber"}));
	t.Define("CurrencyCode", Text({"CurrencyCode", "TransactionCurrency"}));
	t.Define("VoucherType", Text({"VoucherType", "TransactionType"}));
	t.Define("VoucherDescription", Text({"VoucherDescription", "Description"}));
	t.Define("ModificationDate", Text({"ModificationDate", "SystemEntryDate"}));

	// Transaction lines
	t.Define("RecordID", Text({"RecordID", "LineID"}));
	t.Define("SystemID", Text({"SystemID"}));
	t.Define("BatchID", Text({"BatchID"}));
	t.Define("DocumentNumber", Text({"DocumentNumber", "DocumentNo", "ReferenceNumber"}));
	t.Define("LineSourceDocumentID", Text({"SourceDocumentID", "SourceID"}));
	t.Define("LineDescription", Text({"Description", "Narrative", "LineDescription"}));
	t.Define("DebitAmount", Money({"DebitAmount"}));
	t.Define("CreditAmount", Money({"CreditAmount"}));
	t.Define("Amount", Money({"Amount", "LineAmount", "TransactionAmount"}, 1));
	t.Define("DebitCreditIndicator", Text({"DebitCreditIndicator", "DebitCreditInd", "DCIndicator"}));
	t.Define("AmountCurrency", Text({"AmountCurrency", "ForeignAmount", "CurrencyAmount"}));
	t.Define("ExchangeRate", Text({"ExchangeRate"}));
	t.Define("DebitTaxAmount", Money({"DebitTaxAmount"}));
	t.Define("CreditTaxAmount", Money({"CreditTaxAmount"}));
	t.Define("TaxAmount", Money({"TaxAmount"}));

	// Analysis
	t.Define("AnalysisType", Text({"AnalysisType"}));
	t.Define("AnalysisID", Text({"AnalysisID"}));
	t.Define("AnalysisAmount", Money({"AnalysisAmount"}));
	t.Define("DebitAnalysisAmount", Money({"DebitAnalysisAmount"}));
	t.Define("CreditAnalysisAmount", Money({"CreditAnalysisAmount"}));

	// Invoices
	t.Define("InvoiceNo", Text({"InvoiceNo", "InvoiceNumber"}));
	t.Define("InvoiceDate", Text({"InvoiceDate"}));
	t.Define("TaxPointDate", Text({"TaxPointDate"}));
	t.Define("GLPostingDate", Text({"GLPostingDate"}));
	t.Define("InvoiceCustomerName", Text({"CustomerName"}));
	t.Define("InvoiceSupplierName", Text({"SupplierName"}));
	t.Define("NetTotal", Money({"NetTotal", "DocumentNetTotal"}));
	t.Define("TaxPayable", Money({"TaxPayable", "DocumentTaxPayable"}));
	t.Define("GrossTotal", Money({"GrossTotal", "DocumentGrossTotal"}));
	t.Define("InvoiceSourceID", Text({"SourceID"}));
	t.Define("DueDate", Text({"DueDate"}));

	return t;
}

} // namespace

const AliasTable &AliasTable::Default() {
	static const AliasTable table = BuildDefault();
	return table;
}

void AliasTable::Define(const std::string &field, AliasEntry entry) {
	entries_[field] = std::move(entry);
}

void AliasTable::AddSpelling(const std::string &field, const std::string &spelling) {
	auto &entry = entries_[field];
	for (const auto &existing : entry.spellings) {
		if (existing == spelling) {
			return;
		}
	}
	entry.spellings.push_back(spelling);
}

const AliasEntry &AliasTable::Lookup(const std::string &field) const {
	auto it = entries_.find(field);
	if (it == entries_.end()) {
		throw std::out_of_range("AliasTable: unknown canonical field '" + field + "'");
	}
	return it->second;
}

bool AliasTable::Contains(const std::string &field) const {
	return entries_.find(field) != entries_.end();
}

std::unordered_set<std::string> AliasTable::AllSpellings() const {
	std::unordered_set<std::string> spellings;
	for (const auto &kv : entries_) {
		spellings.insert(kv.second.spellings.begin(), kv.second.spellings.end());
	}
	return spellings;
}

} // namespace saft
