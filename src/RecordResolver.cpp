#include "RecordResolver.hpp"
#include "SaftLogging.hpp"
#include "SaftTags.hpp"

namespace saft {

namespace {

void CollectNamed(const XmlElement &node, const std::string &name, std::vector<const XmlElement *> &out) {
	for (const auto &child : node.children) {
		if (child->name == name) {
			out.push_back(child.get());
		}
		CollectNamed(*child, name, out);
	}
}

} // namespace

const char *PartyKindName(PartyKind kind) {
	return kind == PartyKind::CUSTOMER ? "Customer" : "Supplier";
}

const std::vector<std::string> &HeaderRecord::Fields() {
	static const std::vector<std::string> fields = {
	    "CompanyName",     "CompanyID",           "TaxRegistrationNumber", "FunctionalCurrency",
	    "DefaultCurrencyCode", "FileCreationDate", "AuditFileVersion",     "AuditFileCountry",
	    "SoftwareCompanyName", "SoftwareID",       "SoftwareVersion",      "SoftwareCertificateNumber",
	    "SelectionStart",  "SelectionEnd",        "PeriodStart",           "PeriodStartYear",
	    "PeriodEnd",       "PeriodEndYear",       "StartDate",             "EndDate"};
	return fields;
}

std::string CanonicalAccountId(const std::string &raw) {
	std::string digits;
	for (char ch : raw) {
		if (ch >= '0' && ch <= '9') {
			digits.push_back(ch);
		}
	}
	if (digits.empty()) {
		return digits;
	}
	size_t first = digits.find_first_not_of('0');
	return first == std::string::npos ? "0" : digits.substr(first);
}

RecordResolver::RecordResolver(const AliasTable &aliases, int max_depth) : fields_(aliases, max_depth) {
}

std::string RecordResolver::Text(const XmlElement &root, const std::string &field) const {
	return fields_.Resolve(root, field).value_or("");
}

Decimal RecordResolver::OptionalAmount(const XmlElement &root, const std::string &field) const {
	auto text = fields_.Resolve(root, field);
	if (!text) {
		return Decimal();
	}
	auto value = TryParseAmount(*text);
	if (!value) {
		Logger()->warn("Malformed {} '{}' in <{}>, read as 0", field, *text, root.name);
		return Decimal();
	}
	return *value;
}

std::string RecordResolver::OptionalTotal(const XmlElement &root, const std::string &field) const {
	auto text = fields_.Resolve(root, field);
	if (!text) {
		return "";
	}
	auto value = TryParseAmount(*text);
	if (!value) {
		Logger()->warn("Malformed {} '{}' in <{}>, read as 0", field, *text, root.name);
		return Decimal().ToString();
	}
	return value->ToString();
}

HeaderRecord RecordResolver::ResolveHeader(const XmlElement &header) const {
	HeaderRecord record;
	for (const auto &field : HeaderRecord::Fields()) {
		record.values.push_back(Text(header, field));
	}
	return record;
}

std::optional<AccountRecord> RecordResolver::ResolveAccount(const XmlElement &account) const {
	auto raw_id = fields_.Resolve(account, "AccountID");
	if (!raw_id) {
		return std::nullopt;
	}
	AccountRecord record;
	record.account_id = CanonicalAccountId(*raw_id);
	if (record.account_id.empty()) {
		Logger()->warn("Account '{}' has no digits in its ID, skipped", *raw_id);
		return std::nullopt;
	}
	record.description = Text(account, "AccountDescription");
	record.type = Text(account, "AccountType");
	record.parent_account_id = CanonicalAccountId(Text(account, "ParentAccountID"));
	record.standard_account_id = Text(account, "StandardAccountID");
	record.grouping_category = Text(account, "GroupingCategory");
	record.grouping_code = Text(account, "GroupingCode");
	record.opening_debit = OptionalAmount(account, "OpeningDebitBalance");
	record.opening_credit = OptionalAmount(account, "OpeningCreditBalance");
	record.closing_debit = OptionalAmount(account, "ClosingDebitBalance");
	record.closing_credit = OptionalAmount(account, "ClosingCreditBalance");
	return record;
}

std::vector<TaxTableRecord> RecordResolver::ResolveTaxTableEntry(const XmlElement &entry) const {
	auto entry_type = fields_.ResolveDirect(entry, "TaxType").value_or("");
	auto entry_description = fields_.ResolveDirect(entry, "TaxDescription").value_or("");

	auto make = [&](const XmlElement &node) {
		TaxTableRecord record;
		record.tax_code = Text(node, "TaxCode");
		record.standard_tax_code = Text(node, "StandardTaxCode");
		record.tax_type = fields_.Resolve(node, "TaxType").value_or(entry_type);
		record.tax_percentage = Text(node, "TaxPercentage");
		record.country_region = Text(node, "TaxCountryRegion");
		record.description = fields_.Resolve(node, "TaxDescription").value_or(entry_description);
		return record;
	};

	std::vector<TaxTableRecord> records;
	for (const auto &child : entry.children) {
		if (child->name == tags::TAX_CODE_DETAILS) {
			records.push_back(make(*child));
		}
	}
	if (records.empty()) {
		records.push_back(make(entry));
	}
	return records;
}

ControlAccountLinkRecord RecordResolver::ResolveControlLink(const XmlElement &structure, PartyKind kind,
                                                            const std::string &party_id) const {
	ControlAccountLinkRecord link;
	link.party_kind = kind;
	link.party_id = party_id;
	link.account_id = CanonicalAccountId(Text(structure, "AccountID"));
	link.opening_debit = OptionalAmount(structure, "OpeningDebitBalance");
	link.opening_credit = OptionalAmount(structure, "OpeningCreditBalance");
	link.closing_debit = OptionalAmount(structure, "ClosingDebitBalance");
	link.closing_credit = OptionalAmount(structure, "ClosingCreditBalance");
	return link;
}

std::optional<PartyRecord> RecordResolver::ResolveParty(const XmlElement &party, PartyKind kind) const {
	bool customer = kind == PartyKind::CUSTOMER;
	auto id = fields_.Resolve(party, customer ? "CustomerID" : "SupplierID");
	if (!id) {
		id = fields_.Resolve(party, "PartyID");
	}
	if (!id) {
		return std::nullopt;
	}

	PartyRecord record;
	record.kind = kind;
	record.id = *id;
	record.name = Text(party, customer ? "CustomerName" : "SupplierName");
	record.vat_number = Text(party, "VATNumber");
	record.country = Text(party, "Country");
	record.city = Text(party, "City");
	record.postal_code = Text(party, "PostalCode");
	record.email = Text(party, "Email");
	record.telephone = Text(party, "Telephone");

	std::vector<const XmlElement *> structures;
	CollectNamed(party, tags::BALANCE_ACCOUNT, structures);
	if (structures.empty()) {
		CollectNamed(party, tags::BALANCE_ACCOUNT_STRUCTURE, structures);
	}
	for (const auto *structure : structures) {
		record.control_links.push_back(ResolveControlLink(*structure, kind, record.id));
	}
	if (structures.empty()) {
		auto direct = fields_.Resolve(party, "PartyAccountID");
		if (direct) {
			ControlAccountLinkRecord link;
			link.party_kind = kind;
			link.party_id = record.id;
			link.account_id = CanonicalAccountId(*direct);
			record.control_links.push_back(std::move(link));
		}
	}
	return record;
}

VoucherFields RecordResolver::ResolveVoucher(const XmlElement &transaction) const {
	VoucherFields fields;
	fields.voucher_id = Text(transaction, "VoucherID");
	fields.voucher_no = Text(transaction, "VoucherNo");
	fields.transaction_date = Text(transaction, "TransactionDate");
	fields.posting_date = Text(transaction, "PostingDate");
	fields.period = Text(transaction, "Period");
	fields.year = Text(transaction, "PeriodYear");
	fields.source_document_id = Text(transaction, "SourceDocumentID");
	fields.journal_id = Text(transaction, "JournalID");
	fields.currency_code = Text(transaction, "CurrencyCode");
	fields.voucher_type = Text(transaction, "VoucherType");
	fields.description = Text(transaction, "VoucherDescription");
	fields.modification_date = Text(transaction, "ModificationDate");
	return fields;
}

std::optional<LineRecord> RecordResolver::ResolveLine(const XmlElement &line) const {
	SignedAmountInputs inputs;
	inputs.debit = fields_.Resolve(line, "DebitAmount");
	inputs.credit = fields_.Resolve(line, "CreditAmount");
	inputs.amount = fields_.Resolve(line, "Amount");
	inputs.indicator = fields_.Resolve(line, "DebitCreditIndicator");
	auto amount = DeriveSignedAmount(inputs);
	if (!amount) {
		return std::nullopt;
	}

	LineRecord record;
	record.amount = *amount;
	record.record_id = Text(line, "RecordID");
	record.system_id = Text(line, "SystemID");
	record.batch_id = Text(line, "BatchID");
	record.document_number = Text(line, "DocumentNumber");
	record.source_document_id = Text(line, "LineSourceDocumentID");
	record.account_id = CanonicalAccountId(Text(line, "AccountID"));
	record.customer_id = Text(line, "CustomerID");
	record.supplier_id = Text(line, "SupplierID");
	record.description = Text(line, "LineDescription");
	record.currency_code = Text(line, "CurrencyCode");
	record.amount_currency = Text(line, "AmountCurrency");
	record.exchange_rate = Text(line, "ExchangeRate");
	record.tax_type = Text(line, "TaxType");
	record.tax_country_region = Text(line, "TaxCountryRegion");
	record.tax_code = Text(line, "TaxCode");
	record.tax_percentage = Text(line, "TaxPercentage");
	record.debit_tax_amount = OptionalAmount(line, "DebitTaxAmount");
	record.credit_tax_amount = OptionalAmount(line, "CreditTaxAmount");
	if (fields_.Has(line, "TaxAmount")) {
		record.tax_amount = OptionalAmount(line, "TaxAmount");
	} else {
		record.tax_amount = record.debit_tax_amount - record.credit_tax_amount;
	}
	return record;
}

std::vector<AnalysisRecord> RecordResolver::ResolveAnalyses(const XmlElement &line,
                                                            const std::string &record_id) const {
	std::vector<const XmlElement *> nodes;
	CollectNamed(line, tags::ANALYSIS, nodes);

	std::vector<AnalysisRecord> records;
	records.reserve(nodes.size());
	for (const auto *node : nodes) {
		AnalysisRecord record;
		record.record_id = record_id;
		record.type = Text(*node, "AnalysisType");
		record.id = Text(*node, "AnalysisID");
		if (fields_.Has(*node, "AnalysisAmount")) {
			record.amount = OptionalAmount(*node, "AnalysisAmount");
		} else {
			record.amount = OptionalAmount(*node, "DebitAnalysisAmount") - OptionalAmount(*node, "CreditAnalysisAmount");
		}
		records.push_back(std::move(record));
	}
	return records;
}

InvoiceRecord RecordResolver::ResolveInvoice(const XmlElement &invoice, PartyKind kind) const {
	bool sales = kind == PartyKind::CUSTOMER;
	InvoiceRecord record;
	record.kind = kind;
	record.invoice_no = Text(invoice, "InvoiceNo");
	record.invoice_date = Text(invoice, "InvoiceDate");
	record.tax_point_date = Text(invoice, "TaxPointDate");
	record.gl_posting_date = Text(invoice, "GLPostingDate");
	record.party_id = Text(invoice, sales ? "CustomerID" : "SupplierID");
	record.party_name = Text(invoice, sales ? "InvoiceCustomerName" : "InvoiceSupplierName");
	record.currency_code = Text(invoice, "CurrencyCode");
	record.net_total = OptionalTotal(invoice, "NetTotal");
	record.tax_payable = OptionalTotal(invoice, "TaxPayable");
	record.gross_total = OptionalTotal(invoice, "GrossTotal");
	record.source_id = Text(invoice, "InvoiceSourceID");
	record.document_number = Text(invoice, "DocumentNumber");
	record.due_date = Text(invoice, "DueDate");
	return record;
}

JournalRecord RecordResolver::ResolveJournal(const XmlElement &journal) const {
	JournalRecord record;
	record.journal_id = Text(journal, "JournalID");
	record.description = Text(journal, "JournalDescription");
	record.type = Text(journal, "JournalType");
	return record;
}

} // namespace saft
