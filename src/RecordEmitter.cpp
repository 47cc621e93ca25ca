#include "RecordEmitter.hpp"
#include "SaftLogging.hpp"
#include "SaftTags.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

namespace saft {

namespace {

const Decimal BALANCE_TOLERANCE(5, 3); // 0.005

} // namespace

bool IsBalanced(const Decimal &debit_total, const Decimal &credit_total) {
	return (debit_total - credit_total).Abs() <= BALANCE_TOLERANCE;
}

RecordEmitter::RecordEmitter(SinkTarget &target, RunLookups &lookups, const IngestOptions &options)
    : target_(target), lookups_(lookups), options_(options) {
	for (auto entity : RecordEntities()) {
		sinks_[entity] = &target_.Open(Schema(entity));
	}
	if (options_.write_raw_elements) {
		sinks_[Entity::RAW_ELEMENT] = &target_.Open(Schema(Entity::RAW_ELEMENT));
	}
}

TableSink &RecordEmitter::Sink(Entity entity) {
	auto it = sinks_.find(entity);
	if (it == sinks_.end()) {
		throw std::logic_error(std::string("RecordEmitter: table not opened: ") + EntityName(entity));
	}
	return *it->second;
}

void RecordEmitter::EmitHeader(const HeaderRecord &record) {
	Sink(Entity::HEADER).Append(record.values);
}

void RecordEmitter::EmitAccount(const AccountRecord &record) {
	declared_accounts_.insert(record.account_id);
	lookups_.account_descriptions[record.account_id] = record.description;
	Sink(Entity::ACCOUNT)
	    .Append({record.account_id, record.description, record.type, record.parent_account_id,
	             record.standard_account_id, record.grouping_category, record.grouping_code,
	             record.opening_debit.ToString(), record.opening_credit.ToString(), record.closing_debit.ToString(),
	             record.closing_credit.ToString()});
}

void RecordEmitter::EmitTaxTableEntry(const TaxTableRecord &record) {
	Sink(Entity::TAX_TABLE)
	    .Append({record.tax_code, record.standard_tax_code, record.tax_type, record.tax_percentage,
	             record.country_region, record.description});
}

void RecordEmitter::EmitParty(const PartyRecord &record) {
	bool customer = record.kind == PartyKind::CUSTOMER;
	auto &parties = customer ? lookups_.customers : lookups_.suppliers;
	auto &control = customer ? lookups_.customer_control : lookups_.supplier_control;

	parties[record.id] = PartyInfo {record.name, record.vat_number};
	Sink(customer ? Entity::CUSTOMER : Entity::SUPPLIER)
	    .Append({record.id, record.name, record.vat_number, record.country, record.city, record.postal_code,
	             record.email, record.telephone});

	auto &links = Sink(Entity::CONTROL_ACCOUNT_LINK);
	for (const auto &link : record.control_links) {
		if (!link.account_id.empty()) {
			control.emplace(record.id, link.account_id);
		}
		links.Append({PartyKindName(link.party_kind), link.party_id, link.account_id, link.opening_debit.ToString(),
		              link.opening_credit.ToString(), link.closing_debit.ToString(), link.closing_credit.ToString()});
	}
}

void RecordEmitter::EmitInvoice(const InvoiceRecord &record) {
	bool sales = record.kind == PartyKind::CUSTOMER;
	const auto &parties = sales ? lookups_.customers : lookups_.suppliers;

	std::string name = record.party_name;
	std::string vat;
	if (!record.party_id.empty()) {
		auto it = parties.find(record.party_id);
		if (it != parties.end()) {
			name = it->second.name;
			vat = it->second.vat_number;
		}
	}
	Sink(sales ? Entity::SALES_INVOICE : Entity::PURCHASE_INVOICE)
	    .Append({record.invoice_no, record.invoice_date, record.tax_point_date, record.gl_posting_date, record.party_id,
	             name, vat, record.currency_code, record.net_total, record.tax_payable, record.gross_total,
	             record.source_id, record.document_number, record.due_date});
}

void RecordEmitter::OpenJournal() {
	journal_.emplace();
}

void RecordEmitter::SetJournalContext(const JournalRecord &record) {
	if (journal_) {
		journal_->context = record;
	}
}

void RecordEmitter::CloseJournal(const JournalRecord &record) {
	if (!journal_) {
		return;
	}
	Sink(Entity::JOURNAL)
	    .Append({record.journal_id, record.description, record.type, std::to_string(journal_->voucher_count),
	             journal_->debit.ToString(), journal_->credit.ToString()});
	journal_.reset();
}

void RecordEmitter::OpenVoucher() {
	voucher_.emplace();
}

void RecordEmitter::SetVoucherContext(const VoucherFields &fields) {
	if (!voucher_) {
		throw std::logic_error("RecordEmitter: voucher context without an open voucher");
	}
	voucher_->fields = fields;
	if (voucher_->fields.journal_id.empty() && journal_) {
		voucher_->fields.journal_id = journal_->context.journal_id;
	}
}

std::string RecordEmitter::LineAccount(const LineRecord &line) const {
	if (!line.account_id.empty()) {
		return line.account_id;
	}
	if (!line.customer_id.empty()) {
		auto it = lookups_.customer_control.find(line.customer_id);
		if (it != lookups_.customer_control.end()) {
			return it->second;
		}
	}
	if (!line.supplier_id.empty()) {
		auto it = lookups_.supplier_control.find(line.supplier_id);
		if (it != lookups_.supplier_control.end()) {
			return it->second;
		}
	}
	return SENTINEL_ACCOUNT;
}

bool RecordEmitter::EmitLine(const std::optional<LineRecord> &line, const std::vector<AnalysisRecord> &analyses) {
	if (!voucher_) {
		throw std::logic_error("RecordEmitter: line without an open voucher");
	}
	if (!line) {
		rejected_lines_++;
		Logger()->warn("Line in voucher '{}' has no resolvable amount, rejected", voucher_->fields.voucher_id);
		return false;
	}

	const auto &v = voucher_->fields;
	auto account_id = LineAccount(*line);
	line_accounts_[account_id]++;

	std::string account_description;
	auto acc = lookups_.account_descriptions.find(account_id);
	if (acc != lookups_.account_descriptions.end()) {
		account_description = acc->second;
	}
	PartyInfo customer;
	if (!line->customer_id.empty()) {
		auto it = lookups_.customers.find(line->customer_id);
		if (it != lookups_.customers.end()) {
			customer = it->second;
		}
	}
	PartyInfo supplier;
	if (!line->supplier_id.empty()) {
		auto it = lookups_.suppliers.find(line->supplier_id);
		if (it != lookups_.suppliers.end()) {
			supplier = it->second;
		}
	}

	const auto &amount = line->amount;
	voucher_->debit += amount.debit;
	voucher_->credit += amount.credit;

	Sink(Entity::TRANSACTION_LINE)
	    .Append({line->record_id,
	             v.voucher_id,
	             v.voucher_no,
	             v.journal_id,
	             v.transaction_date,
	             v.posting_date,
	             v.period,
	             v.year,
	             line->system_id,
	             line->batch_id,
	             line->document_number,
	             line->source_document_id,
	             account_id,
	             account_description,
	             line->customer_id,
	             customer.name,
	             customer.vat_number,
	             line->supplier_id,
	             supplier.name,
	             supplier.vat_number,
	             line->description,
	             amount.debit.ToString(),
	             amount.credit.ToString(),
	             amount.amount.ToString(),
	             AmountEncodingName(amount.encoding),
	             line->currency_code.empty() ? v.currency_code : line->currency_code,
	             line->amount_currency,
	             line->exchange_rate,
	             line->tax_type,
	             line->tax_country_region,
	             line->tax_code,
	             line->tax_percentage,
	             line->debit_tax_amount.ToString(),
	             line->credit_tax_amount.ToString(),
	             line->tax_amount.ToString(),
	             "True",
	             "GL"});

	auto &analysis_sink = Sink(Entity::ANALYSIS_LINE);
	for (const auto &analysis : analyses) {
		analysis_sink.Append({analysis.record_id, analysis.type, analysis.id, analysis.amount.ToString()});
	}
	return true;
}

void RecordEmitter::CloseVoucher(const VoucherFields &fields) {
	if (!voucher_) {
		throw std::logic_error("RecordEmitter: voucher close without an open voucher");
	}
	auto row_fields = fields;
	if (row_fields.journal_id.empty() && journal_) {
		row_fields.journal_id = journal_->context.journal_id;
	}
	const auto &debit = voucher_->debit;
	const auto &credit = voucher_->credit;
	bool balanced = IsBalanced(debit, credit);

	Sink(Entity::VOUCHER)
	    .Append({row_fields.voucher_id, row_fields.voucher_no, row_fields.transaction_date, row_fields.posting_date,
	             row_fields.period, row_fields.year, row_fields.source_document_id, row_fields.journal_id,
	             row_fields.currency_code, row_fields.voucher_type, row_fields.description,
	             row_fields.modification_date, debit.ToString(), credit.ToString(), balanced ? "Y" : "N"});

	if (!balanced) {
		unbalanced_.push_back({row_fields.voucher_id, row_fields.voucher_no, row_fields.journal_id, debit, credit});
	}
	if (journal_) {
		journal_->voucher_count++;
		journal_->debit += debit;
		journal_->credit += credit;
	}
	voucher_.reset();
}

void RecordEmitter::CountElement(const std::string &tag, const std::string &section) {
	if (!IsKnownTag(tag)) {
		unknown_elements_[{section, tag}]++;
	}
}

void RecordEmitter::EmitRawElement(const std::string &xpath, const std::string &tag, const std::string &text,
                                   const std::vector<std::pair<std::string, std::string>> &attributes) {
	if (!options_.write_raw_elements) {
		return;
	}
	nlohmann::ordered_json attrs = nlohmann::ordered_json::object();
	for (const auto &attribute : attributes) {
		attrs[attribute.first] = attribute.second;
	}
	auto json = attrs.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
	std::string kept = text;
	if (kept.size() > options_.raw_text_limit) {
		// cut on a UTF-8 character boundary
		size_t cut = options_.raw_text_limit;
		while (cut > 0 && (static_cast<unsigned char>(kept[cut]) & 0xC0) == 0x80) {
			cut--;
		}
		kept.resize(cut);
	}
	Sink(Entity::RAW_ELEMENT).Append({xpath, tag, kept, json});
}

void RecordEmitter::Flush() {
	target_.FlushAll();
}

void RecordEmitter::Close() {
	target_.CloseAll();
}

std::map<std::string, uint64_t> RecordEmitter::RowCounts() const {
	std::map<std::string, uint64_t> counts;
	for (const auto &kv : sinks_) {
		counts[EntityName(kv.first)] = kv.second->RowCount();
	}
	return counts;
}

} // namespace saft
