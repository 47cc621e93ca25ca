#pragma once

#include "AmountNormalizer.hpp"
#include "Decimal.hpp"

#include <string>
#include <vector>

namespace saft {

// Placeholder account for lines whose account can be resolved neither from the line
// nor from the party's control account.
constexpr const char *SENTINEL_ACCOUNT = "UNDEFINED";

enum class PartyKind { CUSTOMER, SUPPLIER };

const char *PartyKindName(PartyKind kind);

// Header fields in output column order; values are aligned with HeaderRecord::Fields().
struct HeaderRecord {
	static const std::vector<std::string> &Fields();
	std::vector<std::string> values;
};

struct AccountRecord {
	std::string account_id; // canonical
	std::string description;
	std::string type;
	std::string parent_account_id; // canonical, may be empty
	std::string standard_account_id;
	std::string grouping_category;
	std::string grouping_code;
	Decimal opening_debit;
	Decimal opening_credit;
	Decimal closing_debit;
	Decimal closing_credit;
};

struct TaxTableRecord {
	std::string tax_code;
	std::string standard_tax_code;
	std::string tax_type;
	std::string tax_percentage;
	std::string country_region;
	std::string description;
};

struct ControlAccountLinkRecord {
	PartyKind party_kind = PartyKind::CUSTOMER;
	std::string party_id;
	std::string account_id; // canonical, empty when the structure names none
	Decimal opening_debit;
	Decimal opening_credit;
	Decimal closing_debit;
	Decimal closing_credit;
};

struct PartyRecord {
	PartyKind kind = PartyKind::CUSTOMER;
	std::string id;
	std::string name;
	std::string vat_number;
	std::string country;
	std::string city;
	std::string postal_code;
	std::string email;
	std::string telephone;
	std::vector<ControlAccountLinkRecord> control_links;
};

// Voucher identifiers, copied onto every line of the voucher.
struct VoucherFields {
	std::string voucher_id;
	std::string voucher_no;
	std::string transaction_date;
	std::string posting_date;
	std::string period;
	std::string year;
	std::string source_document_id;
	std::string journal_id;
	std::string currency_code;
	std::string voucher_type;
	std::string description;
	std::string modification_date;
};

// Fields resolved from a line element alone. Backfilled names and the voucher context
// are added by the emitter.
struct LineRecord {
	std::string record_id;
	std::string system_id;
	std::string batch_id;
	std::string document_number;
	std::string source_document_id;
	std::string account_id; // canonical, empty when absent
	std::string customer_id;
	std::string supplier_id;
	std::string description;
	SignedAmount amount;
	std::string currency_code;
	std::string amount_currency;
	std::string exchange_rate;
	std::string tax_type;
	std::string tax_country_region;
	std::string tax_code;
	std::string tax_percentage;
	Decimal debit_tax_amount;
	Decimal credit_tax_amount;
	Decimal tax_amount;
};

struct AnalysisRecord {
	std::string record_id; // of the owning line
	std::string type;
	std::string id;
	Decimal amount;
};

struct InvoiceRecord {
	PartyKind kind = PartyKind::CUSTOMER;
	std::string invoice_no;
	std::string invoice_date;
	std::string tax_point_date;
	std::string gl_posting_date;
	std::string party_id;
	std::string party_name; // as written on the invoice
	std::string currency_code;
	// Totals are rendered normalized, or empty when the document omits them.
	std::string net_total;
	std::string tax_payable;
	std::string gross_total;
	std::string source_id;
	std::string document_number;
	std::string due_date;
};

struct JournalRecord {
	std::string journal_id;
	std::string description;
	std::string type;
};

} // namespace saft
