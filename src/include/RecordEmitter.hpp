#pragma once

#include "Decimal.hpp"
#include "IngestOptions.hpp"
#include "SaftRecord.hpp"
#include "TableSink.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace saft {

struct PartyInfo {
	std::string name;
	std::string vat_number;
};

// Lookups built while one run proceeds and consulted for backfilling lines and invoices.
// Owned by the ingestion run and handed to its emitter; a forward reference simply finds
// nothing.
struct RunLookups {
	std::unordered_map<std::string, std::string> account_descriptions;
	std::unordered_map<std::string, PartyInfo> customers;
	std::unordered_map<std::string, PartyInfo> suppliers;
	// party ID -> canonical control account, first declared link wins
	std::unordered_map<std::string, std::string> customer_control;
	std::unordered_map<std::string, std::string> supplier_control;
};

struct UnbalancedVoucher {
	std::string voucher_id;
	std::string voucher_no;
	std::string journal_id;
	Decimal debit_total;
	Decimal credit_total;
};

// |debit - credit| <= 0.005
bool IsBalanced(const Decimal &debit_total, const Decimal &credit_total);

// Writes resolved records to one sink per entity and keeps the aggregates the integrity
// checker reads after the run. Both parsers drive it with the same call sequence:
//
//   OpenJournal, SetJournalContext (first transaction), OpenVoucher,
//   SetVoucherContext (first line), EmitLine..., CloseVoucher, CloseJournal
//
// Lines are written as soon as they arrive; only the voucher and journal totals are kept.
class RecordEmitter {
public:
	RecordEmitter(SinkTarget &target, RunLookups &lookups, const IngestOptions &options);

	RecordEmitter(const RecordEmitter &) = delete;
	RecordEmitter &operator=(const RecordEmitter &) = delete;

	void EmitHeader(const HeaderRecord &record);
	void EmitAccount(const AccountRecord &record);
	void EmitTaxTableEntry(const TaxTableRecord &record);
	void EmitParty(const PartyRecord &record);
	void EmitInvoice(const InvoiceRecord &record);

	void OpenJournal();
	void SetJournalContext(const JournalRecord &record);
	void CloseJournal(const JournalRecord &record);
	[[nodiscard]] bool JournalOpen() const {
		return journal_.has_value();
	}

	void OpenVoucher();
	// Identifiers copied onto the voucher's lines. A missing JournalID is taken from the
	// enclosing journal.
	void SetVoucherContext(const VoucherFields &fields);
	// Emits the line and its analysis rows under the open voucher. A line without a
	// resolvable amount (nullopt) is counted as rejected and nothing is written.
	// Throws std::logic_error when no voucher is open.
	bool EmitLine(const std::optional<LineRecord> &line, const std::vector<AnalysisRecord> &analyses);
	void CloseVoucher(const VoucherFields &fields);
	[[nodiscard]] bool VoucherOpen() const {
		return voucher_.has_value();
	}

	// Element census: counts tag under section when the tag is not a known one.
	void CountElement(const std::string &tag, const std::string &section);
	void EmitRawElement(const std::string &xpath, const std::string &tag, const std::string &text,
	                    const std::vector<std::pair<std::string, std::string>> &attributes);

	void Flush();
	void Close();

	[[nodiscard]] std::map<std::string, uint64_t> RowCounts() const;
	[[nodiscard]] uint64_t RejectedLines() const {
		return rejected_lines_;
	}

	// Aggregates for the integrity checker.
	[[nodiscard]] const std::map<std::string, uint64_t> &LineAccountReferences() const {
		return line_accounts_;
	}
	[[nodiscard]] const std::unordered_set<std::string> &DeclaredAccounts() const {
		return declared_accounts_;
	}
	[[nodiscard]] const std::vector<UnbalancedVoucher> &UnbalancedVouchers() const {
		return unbalanced_;
	}
	// (section, tag) -> count
	[[nodiscard]] const std::map<std::pair<std::string, std::string>, uint64_t> &UnknownElements() const {
		return unknown_elements_;
	}

private:
	struct OpenVoucherState {
		VoucherFields fields;
		Decimal debit;
		Decimal credit;
	};
	struct OpenJournalState {
		JournalRecord context;
		uint64_t voucher_count = 0;
		Decimal debit;
		Decimal credit;
	};

	TableSink &Sink(Entity entity);
	std::string LineAccount(const LineRecord &line) const;

	SinkTarget &target_;
	RunLookups &lookups_;
	const IngestOptions &options_;
	std::map<Entity, TableSink *> sinks_;

	std::optional<OpenVoucherState> voucher_;
	std::optional<OpenJournalState> journal_;

	std::map<std::string, uint64_t> line_accounts_;
	std::unordered_set<std::string> declared_accounts_;
	std::vector<UnbalancedVoucher> unbalanced_;
	std::map<std::pair<std::string, std::string>, uint64_t> unknown_elements_;
	uint64_t rejected_lines_ = 0;
};

} // namespace saft
