#pragma once

#include "FieldResolver.hpp"
#include "SaftRecord.hpp"
#include "XmlElement.hpp"

#include <optional>
#include <string>
#include <vector>

namespace saft {

// Digits only, leading zeros stripped; "0" when every digit is zero, "" when there are
// no digits. CanonicalAccountId(CanonicalAccountId(x)) == CanonicalAccountId(x).
std::string CanonicalAccountId(const std::string &raw);

// Turns captured record subtrees into typed records. Shared by the streaming and the
// fallback parser so both produce the same rows for the same element content.
class RecordResolver {
public:
	RecordResolver(const AliasTable &aliases, int max_depth);

	[[nodiscard]] HeaderRecord ResolveHeader(const XmlElement &header) const;

	// nullopt when the account has no usable AccountID.
	[[nodiscard]] std::optional<AccountRecord> ResolveAccount(const XmlElement &account) const;

	// One record per TaxCodeDetails child, or one for the entry itself when it has none.
	[[nodiscard]] std::vector<TaxTableRecord> ResolveTaxTableEntry(const XmlElement &entry) const;

	// nullopt when the party has no ID.
	[[nodiscard]] std::optional<PartyRecord> ResolveParty(const XmlElement &party, PartyKind kind) const;

	// transaction holds the transaction's non-line children only.
	[[nodiscard]] VoucherFields ResolveVoucher(const XmlElement &transaction) const;

	// nullopt when no amount encoding of the line yields a value; the line is rejected.
	[[nodiscard]] std::optional<LineRecord> ResolveLine(const XmlElement &line) const;

	// Analysis elements anywhere under the line, in document order.
	[[nodiscard]] std::vector<AnalysisRecord> ResolveAnalyses(const XmlElement &line,
	                                                          const std::string &record_id) const;

	[[nodiscard]] InvoiceRecord ResolveInvoice(const XmlElement &invoice, PartyKind kind) const;

	// journal holds the journal's non-transaction children only.
	[[nodiscard]] JournalRecord ResolveJournal(const XmlElement &journal) const;

	[[nodiscard]] const FieldResolver &Fields() const {
		return fields_;
	}

private:
	std::string Text(const XmlElement &root, const std::string &field) const;
	Decimal OptionalAmount(const XmlElement &root, const std::string &field) const;
	std::string OptionalTotal(const XmlElement &root, const std::string &field) const;
	ControlAccountLinkRecord ResolveControlLink(const XmlElement &structure, PartyKind kind,
	                                            const std::string &party_id) const;

	FieldResolver fields_;
};

} // namespace saft
