#include "IntegrityChecker.hpp"
#include "SaftLogging.hpp"
#include "SaftRecord.hpp"

#include <algorithm>

namespace saft {

IntegrityFindings IntegrityChecker::Check(const RecordEmitter &emitter) {
	IntegrityFindings findings;
	findings.unbalanced = emitter.UnbalancedVouchers();

	const auto &declared = emitter.DeclaredAccounts();
	for (const auto &kv : emitter.LineAccountReferences()) {
		if (kv.first == SENTINEL_ACCOUNT || declared.count(kv.first) > 0) {
			continue;
		}
		findings.missing.push_back({kv.first, kv.second});
	}

	for (const auto &kv : emitter.UnknownElements()) {
		findings.unknown.push_back({kv.first.first, kv.first.second, kv.second});
	}
	std::sort(findings.unknown.begin(), findings.unknown.end(), [](const UnknownElement &a, const UnknownElement &b) {
		if (a.count != b.count) {
			return a.count > b.count;
		}
		if (a.section != b.section) {
			return a.section < b.section;
		}
		return a.tag < b.tag;
	});

	if (!findings.Clean()) {
		Logger()->info("Integrity: {} unbalanced vouchers, {} missing accounts, {} unknown element kinds",
		               findings.unbalanced.size(), findings.missing.size(), findings.unknown.size());
	}
	return findings;
}

void IntegrityChecker::WriteFindings(const IntegrityFindings &findings, SinkTarget &target) {
	if (!findings.missing.empty()) {
		auto &sink = target.Open(Schema(Entity::MISSING_ACCOUNTS));
		for (const auto &missing : findings.missing) {
			sink.Append({missing.account_id, std::to_string(missing.line_count)});
		}
	}
	if (!findings.unbalanced.empty()) {
		auto &sink = target.Open(Schema(Entity::UNBALANCED_VOUCHERS));
		for (const auto &v : findings.unbalanced) {
			sink.Append({v.voucher_id, v.voucher_no, v.journal_id, v.debit_total.ToString(), v.credit_total.ToString(),
			             (v.debit_total - v.credit_total).ToString()});
		}
	}
	if (!findings.unknown.empty()) {
		auto &sink = target.Open(Schema(Entity::UNKNOWN_ELEMENTS));
		for (const auto &u : findings.unknown) {
			sink.Append({u.section, u.tag, std::to_string(u.count)});
		}
	}
}

} // namespace saft
