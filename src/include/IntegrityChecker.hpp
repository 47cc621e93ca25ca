#pragma once

#include "RecordEmitter.hpp"
#include "TableSink.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace saft {

struct MissingAccount {
	std::string account_id;
	uint64_t line_count = 0;
};

struct UnknownElement {
	std::string section;
	std::string tag;
	uint64_t count = 0;
};

struct IntegrityFindings {
	// In emission order.
	std::vector<UnbalancedVoucher> unbalanced;
	// Sorted by account ID; the UNDEFINED sentinel never appears here.
	std::vector<MissingAccount> missing;
	// Count descending, then section, then tag.
	std::vector<UnknownElement> unknown;

	[[nodiscard]] bool Clean() const {
		return unbalanced.empty() && missing.empty() && unknown.empty();
	}
};

// Post-run checks over the aggregates the emitter kept. Reads nothing back from the
// sinks, so it works the same after a cancelled run.
class IntegrityChecker {
public:
	static IntegrityFindings Check(const RecordEmitter &emitter);

	// Writes the non-empty finding tables; an empty category produces no table.
	static void WriteFindings(const IntegrityFindings &findings, SinkTarget &target);
};

} // namespace saft
