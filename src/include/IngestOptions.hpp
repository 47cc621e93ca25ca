#pragma once

#include <cstddef>
#include <cstdint>

namespace saft {

class AliasTable;

struct IngestOptions {
	// Close events between progress ticks.
	uint64_t progress_interval = 50000;
	// Also write every element to the raw_element table.
	bool write_raw_elements = false;
	// Field resolver depth bound for fields without their own bound.
	int max_resolve_depth = 4;
	// Characters of element text kept per raw_element row.
	size_t raw_text_limit = 2000;
	bool enable_fallback = true;
	// Skip the streaming parser.
	bool force_fallback = false;
	// Spellings used by the field resolver; nullptr selects AliasTable::Default().
	const AliasTable *aliases = nullptr;

	[[nodiscard]] const AliasTable &Aliases() const;

	// Defaults with SAFT_PROGRESS_EVENTS and SAFT_WRITE_RAW applied. Unparseable values are
	// ignored with a warning.
	static IngestOptions FromEnvironment();
};

} // namespace saft
