#pragma once

#include "IngestOptions.hpp"
#include "RecordEmitter.hpp"
#include "SourceReader.hpp"

#include <cstdint>

namespace saft {

struct FallbackStats {
	// GL lines found outside any Transaction, skipped.
	uint64_t orphan_lines = 0;
	// Transactions found inside another Transaction, emitted as vouchers of their own.
	uint64_t nested_vouchers = 0;
	uint64_t elements = 0;
};

// Full-document parser used when the streaming parser gives up. The whole document is
// loaded with libxml2 in recovery mode and walked in document order; record subtrees go
// through the same resolver and emitter calls as in the streaming parser, so a
// conforming document yields the same tables. No progress reporting, no cancellation.
class SaftFallbackParser {
public:
	SaftFallbackParser(ByteSource &source, RecordEmitter &emitter, const IngestOptions &options);

	// Throws FallbackParsingError; SourceFormatError from the source propagates unchanged.
	FallbackStats Run();

private:
	ByteSource &source_;
	RecordEmitter &emitter_;
	const IngestOptions &options_;
};

} // namespace saft
