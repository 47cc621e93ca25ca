#pragma once

#include "IngestOptions.hpp"
#include "IntegrityChecker.hpp"
#include "Progress.hpp"
#include "TableSink.hpp"

#include <cstdint>
#include <map>
#include <string>

namespace saft {

struct RunOutcome {
	enum class PathUsed { STREAMING, FALLBACK };

	PathUsed path_used = PathUsed::STREAMING;
	bool cancelled = false;
	// Why the streaming parser gave up; empty when it did not.
	std::string streaming_error;
	IntegrityFindings findings;
	// entity name -> rows, record tables only
	std::map<std::string, uint64_t> row_counts;
	uint64_t rejected_lines = 0;
	uint64_t orphan_lines = 0;
	double elapsed_seconds = 0.0;
	// Streaming close events, or elements walked by the fallback parser.
	uint64_t events = 0;
	// Streaming runs only.
	uint64_t peak_retained_nodes = 0;
	PhaseStats phases;
	bool wrote_raw = false;

	[[nodiscard]] bool StreamingUsed() const {
		return path_used == PathUsed::STREAMING;
	}
};

const char *PathUsedName(RunOutcome::PathUsed path);

// Ingests one audit file into target: streaming first, and on a streaming failure the
// target is discarded and the file is parsed again with the fallback parser. The
// integrity findings and the run metadata documents are written to target before it
// is closed.
//
// Throws SourceFormatError for unreadable containers and FallbackParsingError when the
// fallback fails too. token may be nullptr when the caller never cancels.
RunOutcome Ingest(const std::string &source_path, SinkTarget &target, const IngestOptions &options,
                  ProgressListener *listener = nullptr, CancellationToken *token = nullptr);

} // namespace saft
