#pragma once

#include "IngestOptions.hpp"
#include "Progress.hpp"
#include "RecordEmitter.hpp"
#include "SourceReader.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace saft {

// Outcome of the streaming parser. A FAILED attempt is answered by the fallback parser;
// the exception that caused it never leaves the streaming path.
struct StreamingAttempt {
	enum class Status { COMPLETED, CANCELLED, FAILED };

	Status status = Status::COMPLETED;
	std::string error;
	uint64_t events = 0;
	// Most captured element nodes alive at once, and the deepest open element chain.
	uint64_t peak_retained_nodes = 0;
	size_t peak_depth = 0;

	[[nodiscard]] bool Failed() const {
		return status == Status::FAILED;
	}
	[[nodiscard]] bool Cancelled() const {
		return status == Status::CANCELLED;
	}
};

const char *StreamingStatusName(StreamingAttempt::Status status);

// Single-pass SAX parser over an audit file. Only the open ancestor chain and the record
// subtree being captured are held in memory; every record subtree is released as soon
// as its element closes.
class SaftStreamReader {
public:
	static constexpr size_t MAX_DEPTH = 256;
	static constexpr size_t READ_CHUNK = 65536;

	SaftStreamReader(ByteSource &source, RecordEmitter &emitter, const IngestOptions &options,
	                 ProgressListener *listener, CancellationToken &token);
	~SaftStreamReader();

	SaftStreamReader(const SaftStreamReader &) = delete;
	SaftStreamReader &operator=(const SaftStreamReader &) = delete;

	// Parses the whole source. SourceFormatError from the source propagates; every other
	// failure is reported as a FAILED attempt.
	StreamingAttempt Run();

	[[nodiscard]] const PhaseStats &Phases() const;

private:
	struct Impl;
	std::unique_ptr<Impl> impl_;
};

} // namespace saft
