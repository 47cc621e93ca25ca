#include "Ingest.hpp"
#include "RecordEmitter.hpp"
#include "RunMetadata.hpp"
#include "SaftErrors.hpp"
#include "SaftFallbackParser.hpp"
#include "SaftLogging.hpp"
#include "SaftStreamReader.hpp"
#include "SourceReader.hpp"

#include <chrono>
#include <utility>

namespace saft {

namespace {

void Finish(RunOutcome &outcome, RecordEmitter &emitter, SinkTarget &target) {
	outcome.row_counts = emitter.RowCounts();
	outcome.rejected_lines = emitter.RejectedLines();
	outcome.findings = IntegrityChecker::Check(emitter);
	IntegrityChecker::WriteFindings(outcome.findings, target);
	target.CloseAll();
}

void Conclude(RunOutcome &outcome, const std::string &source_path, SinkTarget &target, double elapsed) {
	outcome.elapsed_seconds = elapsed;
	WriteRunMetadata(outcome, source_path, target);
	Logger()->info("Finished {} with the {} parser in {:.2f}s{}", source_path, PathUsedName(outcome.path_used),
	               outcome.elapsed_seconds, outcome.cancelled ? " (cancelled)" : "");
}

RunOutcome RunFallback(const std::string &source_path, SinkTarget &target, const IngestOptions &options,
                       RunOutcome outcome) {
	RunLookups lookups;
	auto source = SourceReader::Open(source_path);
	RecordEmitter emitter(target, lookups, options);
	SaftFallbackParser parser(*source, emitter, options);
	auto stats = parser.Run();
	source->Close();

	outcome.path_used = RunOutcome::PathUsed::FALLBACK;
	outcome.orphan_lines = stats.orphan_lines;
	outcome.events = stats.elements;
	outcome.peak_retained_nodes = 0;
	outcome.phases = PhaseStats();
	Finish(outcome, emitter, target);
	return outcome;
}

} // namespace

const char *PathUsedName(RunOutcome::PathUsed path) {
	switch (path) {
	case RunOutcome::PathUsed::STREAMING:
		return "streaming";
	case RunOutcome::PathUsed::FALLBACK:
		return "fallback";
	}
	return "unknown";
}

RunOutcome Ingest(const std::string &source_path, SinkTarget &target, const IngestOptions &options,
                  ProgressListener *listener, CancellationToken *token) {
	auto started = std::chrono::steady_clock::now();
	auto elapsed = [&started]() {
		std::chrono::duration<double> seconds = std::chrono::steady_clock::now() - started;
		return seconds.count();
	};
	Logger()->info("Ingesting {}", source_path);

	RunOutcome outcome;
	outcome.wrote_raw = options.write_raw_elements;
	if (options.force_fallback) {
		outcome = RunFallback(source_path, target, options, std::move(outcome));
		Conclude(outcome, source_path, target, elapsed());
		return outcome;
	}

	CancellationToken own_token;
	auto &run_token = token ? *token : own_token;

	StreamingAttempt attempt;
	{
		RunLookups lookups;
		auto source = SourceReader::Open(source_path);
		RecordEmitter emitter(target, lookups, options);
		SaftStreamReader reader(*source, emitter, options, listener, run_token);
		attempt = reader.Run();
		source->Close();

		if (!attempt.Failed()) {
			outcome.path_used = RunOutcome::PathUsed::STREAMING;
			outcome.cancelled = attempt.Cancelled();
			outcome.events = attempt.events;
			outcome.peak_retained_nodes = attempt.peak_retained_nodes;
			outcome.phases = reader.Phases();
			Finish(outcome, emitter, target);
		}
	}

	if (attempt.Failed()) {
		outcome.streaming_error = attempt.error;
		if (!options.enable_fallback) {
			Logger()->error("Streaming parser failed on {}: {}", source_path, attempt.error);
			throw FallbackParsingError("Ingest: streaming parser failed and fallback is disabled: " + attempt.error);
		}
		Logger()->warn("Streaming parser failed on {} after {} events, switching to the fallback parser: {}",
		               source_path, attempt.events, attempt.error);
		target.Discard();
		outcome = RunFallback(source_path, target, options, std::move(outcome));
	}

	Conclude(outcome, source_path, target, elapsed());
	return outcome;
}

} // namespace saft
