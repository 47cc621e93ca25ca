#include "RunMetadata.hpp"

#include <nlohmann/json.hpp>

namespace saft {

namespace {

using json = nlohmann::ordered_json;

#ifdef SAFT_VERSION
constexpr const char *PARSER_VERSION = SAFT_VERSION;
#else
constexpr const char *PARSER_VERSION = "unversioned";
#endif

std::string Dump(const json &doc) {
	return doc.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
}

// Tables holding rows after the run: every record table plus the non-empty findings.
json WrittenTables(const RunOutcome &outcome) {
	json tables = json::array();
	for (const auto &kv : outcome.row_counts) {
		tables.push_back(kv.first);
	}
	if (!outcome.findings.missing.empty()) {
		tables.push_back(EntityName(Entity::MISSING_ACCOUNTS));
	}
	if (!outcome.findings.unbalanced.empty()) {
		tables.push_back(EntityName(Entity::UNBALANCED_VOUCHERS));
	}
	if (!outcome.findings.unknown.empty()) {
		tables.push_back(EntityName(Entity::UNKNOWN_ELEMENTS));
	}
	return tables;
}

} // namespace

std::string ParserMetaJson(const RunOutcome &outcome, const std::string &source_path) {
	json meta;
	meta["parser"] = PathUsedName(outcome.path_used);
	meta["parser_version"] = PARSER_VERSION;
	meta["schema_version"] = kSchemaVersion;
	meta["source"] = source_path;
	meta["wrote_raw"] = outcome.wrote_raw;
	meta["cancelled"] = outcome.cancelled;
	if (!outcome.streaming_error.empty()) {
		meta["streaming_error"] = outcome.streaming_error;
	}
	meta["tables"] = WrittenTables(outcome);
	return Dump(meta);
}

std::string ParseStatsJson(const RunOutcome &outcome) {
	json stats;
	stats["duration_sec"] = outcome.elapsed_seconds;
	stats["events"] = outcome.events;
	stats["rate_events_per_sec"] =
	    outcome.elapsed_seconds > 0 ? static_cast<double>(outcome.events) / outcome.elapsed_seconds : 0.0;

	json counts = json::object();
	json times = json::object();
	for (size_t i = 0; i < static_cast<size_t>(Phase::PHASE_COUNT); i++) {
		auto phase = static_cast<Phase>(i);
		if (outcome.phases.Count(phase) == 0) {
			continue;
		}
		counts[PhaseName(phase)] = outcome.phases.Count(phase);
		times[PhaseName(phase)] = outcome.phases.Seconds(phase);
	}
	stats["counts"] = counts;
	stats["times_sec"] = times;

	json rows = json::object();
	for (const auto &kv : outcome.row_counts) {
		rows[kv.first] = kv.second;
	}
	stats["rows"] = rows;
	stats["rejected_lines"] = outcome.rejected_lines;
	stats["orphan_lines"] = outcome.orphan_lines;
	stats["peak_retained_nodes"] = outcome.peak_retained_nodes;

	json top = json::array();
	for (const auto &entry : outcome.phases.Slowest(ProgressSnapshot::TOP_PHASES)) {
		top.push_back(json::array({entry.first, entry.second}));
	}
	stats["top_times"] = top;
	return Dump(stats);
}

void WriteRunMetadata(const RunOutcome &outcome, const std::string &source_path, SinkTarget &target) {
	target.WriteDocument(PARSER_META_DOCUMENT, ParserMetaJson(outcome, source_path));
	target.WriteDocument(PARSE_STATS_DOCUMENT, ParseStatsJson(outcome));
}

} // namespace saft
