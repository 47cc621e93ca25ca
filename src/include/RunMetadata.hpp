#pragma once

#include "Ingest.hpp"
#include "TableSink.hpp"

#include <string>

namespace saft {

constexpr const char *PARSER_META_DOCUMENT = "parser_meta.json";
constexpr const char *PARSE_STATS_DOCUMENT = "parse_stats.json";

// Parser name and version, schema version, source, raw-dump and cancellation flags, the
// streaming failure that caused a fallback and the tables the run wrote.
std::string ParserMetaJson(const RunOutcome &outcome, const std::string &source_path);

// Duration, event rate, per-phase counts and times, rows per table and the retained-node
// peak of the run.
std::string ParseStatsJson(const RunOutcome &outcome);

// Writes both documents to target.
void WriteRunMetadata(const RunOutcome &outcome, const std::string &source_path, SinkTarget &target);

} // namespace saft
