#pragma once
#include "Ingest.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/typedefs.hpp"
#include "duckdb/common/types.hpp"
#include "duckdb/function/function.hpp"
#include "duckdb/function/table_function.hpp"
#include "duckdb/main/client_context.hpp"
#include "duckdb/main/extension/extension_loader.hpp"
#include <vector>

namespace duckdb {

// saft_ingest(path, output_dir, progress_events := INTEGER, write_raw := BOOLEAN,
//             force_fallback := BOOLEAN)
//
// Runs one ingestion into <output_dir>/<entity>.csv and returns one row per table written.
class IngestSaftTableFunction {
public:
	struct Data : public TableFunctionData {
		std::string path;
		std::string output_dir;
		saft::IngestOptions options;

		std::vector<std::string> names;
		std::vector<LogicalType> types;

		Data(std::string path_p, std::string output_dir_p, saft::IngestOptions options_p)
		    : path(std::move(path_p)), output_dir(std::move(output_dir_p)), options(options_p),
		      names({"entity", "file", "row_count", "parser", "cancelled"}),
		      types({LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::BIGINT, LogicalType::VARCHAR,
		             LogicalType::BOOLEAN}) {
		}
	};

	struct Row {
		std::string entity;
		std::string file;
		int64_t row_count;
	};

	struct GlobalState : public GlobalTableFunctionState {
		bool done;
		std::vector<Row> rows;
		std::string parser;
		bool cancelled;
		size_t next_row;

		GlobalState() : done(false), cancelled(false), next_row(0) {
		}
	};

	static unique_ptr<FunctionData> Bind(ClientContext &context, TableFunctionBindInput &input,
	                                     vector<LogicalType> &return_types, vector<std::string> &names);

	static unique_ptr<GlobalTableFunctionState> InitGlobal(ClientContext &context, TableFunctionInitInput &input);

	static void Execute(ClientContext &context, TableFunctionInput &data_p, DataChunk &output);

	static TableFunction GetFunction();
	static void Register(ExtensionLoader &loader);
};

} // namespace duckdb
