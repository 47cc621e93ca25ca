#include "ingest_saft.hpp"
#include "SaftErrors.hpp"
#include "TableSink.hpp"
#include "duckdb/common/file_system.hpp"
#include "duckdb/common/vector_size.hpp"

namespace duckdb {

unique_ptr<FunctionData> IngestSaftTableFunction::Bind(ClientContext &context, TableFunctionBindInput &input,
                                                       vector<duckdb::LogicalType> &return_types,
                                                       vector<std::string> &names) {
	if (input.inputs.size() != 2 || input.inputs[0].IsNull() || input.inputs[1].IsNull()) {
		throw InvalidInputException("saft_ingest: expected (path VARCHAR, output_dir VARCHAR)");
	}
	auto path = input.inputs[0].ToString();
	auto output_dir = input.inputs[1].ToString();

	FileSystem &fs = FileSystem::GetFileSystem(context);
	if (!fs.FileExists(path)) {
		throw IOException("File not found: " + path);
	}

	auto options = saft::IngestOptions::FromEnvironment();
	for (auto &kv : input.named_parameters) {
		if (kv.second.IsNull()) {
			continue;
		}
		if (kv.first == "progress_events") {
			auto events = kv.second.GetValue<int32_t>();
			if (events <= 0) {
				throw InvalidInputException("saft_ingest: progress_events must be positive");
			}
			options.progress_interval = static_cast<uint64_t>(events);
		} else if (kv.first == "write_raw") {
			options.write_raw_elements = kv.second.GetValue<bool>();
		} else if (kv.first == "force_fallback") {
			options.force_fallback = kv.second.GetValue<bool>();
		}
	}

	auto data = duckdb::make_uniq<Data>(path, output_dir, options);
	for (auto &name : data->names) {
		names.emplace_back(name);
	}
	for (auto &type : data->types) {
		return_types.emplace_back(type);
	}
	return data;
}

unique_ptr<GlobalTableFunctionState> IngestSaftTableFunction::InitGlobal(ClientContext &context,
                                                                         TableFunctionInitInput &input) {
	return duckdb::make_uniq<GlobalState>();
}

void IngestSaftTableFunction::Execute(ClientContext &context, TableFunctionInput &data_p, DataChunk &output) {
	auto &bind_data = data_p.bind_data->Cast<Data>();
	auto &state = data_p.global_state->Cast<GlobalState>();

	if (!state.done) {
		saft::CsvDirectoryTarget target(bind_data.output_dir);
		saft::InterruptFlagListener interrupt_listener(context.interrupted);
		saft::CancellationToken token;
		saft::RunOutcome outcome;
		try {
			outcome = saft::Ingest(bind_data.path, target, bind_data.options, &interrupt_listener, &token);
		} catch (const saft::SourceFormatError &e) {
			throw InvalidInputException("saft_ingest: %s", e.what());
		} catch (const saft::SaftError &e) {
			throw IOException("saft_ingest: %s", e.what());
		}
		if (context.interrupted) {
			throw InterruptException();
		}

		for (const auto &kv : outcome.row_counts) {
			state.rows.push_back({kv.first, target.PathFor(kv.first), static_cast<int64_t>(kv.second)});
		}
		auto add_findings = [&](saft::Entity entity, size_t count) {
			if (count > 0) {
				auto name = saft::EntityName(entity);
				state.rows.push_back({name, target.PathFor(name), static_cast<int64_t>(count)});
			}
		};
		add_findings(saft::Entity::MISSING_ACCOUNTS, outcome.findings.missing.size());
		add_findings(saft::Entity::UNBALANCED_VOUCHERS, outcome.findings.unbalanced.size());
		add_findings(saft::Entity::UNKNOWN_ELEMENTS, outcome.findings.unknown.size());

		state.parser = saft::PathUsedName(outcome.path_used);
		state.cancelled = outcome.cancelled;
		state.done = true;
	}

	idx_t count = 0;
	while (state.next_row < state.rows.size() && count < STANDARD_VECTOR_SIZE) {
		const auto &row = state.rows[state.next_row++];
		output.SetValue(0, count, Value(row.entity));
		output.SetValue(1, count, Value(row.file));
		output.SetValue(2, count, Value::BIGINT(row.row_count));
		output.SetValue(3, count, Value(state.parser));
		output.SetValue(4, count, Value::BOOLEAN(state.cancelled));
		count++;
	}
	output.SetCardinality(count);
}

TableFunction IngestSaftTableFunction::GetFunction() {
	auto tf = TableFunction("saft_ingest", {LogicalType::VARCHAR, LogicalType::VARCHAR}, Execute, Bind, InitGlobal);
	tf.named_parameters["progress_events"] = LogicalType::INTEGER;
	tf.named_parameters["write_raw"] = LogicalType::BOOLEAN;
	tf.named_parameters["force_fallback"] = LogicalType::BOOLEAN;
	return tf;
}

void IngestSaftTableFunction::Register(ExtensionLoader &loader) {
	loader.RegisterFunction(GetFunction());
}

} // namespace duckdb
