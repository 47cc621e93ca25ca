#pragma once

#include "duckdb.hpp"

namespace duckdb {

// read_saft_table(dir, entity)
//
// Read back one table written by saft_ingest. Every column comes back as VARCHAR so
// amounts keep their exact decimal text; cast where arithmetic is needed.
//
// Parameters:
// dir : a VARCHAR, the output_dir given to saft_ingest
// entity : a VARCHAR, the table name, e.g. 'transaction_line' or 'missing_accounts'
const std::string READ_SAFT_TABLE =
    "CREATE OR REPLACE MACRO read_saft_table(dir, entity) AS TABLE "
    "SELECT * FROM read_csv(dir || '/' || entity || '.csv', "
    "    header = true, "
    "    all_varchar = true, "
    "    delim = ',', "
    "    quote = '\"', "
    "    escape = '\"'); ";

class SaftMacros {
public:
	static void Register(ExtensionLoader &loader) {
		auto &instance = loader.GetDatabaseInstance();
		Connection con(instance);

		con.Query(READ_SAFT_TABLE);
	}
};

} // namespace duckdb
