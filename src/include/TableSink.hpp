#pragma once

#include <cstdint>
#include <cstdio>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace saft {

// Bumped whenever a column list below changes.
constexpr int kSchemaVersion = 1;

enum class Entity {
	HEADER,
	ACCOUNT,
	TAX_TABLE,
	CUSTOMER,
	SUPPLIER,
	CONTROL_ACCOUNT_LINK,
	JOURNAL,
	VOUCHER,
	TRANSACTION_LINE,
	ANALYSIS_LINE,
	SALES_INVOICE,
	PURCHASE_INVOICE,
	RAW_ELEMENT,
	// diagnostics
	MISSING_ACCOUNTS,
	UNBALANCED_VOUCHERS,
	UNKNOWN_ELEMENTS
};

struct TableSchema {
	Entity entity;
	std::string name;
	std::vector<std::string> columns;
};

const TableSchema &Schema(Entity entity);
const char *EntityName(Entity entity);

// Record tables opened by every run (the raw dump only on request).
const std::vector<Entity> &RecordEntities();

// Append-only table. Every appended row is complete; a sink never exposes a partial row.
class TableSink {
public:
	explicit TableSink(const TableSchema &schema) : schema_(schema) {
	}
	virtual ~TableSink() = default;

	TableSink(const TableSink &) = delete;
	TableSink &operator=(const TableSink &) = delete;

	// Throws std::invalid_argument when the row does not match the schema width.
	void Append(const std::vector<std::string> &row);
	virtual void Flush() = 0;
	virtual void Close() = 0;

	[[nodiscard]] const TableSchema &Schema() const {
		return schema_;
	}
	[[nodiscard]] uint64_t RowCount() const {
		return row_count_;
	}

protected:
	virtual void Write(const std::vector<std::string> &row) = 0;

private:
	const TableSchema &schema_;
	uint64_t row_count_ = 0;
};

// Where one run's tables go. Sinks are owned by the target and live until Discard().
class SinkTarget {
public:
	virtual ~SinkTarget() = default;

	// Opens (creates or truncates) the table for schema. Opening an entity twice returns
	// the same sink.
	virtual TableSink &Open(const TableSchema &schema) = 0;

	// Drops every table opened so far, including what was written to them.
	virtual void Discard() = 0;

	// Stores a whole side document (run metadata) under name, replacing an earlier one.
	virtual void WriteDocument(const std::string &name, const std::string &content) = 0;

	virtual void FlushAll() = 0;
	virtual void CloseAll() = 0;
};

// RFC 4180 field quoting: fields containing a comma, quote, CR or LF are quoted and
// embedded quotes doubled.
std::string CsvEscape(const std::string &field);

// One UTF-8 CSV file per table, "<directory>/<entity>.csv", with a header row.
// Rows are buffered whole, so the file only ever ends at a row boundary.
class CsvDirectoryTarget : public SinkTarget {
public:
	static constexpr size_t WRITE_BUFFER_SIZE = 1 << 20;

	explicit CsvDirectoryTarget(std::string directory);
	~CsvDirectoryTarget() override;

	TableSink &Open(const TableSchema &schema) override;
	void Discard() override;
	// "<directory>/<name>"
	void WriteDocument(const std::string &name, const std::string &content) override;
	void FlushAll() override;
	void CloseAll() override;

	[[nodiscard]] const std::string &Directory() const {
		return directory_;
	}
	[[nodiscard]] std::string PathFor(const std::string &entity_name) const;

private:
	std::string directory_;
	std::map<Entity, std::unique_ptr<TableSink>> sinks_;
	std::vector<std::string> documents_;
};

// In-memory tables.
class MemoryTarget : public SinkTarget {
public:
	using Rows = std::vector<std::vector<std::string>>;

	TableSink &Open(const TableSchema &schema) override;
	void Discard() override;
	void WriteDocument(const std::string &name, const std::string &content) override {
		documents_[name] = content;
	}
	void FlushAll() override {
	}
	void CloseAll() override {
	}

	[[nodiscard]] bool HasTable(Entity entity) const;
	// Throws std::out_of_range when the table was never opened.
	[[nodiscard]] const Rows &Table(Entity entity) const;
	// Value of column in row index; throws std::out_of_range.
	[[nodiscard]] const std::string &Cell(Entity entity, size_t row, const std::string &column) const;

	// Throws std::out_of_range when no document of that name was written.
	[[nodiscard]] const std::string &Document(const std::string &name) const {
		return documents_.at(name);
	}

private:
	std::map<Entity, std::unique_ptr<TableSink>> sinks_;
	std::map<std::string, std::string> documents_;
};

} // namespace saft
