#include "TableSink.hpp"
#include "SaftErrors.hpp"
#include "SaftLogging.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>

namespace saft {

namespace {

std::vector<TableSchema> BuildSchemas() {
	std::vector<TableSchema> schemas;
	schemas.push_back({Entity::HEADER,
	                   "header",
	                   {"CompanyName", "CompanyID", "TaxRegistrationNumber", "FunctionalCurrency",
	                    "DefaultCurrencyCode", "FileCreationDate", "AuditFileVersion", "AuditFileCountry",
	                    "SoftwareCompanyName", "SoftwareID", "SoftwareVersion", "SoftwareCertificateNumber",
	                    "SelectionStart", "SelectionEnd", "PeriodStart", "PeriodStartYear", "PeriodEnd",
	                    "PeriodEndYear", "StartDate", "EndDate"}});
	schemas.push_back({Entity::ACCOUNT,
	                   "account",
	                   {"AccountID", "AccountDescription", "AccountType", "ParentAccountID", "StandardAccountID",
	                    "GroupingCategory", "GroupingCode", "OpeningDebit", "OpeningCredit", "ClosingDebit",
	                    "ClosingCredit"}});
	schemas.push_back({Entity::TAX_TABLE,
	                   "tax_table",
	                   {"TaxCode", "StandardTaxCode", "TaxType", "TaxPercentage", "TaxCountryRegion", "Description"}});
	schemas.push_back({Entity::CUSTOMER,
	                   "customer",
	                   {"CustomerID", "Name", "VATNumber", "Country", "City", "PostalCode", "Email", "Telephone"}});
	schemas.push_back({Entity::SUPPLIER,
	                   "supplier",
	                   {"SupplierID", "Name", "VATNumber", "Country", "City", "PostalCode", "Email", "Telephone"}});
	schemas.push_back({Entity::CONTROL_ACCOUNT_LINK,
	                   "control_account_link",
	                   {"PartyType", "PartyID", "AccountID", "OpeningDebit", "OpeningCredit", "ClosingDebit",
	                    "ClosingCredit"}});
	schemas.push_back({Entity::JOURNAL,
	                   "journal",
	                   {"JournalID", "Description", "Type", "VoucherCount", "DebitTotal", "CreditTotal"}});
	schemas.push_back({Entity::VOUCHER,
	                   "voucher",
	                   {"VoucherID", "VoucherNo", "TransactionDate", "PostingDate", "Period", "Year",
	                    "SourceDocumentID", "JournalID", "CurrencyCode", "VoucherType", "VoucherDescription",
	                    "ModificationDate", "DebitTotal", "CreditTotal", "Balanced"}});
	schemas.push_back({Entity::TRANSACTION_LINE,
	                   "transaction_line",
	                   {"RecordID",          "VoucherID",       "VoucherNo",         "JournalID",
	                    "TransactionDate",   "PostingDate",     "Period",            "Year",
	                    "SystemID",          "BatchID",         "DocumentNumber",    "SourceDocumentID",
	                    "AccountID",         "AccountDescription", "CustomerID",     "CustomerName",
	                    "CustomerVATNumber", "SupplierID",      "SupplierName",      "SupplierVATNumber",
	                    "Description",       "Debit",           "Credit",            "Amount",
	                    "AmountEncoding",    "CurrencyCode",    "AmountCurrency",    "ExchangeRate",
	                    "TaxType",           "TaxCountryRegion", "TaxCode",          "TaxPercentage",
	                    "DebitTaxAmount",    "CreditTaxAmount", "TaxAmount",         "IsGL",
	                    "SourceType"}});
	schemas.push_back({Entity::ANALYSIS_LINE, "analysis_line", {"RecordID", "Type", "ID", "Amount"}});
	schemas.push_back({Entity::SALES_INVOICE,
	                   "sales_invoice",
	                   {"InvoiceNo", "InvoiceDate", "TaxPointDate", "GLPostingDate", "CustomerID", "CustomerName",
	                    "CustomerVATNumber", "CurrencyCode", "NetTotal", "TaxPayable", "GrossTotal", "SourceID",
	                    "DocumentNumber", "DueDate"}});
	schemas.push_back({Entity::PURCHASE_INVOICE,
	                   "purchase_invoice",
	                   {"InvoiceNo", "InvoiceDate", "TaxPointDate", "GLPostingDate", "SupplierID", "SupplierName",
	                    "SupplierVATNumber", "CurrencyCode", "NetTotal", "TaxPayable", "GrossTotal", "SourceID",
	                    "DocumentNumber", "DueDate"}});
	schemas.push_back({Entity::RAW_ELEMENT, "raw_element", {"XPath", "Tag", "Text", "Attributes"}});
	schemas.push_back({Entity::MISSING_ACCOUNTS, "missing_accounts", {"AccountID", "LineCount"}});
	schemas.push_back({Entity::UNBALANCED_VOUCHERS,
	                   "unbalanced_vouchers",
	                   {"VoucherID", "VoucherNo", "JournalID", "DebitTotal", "CreditTotal", "Difference"}});
	schemas.push_back({Entity::UNKNOWN_ELEMENTS, "unknown_elements", {"Section", "Tag", "Count"}});
	return schemas;
}

const std::vector<TableSchema> &AllSchemas() {
	static const std::vector<TableSchema> schemas = BuildSchemas();
	return schemas;
}

class CsvTableSink : public TableSink {
public:
	CsvTableSink(const TableSchema &schema, const std::string &path) : TableSink(schema), path_(path) {
		file_ = std::fopen(path.c_str(), "wb");
		if (!file_) {
			throw SaftError("CsvDirectoryTarget: cannot create " + path);
		}
		buffer_.reserve(WRITE_BUFFER);
		AppendRow(schema.columns);
		Flush();
	}

	~CsvTableSink() override {
		if (file_) {
			// Destruction without Close() only happens on unwinding; keep whole rows written.
			if (!buffer_.empty()) {
				std::fwrite(buffer_.data(), 1, buffer_.size(), file_);
			}
			std::fclose(file_);
		}
	}

	void Flush() override {
		if (!file_ || buffer_.empty()) {
			return;
		}
		if (std::fwrite(buffer_.data(), 1, buffer_.size(), file_) != buffer_.size() || std::fflush(file_) != 0) {
			throw SaftError("CsvDirectoryTarget: write failed for " + path_);
		}
		buffer_.clear();
	}

	void Close() override {
		if (!file_) {
			return;
		}
		Flush();
		int rc = std::fclose(file_);
		file_ = nullptr;
		if (rc != 0) {
			throw SaftError("CsvDirectoryTarget: close failed for " + path_);
		}
	}

	const std::string &Path() const {
		return path_;
	}

protected:
	void Write(const std::vector<std::string> &row) override {
		if (!file_) {
			throw SaftError("CsvDirectoryTarget: write to closed table " + path_);
		}
		AppendRow(row);
		if (buffer_.size() >= WRITE_BUFFER) {
			Flush();
		}
	}

private:
	static constexpr size_t WRITE_BUFFER = CsvDirectoryTarget::WRITE_BUFFER_SIZE;

	void AppendRow(const std::vector<std::string> &row) {
		for (size_t i = 0; i < row.size(); i++) {
			if (i > 0) {
				buffer_.push_back(',');
			}
			buffer_ += CsvEscape(row[i]);
		}
		buffer_ += "\r\n";
	}

	std::string path_;
	FILE *file_ = nullptr;
	std::string buffer_;
};

class MemoryTableSink : public TableSink {
public:
	explicit MemoryTableSink(const TableSchema &schema) : TableSink(schema) {
	}

	void Flush() override {
	}
	void Close() override {
	}

	const MemoryTarget::Rows &Rows() const {
		return rows_;
	}

protected:
	void Write(const std::vector<std::string> &row) override {
		rows_.push_back(row);
	}

private:
	MemoryTarget::Rows rows_;
};

} // namespace

const TableSchema &Schema(Entity entity) {
	for (const auto &schema : AllSchemas()) {
		if (schema.entity == entity) {
			return schema;
		}
	}
	throw std::out_of_range("TableSchema: no schema for entity");
}

const char *EntityName(Entity entity) {
	return Schema(entity).name.c_str();
}

const std::vector<Entity> &RecordEntities() {
	static const std::vector<Entity> entities = {
	    Entity::HEADER,        Entity::ACCOUNT,          Entity::TAX_TABLE, Entity::CUSTOMER,
	    Entity::SUPPLIER,      Entity::CONTROL_ACCOUNT_LINK, Entity::JOURNAL, Entity::VOUCHER,
	    Entity::TRANSACTION_LINE, Entity::ANALYSIS_LINE,  Entity::SALES_INVOICE, Entity::PURCHASE_INVOICE};
	return entities;
}

void TableSink::Append(const std::vector<std::string> &row) {
	if (row.size() != schema_.columns.size()) {
		throw std::invalid_argument("TableSink: row width " + std::to_string(row.size()) + " does not match " +
		                            std::to_string(schema_.columns.size()) + " columns of " + schema_.name);
	}
	Write(row);
	row_count_++;
}

std::string CsvEscape(const std::string &field) {
	if (field.find_first_of(",\"\r\n") == std::string::npos) {
		return field;
	}
	std::string out;
	out.reserve(field.size() + 2);
	out.push_back('"');
	for (char ch : field) {
		if (ch == '"') {
			out.push_back('"');
		}
		out.push_back(ch);
	}
	out.push_back('"');
	return out;
}

CsvDirectoryTarget::CsvDirectoryTarget(std::string directory) : directory_(std::move(directory)) {
	std::error_code ec;
	std::filesystem::create_directories(directory_, ec);
	if (ec) {
		throw SaftError("CsvDirectoryTarget: cannot create directory " + directory_ + ": " + ec.message());
	}
}

CsvDirectoryTarget::~CsvDirectoryTarget() = default;

std::string CsvDirectoryTarget::PathFor(const std::string &entity_name) const {
	return (std::filesystem::path(directory_) / (entity_name + ".csv")).string();
}

TableSink &CsvDirectoryTarget::Open(const TableSchema &schema) {
	auto it = sinks_.find(schema.entity);
	if (it != sinks_.end()) {
		return *it->second;
	}
	auto path = PathFor(schema.name);
	Logger()->debug("Opening table {} at {}", schema.name, path);
	auto sink = std::make_unique<CsvTableSink>(schema, path);
	auto &ref = *sink;
	sinks_.emplace(schema.entity, std::move(sink));
	return ref;
}

void CsvDirectoryTarget::Discard() {
	std::vector<std::string> paths;
	for (auto &kv : sinks_) {
		paths.push_back(static_cast<CsvTableSink &>(*kv.second).Path());
	}
	// the sinks' destructors close the files before they are removed
	sinks_.clear();
	paths.insert(paths.end(), documents_.begin(), documents_.end());
	documents_.clear();
	for (const auto &path : paths) {
		std::error_code ec;
		std::filesystem::remove(path, ec);
		if (ec) {
			Logger()->warn("Could not remove discarded table {}: {}", path, ec.message());
		}
	}
}

void CsvDirectoryTarget::WriteDocument(const std::string &name, const std::string &content) {
	auto path = (std::filesystem::path(directory_) / name).string();
	FILE *file = std::fopen(path.c_str(), "wb");
	if (!file) {
		throw SaftError("CsvDirectoryTarget: cannot create " + path);
	}
	size_t written = std::fwrite(content.data(), 1, content.size(), file);
	int rc = std::fclose(file);
	if (written != content.size() || rc != 0) {
		throw SaftError("CsvDirectoryTarget: write failed for " + path);
	}
	if (std::find(documents_.begin(), documents_.end(), path) == documents_.end()) {
		documents_.push_back(path);
	}
}

void CsvDirectoryTarget::FlushAll() {
	for (auto &kv : sinks_) {
		kv.second->Flush();
	}
}

void CsvDirectoryTarget::CloseAll() {
	for (auto &kv : sinks_) {
		kv.second->Close();
	}
}

TableSink &MemoryTarget::Open(const TableSchema &schema) {
	auto it = sinks_.find(schema.entity);
	if (it != sinks_.end()) {
		return *it->second;
	}
	auto sink = std::make_unique<MemoryTableSink>(schema);
	auto &ref = *sink;
	sinks_.emplace(schema.entity, std::move(sink));
	return ref;
}

void MemoryTarget::Discard() {
	sinks_.clear();
	documents_.clear();
}

bool MemoryTarget::HasTable(Entity entity) const {
	return sinks_.find(entity) != sinks_.end();
}

const MemoryTarget::Rows &MemoryTarget::Table(Entity entity) const {
	auto it = sinks_.find(entity);
	if (it == sinks_.end()) {
		throw std::out_of_range(std::string("MemoryTarget: table not opened: ") + EntityName(entity));
	}
	return static_cast<const MemoryTableSink &>(*it->second).Rows();
}

const std::string &MemoryTarget::Cell(Entity entity, size_t row, const std::string &column) const {
	const auto &columns = Schema(entity).columns;
	auto col = std::find(columns.begin(), columns.end(), column);
	if (col == columns.end()) {
		throw std::out_of_range("MemoryTarget: no column " + column + " in " + EntityName(entity));
	}
	return Table(entity).at(row).at(static_cast<size_t>(col - columns.begin()));
}

} // namespace saft
