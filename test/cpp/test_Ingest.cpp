#include "saft_test_helpers.hpp"

#include <Ingest.hpp>
#include <RunMetadata.hpp>
#include <SaftErrors.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <nlohmann/json.hpp>

using saft::CsvDirectoryTarget;
using saft::Entity;
using saft::IngestOptions;
using saft::MemoryTarget;
using saft::ProgressListener;
using saft::ProgressSnapshot;
using saft::RunOutcome;
using Catch::Matchers::ContainsSubstring;

namespace {

class StopAfter : public ProgressListener {
public:
	explicit StopAfter(size_t ticks) : ticks_(ticks) {
	}
	bool OnProgress(const ProgressSnapshot &) override {
		return ++seen < ticks_;
	}
	size_t seen = 0;

private:
	size_t ticks_;
};

size_t count_lines(const std::string &content) {
	size_t n = 0;
	for (size_t pos = content.find("\r\n"); pos != std::string::npos; pos = content.find("\r\n", pos + 2)) {
		n++;
	}
	return n;
}

} // namespace

TEST_CASE("Balanced voucher with an undeclared account", "[ingest]") {
	MemoryTarget target;
	auto outcome = saft::Ingest(SAFT_DATA_DIR + "minimal.xml", target, IngestOptions());

	CHECK(outcome.StreamingUsed());
	CHECK_FALSE(outcome.cancelled);
	CHECK(outcome.streaming_error.empty());
	CHECK(outcome.row_counts.at("voucher") == 1);
	CHECK(outcome.row_counts.at("transaction_line") == 2);
	CHECK(outcome.row_counts.count("missing_accounts") == 0);
	CHECK(outcome.rejected_lines == 0);

	REQUIRE(outcome.findings.missing.size() == 1);
	CHECK(outcome.findings.missing[0].account_id == "1920");
	CHECK(outcome.findings.missing[0].line_count == 1);
	CHECK(outcome.findings.unbalanced.empty());
	CHECK(outcome.findings.unknown.empty());

	CHECK(target.Table(Entity::MISSING_ACCOUNTS) == MemoryTarget::Rows {{"1920", "1"}});
	CHECK_FALSE(target.HasTable(Entity::UNBALANCED_VOUCHERS));
	CHECK_FALSE(target.HasTable(Entity::UNKNOWN_ELEMENTS));
}

TEST_CASE("Mixed encodings, party control accounts and source documents", "[ingest]") {
	MemoryTarget target;
	auto outcome = saft::Ingest(SAFT_DATA_DIR + "full.xml", target, IngestOptions());
	REQUIRE(outcome.StreamingUsed());
	const auto &t = target;

	SECTION("master files") {
		CHECK(t.Cell(Entity::HEADER, 0, "CompanyName") == "Exemplo Lda");
		CHECK(t.Cell(Entity::HEADER, 0, "DefaultCurrencyCode") == "EUR");

		REQUIRE(t.Table(Entity::ACCOUNT).size() == 3);
		CHECK(t.Cell(Entity::ACCOUNT, 0, "AccountID") == "1500");
		CHECK(t.Cell(Entity::ACCOUNT, 0, "OpeningDebit") == "1234.50");
		CHECK(t.Cell(Entity::ACCOUNT, 0, "ClosingDebit") == "0");
		CHECK(t.Cell(Entity::ACCOUNT, 1, "ParentAccountID") == "24");

		CHECK(t.Table(Entity::CUSTOMER)[0] == std::vector<std::string> {"C1", "Cliente Um", "PT123456789", "PT",
		                                                                  "Lisboa", "1000-001", "", ""});
		CHECK(t.Cell(Entity::SUPPLIER, 0, "Name") == "Fornecedor Um");
		REQUIRE(t.Table(Entity::CONTROL_ACCOUNT_LINK).size() == 2);
		CHECK(t.Cell(Entity::CONTROL_ACCOUNT_LINK, 0, "OpeningDebit") == "10.00");
		CHECK(t.Cell(Entity::CONTROL_ACCOUNT_LINK, 1, "PartyType") == "Supplier");
		CHECK(t.Cell(Entity::CONTROL_ACCOUNT_LINK, 1, "AccountID") == "2400");

		REQUIRE(t.Table(Entity::TAX_TABLE).size() == 2);
		CHECK(t.Table(Entity::TAX_TABLE)[0] ==
		      std::vector<std::string> {"NOR", "", "IVA", "23", "PT", "Value added tax"});
		CHECK(t.Cell(Entity::TAX_TABLE, 1, "Description") == "Reduced");
	}

	SECTION("lines") {
		REQUIRE(t.Table(Entity::TRANSACTION_LINE).size() == 5);
		CHECK(outcome.rejected_lines == 1);

		// indicator encoding, account from the customer's control account
		CHECK(t.Cell(Entity::TRANSACTION_LINE, 0, "AccountID") == "1500");
		CHECK(t.Cell(Entity::TRANSACTION_LINE, 0, "AccountDescription") == "Customers");
		CHECK(t.Cell(Entity::TRANSACTION_LINE, 0, "CustomerName") == "Cliente Um");
		CHECK(t.Cell(Entity::TRANSACTION_LINE, 0, "Amount") == "123.00");
		CHECK(t.Cell(Entity::TRANSACTION_LINE, 0, "AmountEncoding") == "indicator");
		CHECK(t.Cell(Entity::TRANSACTION_LINE, 0, "PostingDate") == "2024-03-02");

		CHECK(t.Cell(Entity::TRANSACTION_LINE, 1, "TaxAmount") == "-23.00");
		CHECK(t.Cell(Entity::TRANSACTION_LINE, 1, "TaxCode") == "NOR");
		CHECK(t.Cell(Entity::TRANSACTION_LINE, 1, "AmountEncoding") == "pair");

		// signed encoding, account from the supplier's control account
		CHECK(t.Cell(Entity::TRANSACTION_LINE, 3, "AccountID") == "2400");
		CHECK(t.Cell(Entity::TRANSACTION_LINE, 3, "Amount") == "-500.00");
		CHECK(t.Cell(Entity::TRANSACTION_LINE, 3, "AmountEncoding") == "signed");
		CHECK(t.Cell(Entity::TRANSACTION_LINE, 3, "JournalID") == "OTHER");

		CHECK(t.Table(Entity::ANALYSIS_LINE) == MemoryTarget::Rows {{"L1", "DEP", "D10", "123.00"}});
	}

	SECTION("vouchers and journal") {
		REQUIRE(t.Table(Entity::VOUCHER).size() == 2);
		CHECK(t.Cell(Entity::VOUCHER, 0, "Balanced") == "Y");
		CHECK(t.Cell(Entity::VOUCHER, 0, "JournalID") == "VND");
		CHECK(t.Cell(Entity::VOUCHER, 1, "Balanced") == "N");
		CHECK(t.Table(Entity::JOURNAL)[0] ==
		      std::vector<std::string> {"VND", "Sales journal", "", "2", "573.00", "623.00"});
	}

	SECTION("source documents") {
		REQUIRE(t.Table(Entity::SALES_INVOICE).size() == 1);
		CHECK(t.Cell(Entity::SALES_INVOICE, 0, "InvoiceNo") == "FT 1");
		CHECK(t.Cell(Entity::SALES_INVOICE, 0, "CustomerName") == "Cliente Um");
		CHECK(t.Cell(Entity::SALES_INVOICE, 0, "NetTotal") == "100.00");
		CHECK(t.Cell(Entity::SALES_INVOICE, 0, "GrossTotal") == "123.00");
		CHECK(t.Table(Entity::PURCHASE_INVOICE).empty());
	}

	SECTION("findings") {
		const auto &f = outcome.findings;
		REQUIRE(f.missing.size() == 2);
		CHECK(f.missing[0].account_id == "2410");
		CHECK(f.missing[1].account_id == "2433");

		REQUIRE(f.unbalanced.size() == 1);
		CHECK(f.unbalanced[0].voucher_id == "2024-VND-2");
		CHECK(t.Cell(Entity::UNBALANCED_VOUCHERS, 0, "Difference") == "-50.00");

		REQUIRE(f.unknown.size() == 4);
		CHECK(t.Table(Entity::UNKNOWN_ELEMENTS)[0] == std::vector<std::string> {"Line", "LineNumber", "2"});
		CHECK(f.unknown[1].tag == "CustomerTaxID");
	}
}

TEST_CASE("Listener stop ends the run with findings written", "[ingest][cancel]") {
	TempFileFixture fixture;
	auto path = fixture.write_temp("cancel.xml", synthetic_saft(500));
	IngestOptions options;
	options.progress_interval = 100;
	StopAfter listener(2);

	MemoryTarget target;
	auto outcome = saft::Ingest(path, target, options, &listener);
	CHECK(outcome.cancelled);
	CHECK(outcome.StreamingUsed());
	CHECK(listener.seen == 2);
	CHECK(outcome.row_counts.at("transaction_line") < 1000);
	CHECK(outcome.findings.unbalanced.empty());
	for (const auto &row : target.Table(Entity::TRANSACTION_LINE)) {
		CHECK(row.size() == saft::Schema(Entity::TRANSACTION_LINE).columns.size());
	}
}

TEST_CASE("Host cancellation through the token", "[ingest][cancel]") {
	TempFileFixture fixture;
	auto path = fixture.write_temp("token.xml", synthetic_saft(50));
	IngestOptions options;
	options.progress_interval = 10;
	saft::CancellationToken token;
	token.Cancel();

	MemoryTarget target;
	auto outcome = saft::Ingest(path, target, options, nullptr, &token);
	CHECK(outcome.cancelled);
	CHECK(outcome.row_counts.at("voucher") < 50);
}

TEST_CASE("Raised interrupt flag stops the run at the next tick", "[ingest][cancel]") {
	TempFileFixture fixture;
	auto path = fixture.write_temp("interrupt.xml", synthetic_saft(100));
	IngestOptions options;
	options.progress_interval = 20;
	std::atomic<bool> interrupted {false};
	saft::InterruptFlagListener listener(interrupted);

	MemoryTarget untouched;
	auto complete = saft::Ingest(path, untouched, options, &listener);
	CHECK_FALSE(complete.cancelled);
	CHECK(complete.row_counts.at("voucher") == 100);

	interrupted = true;
	MemoryTarget target;
	auto stopped = saft::Ingest(path, target, options, &listener);
	CHECK(stopped.cancelled);
	CHECK(stopped.events == 20);
	CHECK(stopped.row_counts.at("voucher") < 100);
}

TEST_CASE("Streaming failure switches to the fallback parser", "[ingest][fallback]") {
	TempFileFixture fixture;
	auto dir = fixture.path("fallback_out");
	CsvDirectoryTarget target(dir);
	auto outcome = saft::Ingest(SAFT_DATA_DIR + "orphan_line.xml", target, IngestOptions());

	CHECK_FALSE(outcome.StreamingUsed());
	CHECK(std::string(saft::PathUsedName(outcome.path_used)) == "fallback");
	CHECK_THAT(outcome.streaming_error, ContainsSubstring("outside a Transaction"));
	CHECK(outcome.orphan_lines == 1);
	CHECK(outcome.row_counts.at("transaction_line") == 2);
	REQUIRE(outcome.findings.missing.size() == 1);
	CHECK(outcome.findings.missing[0].account_id == "3000");

	// what the streaming attempt wrote was discarded
	auto vouchers = TempFileFixture::read_file(target.PathFor("voucher"));
	CHECK(count_lines(vouchers) == 2);
	CHECK(TempFileFixture::read_file(target.PathFor("missing_accounts")) == "AccountID,LineCount\r\n3000,1\r\n");
}

TEST_CASE("Disabled fallback surfaces the streaming failure", "[ingest][fallback]") {
	IngestOptions options;
	options.enable_fallback = false;
	MemoryTarget target;
	CHECK_THROWS_AS(saft::Ingest(SAFT_DATA_DIR + "nested_transaction.xml", target, options), saft::FallbackParsingError);
	CHECK_THROWS_WITH(saft::Ingest(SAFT_DATA_DIR + "nested_transaction.xml", target, options),
	                  ContainsSubstring("fallback is disabled"));
}

TEST_CASE("Unrecoverable input fails both parsers", "[ingest][fallback]") {
	MemoryTarget target;
	CHECK_THROWS_AS(saft::Ingest(SAFT_DATA_DIR + "not_xml.txt", target, IngestOptions()), saft::FallbackParsingError);
}

TEST_CASE("Missing input is a container error", "[ingest]") {
	MemoryTarget target;
	CHECK_THROWS_AS(saft::Ingest("/nonexistent/audit.xml", target, IngestOptions()), saft::SourceFormatError);
}

TEST_CASE("Empty zip archive is a container error", "[ingest][zip]") {
	TempFileFixture fixture;
	auto path = fixture.write_temp("empty.zip", std::string("PK\x05\x06", 4) + std::string(18, '\0'));
	MemoryTarget target;
	CHECK_THROWS_AS(saft::Ingest(path, target, IngestOptions()), saft::SourceFormatError);
	CHECK_FALSE(target.HasTable(Entity::VOUCHER));
}

TEST_CASE("Zipped input is ingested like the plain file", "[ingest]") {
	TempFileFixture fixture;
	auto xml = TempFileFixture::read_file(SAFT_DATA_DIR + "full.xml");
	auto zip = fixture.write_temp_zip("full.zip", {{"notes.txt", "x", false}, {"SAFT.xml", xml, true}});

	MemoryTarget plain;
	MemoryTarget zipped;
	saft::Ingest(SAFT_DATA_DIR + "full.xml", plain, IngestOptions());
	auto outcome = saft::Ingest(zip, zipped, IngestOptions());
	CHECK(outcome.StreamingUsed());
	CHECK(all_tables(plain) == all_tables(zipped));
}

TEST_CASE("Run metadata documents describe a streaming run", "[ingest][metadata]") {
	MemoryTarget target;
	auto outcome = saft::Ingest(SAFT_DATA_DIR + "minimal.xml", target, IngestOptions());

	auto meta = nlohmann::json::parse(target.Document(saft::PARSER_META_DOCUMENT));
	CHECK(meta.at("parser").get<std::string>() == "streaming");
	CHECK_FALSE(meta.at("parser_version").get<std::string>().empty());
	CHECK(meta.at("schema_version").get<int>() == saft::kSchemaVersion);
	CHECK(meta.at("source").get<std::string>() == SAFT_DATA_DIR + "minimal.xml");
	CHECK_FALSE(meta.at("wrote_raw").get<bool>());
	CHECK_FALSE(meta.at("cancelled").get<bool>());
	CHECK_FALSE(meta.contains("streaming_error"));
	auto tables = meta.at("tables").get<std::vector<std::string>>();
	CHECK(std::find(tables.begin(), tables.end(), "transaction_line") != tables.end());
	CHECK(std::find(tables.begin(), tables.end(), "missing_accounts") != tables.end());
	CHECK(std::find(tables.begin(), tables.end(), "unbalanced_vouchers") == tables.end());

	auto stats = nlohmann::json::parse(target.Document(saft::PARSE_STATS_DOCUMENT));
	CHECK(stats.at("events").get<uint64_t>() == outcome.events);
	CHECK(stats.at("rows").at("transaction_line").get<uint64_t>() == 2);
	CHECK(stats.at("counts").at("line").get<uint64_t>() == 2);
	CHECK(stats.at("peak_retained_nodes").get<uint64_t>() == outcome.peak_retained_nodes);
	CHECK(stats.at("top_times").size() <= ProgressSnapshot::TOP_PHASES);
	CHECK(stats.at("duration_sec").get<double>() >= 0.0);
}

TEST_CASE("Run metadata records the fallback and its cause", "[ingest][metadata][csv]") {
	TempFileFixture fixture;
	auto dir = fixture.path("meta_fallback");
	IngestOptions options;
	options.write_raw_elements = true;
	{
		CsvDirectoryTarget target(dir);
		saft::Ingest(SAFT_DATA_DIR + "orphan_line.xml", target, options);
	}

	auto meta = nlohmann::json::parse(TempFileFixture::read_file(dir + "/parser_meta.json"));
	CHECK(meta.at("parser").get<std::string>() == "fallback");
	CHECK(meta.at("wrote_raw").get<bool>());
	CHECK_THAT(meta.at("streaming_error").get<std::string>(), ContainsSubstring("outside a Transaction"));
	auto tables = meta.at("tables").get<std::vector<std::string>>();
	CHECK(std::find(tables.begin(), tables.end(), "raw_element") != tables.end());

	auto stats = nlohmann::json::parse(TempFileFixture::read_file(dir + "/parse_stats.json"));
	CHECK(stats.at("orphan_lines").get<uint64_t>() == 1);
	CHECK(stats.at("events").get<uint64_t>() > 0);
	CHECK(stats.at("counts").empty());
}

TEST_CASE("CSV output for a complete run", "[ingest][csv]") {
	TempFileFixture fixture;
	auto dir = fixture.path("csv_run");
	{
		CsvDirectoryTarget target(dir);
		saft::Ingest(SAFT_DATA_DIR + "minimal.xml", target, IngestOptions());
	}
	for (auto entity : saft::RecordEntities()) {
		CHECK(std::filesystem::exists(dir + "/" + saft::EntityName(entity) + ".csv"));
	}
	CHECK_FALSE(std::filesystem::exists(dir + "/unbalanced_vouchers.csv"));
	CHECK_FALSE(std::filesystem::exists(dir + "/raw_element.csv"));

	auto lines = TempFileFixture::read_file(dir + "/transaction_line.csv");
	CHECK(count_lines(lines) == 3);
	CHECK(lines.rfind("RecordID,VoucherID,", 0) == 0);
}

TEST_CASE("Memory held by a streaming run does not grow with the document", "[ingest][memory]") {
	TempFileFixture fixture;
	auto run = [&fixture](size_t vouchers) {
		auto name = std::to_string(vouchers);
		auto path = fixture.write_temp("bounded_" + name + ".xml", synthetic_saft(vouchers));
		CsvDirectoryTarget target(fixture.path("bounded_out_" + name));
		auto outcome = saft::Ingest(path, target, IngestOptions());
		REQUIRE(outcome.StreamingUsed());
		CHECK(outcome.row_counts.at("voucher") == vouchers);
		CHECK(outcome.row_counts.at("transaction_line") == 2 * vouchers);
		CHECK(outcome.findings.Clean());
		std::filesystem::remove(path);
		return outcome.peak_retained_nodes;
	};

	auto small = run(10000);
	auto large = run(200000);
	CHECK(small > 0);
	CHECK(large == small);
}
