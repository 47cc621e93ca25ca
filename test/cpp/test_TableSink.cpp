#include "saft_test_helpers.hpp"

#include <TableSink.hpp>
#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <stdexcept>

using saft::CsvDirectoryTarget;
using saft::CsvEscape;
using saft::Entity;
using saft::MemoryTarget;
using saft::Schema;

TEST_CASE("Every entity has a distinct schema", "[sink][schema]") {
	CHECK(saft::kSchemaVersion == 1);
	CHECK(std::string(saft::EntityName(Entity::TRANSACTION_LINE)) == "transaction_line");
	CHECK(std::string(saft::EntityName(Entity::MISSING_ACCOUNTS)) == "missing_accounts");
	CHECK(Schema(Entity::VOUCHER).columns.back() == "Balanced");
	CHECK(Schema(Entity::UNKNOWN_ELEMENTS).columns.size() == 3);
	CHECK(saft::RecordEntities().size() == 12);
}

TEST_CASE("CsvEscape quotes only when needed", "[sink][csv]") {
	CHECK(CsvEscape("plain") == "plain");
	CHECK(CsvEscape("") == "");
	CHECK(CsvEscape("a,b") == "\"a,b\"");
	CHECK(CsvEscape("say \"hi\"") == "\"say \"\"hi\"\"\"");
	CHECK(CsvEscape("two\nlines") == "\"two\nlines\"");
}

TEST_CASE("Rows must match the schema width", "[sink]") {
	MemoryTarget target;
	auto &sink = target.Open(Schema(Entity::ANALYSIS_LINE));
	CHECK_THROWS_AS(sink.Append({"1", "DEP"}), std::invalid_argument);
	sink.Append({"1", "DEP", "D10", "5.00"});
	CHECK(sink.RowCount() == 1);
	CHECK(target.Cell(Entity::ANALYSIS_LINE, 0, "ID") == "D10");
	CHECK_THROWS_AS(target.Cell(Entity::ANALYSIS_LINE, 0, "Nope"), std::out_of_range);
	CHECK_THROWS_AS(target.Table(Entity::VOUCHER), std::out_of_range);
}

TEST_CASE("Opening an entity twice returns the same sink", "[sink]") {
	MemoryTarget target;
	auto &a = target.Open(Schema(Entity::JOURNAL));
	auto &b = target.Open(Schema(Entity::JOURNAL));
	CHECK(&a == &b);
}

TEST_CASE("CSV tables carry a header row and CRLF rows", "[sink][csv]") {
	TempFileFixture fixture;
	auto dir = fixture.path("csv_header");
	{
		CsvDirectoryTarget target(dir);
		auto &sink = target.Open(Schema(Entity::MISSING_ACCOUNTS));
		sink.Append({"1920", "1"});
		sink.Append({"2,4", "3"});
		target.CloseAll();
	}
	auto content = TempFileFixture::read_file(dir + "/missing_accounts.csv");
	CHECK(content == "AccountID,LineCount\r\n1920,1\r\n\"2,4\",3\r\n");
}

TEST_CASE("Flushed CSV tables end on a row boundary", "[sink][csv]") {
	TempFileFixture fixture;
	auto dir = fixture.path("csv_flush");
	CsvDirectoryTarget target(dir);
	auto &sink = target.Open(Schema(Entity::ANALYSIS_LINE));
	for (int i = 0; i < 1000; i++) {
		sink.Append({std::to_string(i), "T", "line\nbreak", "1.00"});
	}
	target.FlushAll();

	auto content = TempFileFixture::read_file(target.PathFor("analysis_line"));
	REQUIRE(content.size() > 2);
	CHECK(content.substr(content.size() - 2) == "\r\n");
	target.CloseAll();
}

TEST_CASE("Discard removes every table written so far", "[sink][csv]") {
	TempFileFixture fixture;
	auto dir = fixture.path("csv_discard");
	CsvDirectoryTarget target(dir);
	target.Open(Schema(Entity::ACCOUNT)).Append({"1500", "", "", "", "", "", "", "0", "0", "0", "0"});
	target.Open(Schema(Entity::VOUCHER));
	REQUIRE(std::filesystem::exists(target.PathFor("account")));

	target.Discard();
	CHECK_FALSE(std::filesystem::exists(target.PathFor("account")));
	CHECK_FALSE(std::filesystem::exists(target.PathFor("voucher")));

	// tables opened after a discard start empty
	auto &sink = target.Open(Schema(Entity::ACCOUNT));
	CHECK(sink.RowCount() == 0);
	target.CloseAll();
	CHECK(TempFileFixture::read_file(target.PathFor("account")).find("1500") == std::string::npos);
}

TEST_CASE("MemoryTarget discard drops tables", "[sink]") {
	MemoryTarget target;
	target.Open(Schema(Entity::HEADER));
	REQUIRE(target.HasTable(Entity::HEADER));
	target.Discard();
	CHECK_FALSE(target.HasTable(Entity::HEADER));
}

TEST_CASE("Documents are written beside the tables and replaced on rewrite", "[sink][csv]") {
	TempFileFixture fixture;
	auto dir = fixture.path("csv_documents");
	CsvDirectoryTarget target(dir);
	target.WriteDocument("parser_meta.json", "{}\n");
	target.WriteDocument("parser_meta.json", "{\"parser\": \"streaming\"}\n");
	CHECK(TempFileFixture::read_file(dir + "/parser_meta.json") == "{\"parser\": \"streaming\"}\n");

	target.Discard();
	CHECK_FALSE(std::filesystem::exists(dir + "/parser_meta.json"));
}

TEST_CASE("MemoryTarget keeps documents until discarded", "[sink]") {
	MemoryTarget target;
	target.WriteDocument("parse_stats.json", "{}");
	CHECK(target.Document("parse_stats.json") == "{}");
	CHECK_THROWS_AS(target.Document("missing.json"), std::out_of_range);
	target.Discard();
	CHECK_THROWS_AS(target.Document("parse_stats.json"), std::out_of_range);
}
