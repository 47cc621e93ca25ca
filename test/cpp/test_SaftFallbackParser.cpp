#include "saft_test_helpers.hpp"

#include <Ingest.hpp>
#include <RecordEmitter.hpp>
#include <SaftErrors.hpp>
#include <SaftFallbackParser.hpp>
#include <SourceReader.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

using saft::Entity;
using saft::FallbackStats;
using saft::IngestOptions;
using saft::MemoryTarget;
using saft::RecordEmitter;
using saft::RunLookups;
using saft::SaftFallbackParser;
using saft::SourceReader;

namespace {

struct FallbackRun {
	explicit FallbackRun(const std::string &path, IngestOptions opts = IngestOptions())
	    : options(opts), source(SourceReader::Open(path)), emitter(target, lookups, options) {
	}

	FallbackStats Run() {
		SaftFallbackParser parser(*source, emitter, options);
		return parser.Run();
	}

	IngestOptions options;
	MemoryTarget target;
	RunLookups lookups;
	std::unique_ptr<saft::ByteSource> source;
	RecordEmitter emitter;
};

} // namespace

TEST_CASE("Fallback reads a well-formed document", "[fallback]") {
	FallbackRun run(SAFT_DATA_DIR + "minimal.xml");
	auto stats = run.Run();
	CHECK(stats.orphan_lines == 0);
	CHECK(stats.nested_vouchers == 0);
	CHECK(stats.elements > 0);

	const auto &t = run.target;
	CHECK(t.Cell(Entity::HEADER, 0, "CompanyName") == "Minimal AS");
	REQUIRE(t.Table(Entity::VOUCHER).size() == 1);
	CHECK(t.Cell(Entity::VOUCHER, 0, "Balanced") == "Y");
	REQUIRE(t.Table(Entity::TRANSACTION_LINE).size() == 2);
	CHECK(t.Cell(Entity::TRANSACTION_LINE, 1, "Amount") == "-100.00");
}

TEST_CASE("Lines outside a transaction are counted and skipped", "[fallback]") {
	FallbackRun run(SAFT_DATA_DIR + "orphan_line.xml");
	auto stats = run.Run();
	CHECK(stats.orphan_lines == 1);

	const auto &lines = run.target.Table(Entity::TRANSACTION_LINE);
	REQUIRE(lines.size() == 2);
	CHECK(run.target.Cell(Entity::TRANSACTION_LINE, 0, "RecordID") == "1");
	CHECK(run.target.Cell(Entity::TRANSACTION_LINE, 1, "RecordID") == "2");
	CHECK(run.target.Cell(Entity::VOUCHER, 0, "Balanced") == "Y");
}

TEST_CASE("Nested transaction becomes its own voucher after the outer one", "[fallback]") {
	FallbackRun run(SAFT_DATA_DIR + "nested_transaction.xml");
	auto stats = run.Run();
	CHECK(stats.nested_vouchers == 1);

	const auto &t = run.target;
	REQUIRE(t.Table(Entity::VOUCHER).size() == 2);
	CHECK(t.Cell(Entity::VOUCHER, 0, "VoucherID") == "OUTER");
	CHECK(t.Cell(Entity::VOUCHER, 0, "DebitTotal") == "10.00");
	CHECK(t.Cell(Entity::VOUCHER, 0, "CreditTotal") == "10.00");
	CHECK(t.Cell(Entity::VOUCHER, 0, "Balanced") == "Y");
	CHECK(t.Cell(Entity::VOUCHER, 1, "VoucherID") == "INNER");
	CHECK(t.Cell(Entity::VOUCHER, 1, "Balanced") == "N");

	REQUIRE(t.Table(Entity::TRANSACTION_LINE).size() == 3);
	CHECK(t.Cell(Entity::TRANSACTION_LINE, 0, "RecordID") == "1");
	CHECK(t.Cell(Entity::TRANSACTION_LINE, 1, "RecordID") == "3");
	CHECK(t.Cell(Entity::TRANSACTION_LINE, 2, "RecordID") == "2");
	CHECK(t.Cell(Entity::TRANSACTION_LINE, 2, "VoucherID") == "INNER");

	REQUIRE(run.emitter.UnbalancedVouchers().size() == 1);
	CHECK(run.emitter.UnbalancedVouchers()[0].voucher_id == "INNER");
}

TEST_CASE("Truncated document is recovered", "[fallback]") {
	FallbackRun run(SAFT_DATA_DIR + "truncated.xml");
	run.Run();
	const auto &t = run.target;
	CHECK(t.Cell(Entity::ACCOUNT, 0, "AccountDescription") == "Receivables & others");
	REQUIRE(t.Table(Entity::VOUCHER).size() == 1);
	CHECK(t.Cell(Entity::VOUCHER, 0, "DebitTotal") == "25.00");
	CHECK(t.Cell(Entity::VOUCHER, 0, "Balanced") == "Y");
}

TEST_CASE("Input that is not XML cannot be recovered", "[fallback]") {
	FallbackRun run(SAFT_DATA_DIR + "not_xml.txt");
	CHECK_THROWS_AS(run.Run(), saft::FallbackParsingError);
}

TEST_CASE("Container errors pass through the fallback unchanged", "[fallback]") {
	TempFileFixture fixture;
	auto path = fixture.write_temp_zip("crc.zip", {{"audit.xml", synthetic_saft(2), true}}, true);
	FallbackRun run(path);
	CHECK_THROWS_AS(run.Run(), saft::SourceFormatError);
}

TEST_CASE("Both parsers produce identical tables", "[fallback][equivalence]") {
	auto file = GENERATE(as<std::string> {}, "minimal.xml", "full.xml");
	CAPTURE(file);

	IngestOptions streaming_options;
	streaming_options.write_raw_elements = true;
	IngestOptions fallback_options = streaming_options;
	fallback_options.force_fallback = true;

	MemoryTarget streamed;
	MemoryTarget recovered;
	auto a = saft::Ingest(SAFT_DATA_DIR + file, streamed, streaming_options);
	auto b = saft::Ingest(SAFT_DATA_DIR + file, recovered, fallback_options);
	REQUIRE(a.StreamingUsed());
	REQUIRE_FALSE(b.StreamingUsed());

	auto left = all_tables(streamed);
	auto right = all_tables(recovered);
	REQUIRE(left.size() == right.size());
	for (size_t i = 0; i < left.size(); i++) {
		CAPTURE(left[i].first);
		CHECK(left[i].first == right[i].first);
		CHECK(left[i].second == right[i].second);
	}
	CHECK(a.row_counts == b.row_counts);
	CHECK(a.rejected_lines == b.rejected_lines);
}
