#include "saft_test_helpers.hpp"

#include <SaftErrors.hpp>
#include <SourceReader.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

using saft::ByteSource;
using saft::ContainerKind;
using saft::SourceReader;

static std::string drain(ByteSource &source, size_t chunk = 7) {
	std::string out;
	std::vector<char> buf(chunk);
	size_t n;
	while ((n = source.Read(buf.data(), buf.size())) > 0) {
		out.append(buf.data(), n);
	}
	return out;
}

static const std::string DOC = "<?xml version=\"1.0\"?>\n<AuditFile><Header/></AuditFile>\n";

TEST_CASE("Raw documents are read unchanged", "[source]") {
	TempFileFixture fixture;
	auto path = fixture.write_temp("raw.xml", DOC);
	CHECK(SourceReader::Detect(path) == ContainerKind::RAW);

	auto source = SourceReader::Open(path);
	CHECK(source->Name() == path);
	CHECK(drain(*source) == DOC);
	CHECK(source->Read(nullptr, 0) == 0);
}

TEST_CASE("Gzip documents are inflated", "[source]") {
	TempFileFixture fixture;
	auto path = fixture.write_temp_gzip("doc.xml.gz", DOC);
	CHECK(SourceReader::Detect(path) == ContainerKind::GZIP);

	auto source = SourceReader::Open(path);
	CHECK(drain(*source, 3) == DOC);
}

TEST_CASE("Zip members are read stored or deflated", "[source][zip]") {
	TempFileFixture fixture;

	SECTION("stored") {
		auto path = fixture.write_temp_zip("stored.zip", {{"audit.xml", DOC, false}});
		CHECK(SourceReader::Detect(path) == ContainerKind::ZIP);
		auto source = SourceReader::Open(path);
		CHECK(source->Name() == path + ":audit.xml");
		CHECK(drain(*source) == DOC);
	}

	SECTION("deflated") {
		std::string big;
		for (int i = 0; i < 2000; i++) {
			big += DOC;
		}
		auto path = fixture.write_temp_zip("deflated.zip", {{"audit.xml", big, true}});
		auto source = SourceReader::Open(path);
		CHECK(drain(*source, 4096) == big);
	}
}

TEST_CASE("The first .xml member is chosen", "[source][zip]") {
	TempFileFixture fixture;
	auto path = fixture.write_temp_zip("multi.zip", {{"readme.txt", "not this", false},
	                                                 {"data/", "", false},
	                                                 {"Ledger.XML", DOC, true},
	                                                 {"second.xml", "<other/>", false}});
	auto source = SourceReader::Open(path);
	CHECK(source->Name() == path + ":Ledger.XML");
	CHECK(drain(*source) == DOC);
}

TEST_CASE("Archive without an xml member is rejected", "[source][zip]") {
	TempFileFixture fixture;
	auto path = fixture.write_temp_zip("noxml.zip", {{"readme.txt", "hello", false}});
	CHECK_THROWS_AS(SourceReader::Open(path), saft::SourceFormatError);
	CHECK_THROWS_WITH(SourceReader::Open(path), Catch::Matchers::ContainsSubstring("no .xml member found"));
}

TEST_CASE("Archive with no members is a zip without an xml member", "[source][zip]") {
	TempFileFixture fixture;
	// end-of-central-directory record only
	auto path = fixture.write_temp("empty.zip", std::string("PK\x05\x06", 4) + std::string(18, '\0'));
	CHECK(SourceReader::Detect(path) == ContainerKind::ZIP);
	CHECK_THROWS_AS(SourceReader::Open(path), saft::SourceFormatError);
}

TEST_CASE("Spanned archive marker is detected as zip", "[source][zip]") {
	TempFileFixture fixture;
	auto path = fixture.write_temp("spanned.zip", std::string("PK\x07\x08", 4) + std::string(26, '\0'));
	CHECK(SourceReader::Detect(path) == ContainerKind::ZIP);
	CHECK_THROWS_AS(SourceReader::Open(path), saft::SourceFormatError);
}

TEST_CASE("CRC mismatch is reported once the member is read", "[source][zip]") {
	TempFileFixture fixture;

	SECTION("stored") {
		auto path = fixture.write_temp_zip("badcrc.zip", {{"audit.xml", DOC, false}}, true);
		auto source = SourceReader::Open(path);
		CHECK_THROWS_WITH(drain(*source), Catch::Matchers::ContainsSubstring("CRC mismatch in zip member"));
	}

	SECTION("deflated") {
		auto path = fixture.write_temp_zip("badcrc_deflate.zip", {{"audit.xml", DOC, true}}, true);
		auto source = SourceReader::Open(path);
		CHECK_THROWS_AS(drain(*source), saft::SourceFormatError);
	}
}

TEST_CASE("Missing files cannot be opened", "[source]") {
	CHECK_THROWS_AS(SourceReader::Open("/nonexistent/saft.xml"), saft::SourceFormatError);
	CHECK_THROWS_WITH(SourceReader::Detect("/nonexistent/saft.xml"), Catch::Matchers::ContainsSubstring("cannot open file"));
}

TEST_CASE("Close is idempotent and ends the stream", "[source]") {
	TempFileFixture fixture;
	auto raw = SourceReader::Open(fixture.write_temp("close.xml", DOC));
	char buf[4];
	REQUIRE(raw->Read(buf, sizeof(buf)) == sizeof(buf));
	raw->Close();
	raw->Close();
	CHECK(raw->Read(buf, sizeof(buf)) == 0);

	auto zipped = SourceReader::Open(fixture.write_temp_zip("close.zip", {{"a.xml", DOC, true}}));
	zipped->Close();
	zipped->Close();
	CHECK(zipped->Read(buf, sizeof(buf)) == 0);
}
