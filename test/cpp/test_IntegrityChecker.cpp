#include <AmountNormalizer.hpp>
#include <IntegrityChecker.hpp>
#include <RecordEmitter.hpp>
#include <catch2/catch_test_macros.hpp>

using saft::Entity;
using saft::IngestOptions;
using saft::IntegrityChecker;
using saft::LineRecord;
using saft::MemoryTarget;
using saft::RecordEmitter;
using saft::RunLookups;

namespace {

LineRecord make_line(const std::string &record_id, const std::string &account, const std::string &signed_amount) {
	saft::SignedAmountInputs inputs;
	inputs.amount = signed_amount;
	LineRecord line;
	line.record_id = record_id;
	line.account_id = account;
	line.amount = *saft::DeriveSignedAmount(inputs);
	return line;
}

void emit_voucher(RecordEmitter &emitter, const std::string &id, const std::vector<LineRecord> &lines) {
	saft::VoucherFields fields;
	fields.voucher_id = id;
	fields.voucher_no = id;
	emitter.OpenVoucher();
	emitter.SetVoucherContext(fields);
	for (const auto &line : lines) {
		emitter.EmitLine(line, {});
	}
	emitter.CloseVoucher(fields);
}

struct EmitterFixture {
	IngestOptions options;
	MemoryTarget target;
	RunLookups lookups;
	RecordEmitter emitter {target, lookups, options};
};

} // namespace

TEST_CASE("Clean run has no findings and writes no finding tables", "[integrity]") {
	EmitterFixture f;
	saft::AccountRecord account;
	account.account_id = "1500";
	f.emitter.EmitAccount(account);
	account.account_id = "3000";
	f.emitter.EmitAccount(account);
	emit_voucher(f.emitter, "V1", {make_line("1", "1500", "10"), make_line("2", "3000", "-10")});

	auto findings = IntegrityChecker::Check(f.emitter);
	CHECK(findings.Clean());
	IntegrityChecker::WriteFindings(findings, f.target);
	CHECK_FALSE(f.target.HasTable(Entity::MISSING_ACCOUNTS));
	CHECK_FALSE(f.target.HasTable(Entity::UNBALANCED_VOUCHERS));
	CHECK_FALSE(f.target.HasTable(Entity::UNKNOWN_ELEMENTS));
}

TEST_CASE("Missing accounts are counted per line and skip the sentinel", "[integrity]") {
	EmitterFixture f;
	saft::AccountRecord account;
	account.account_id = "1500";
	f.emitter.EmitAccount(account);
	emit_voucher(f.emitter, "V1",
	             {make_line("1", "1500", "30"), make_line("2", "2433", "-10"), make_line("3", "2410", "-10"),
	              make_line("4", "2433", "-5"), make_line("5", "", "-5")});

	auto findings = IntegrityChecker::Check(f.emitter);
	REQUIRE(findings.missing.size() == 2);
	CHECK(findings.missing[0].account_id == "2410");
	CHECK(findings.missing[0].line_count == 1);
	CHECK(findings.missing[1].account_id == "2433");
	CHECK(findings.missing[1].line_count == 2);
	CHECK(findings.unbalanced.empty());

	IntegrityChecker::WriteFindings(findings, f.target);
	CHECK(f.target.Table(Entity::MISSING_ACCOUNTS) ==
	      MemoryTarget::Rows {{"2410", "1"}, {"2433", "2"}});
	CHECK_FALSE(f.target.HasTable(Entity::UNBALANCED_VOUCHERS));
}

TEST_CASE("Unbalanced vouchers carry their difference", "[integrity]") {
	EmitterFixture f;
	emit_voucher(f.emitter, "OK", {make_line("1", "1", "1.00"), make_line("2", "2", "-1.004")});
	emit_voucher(f.emitter, "BAD", {make_line("3", "1", "450,00"), make_line("4", "2", "-500,00")});

	auto findings = IntegrityChecker::Check(f.emitter);
	REQUIRE(findings.unbalanced.size() == 1);
	CHECK(findings.unbalanced[0].voucher_id == "BAD");

	IntegrityChecker::WriteFindings(findings, f.target);
	const auto &t = f.target;
	CHECK(t.Cell(Entity::UNBALANCED_VOUCHERS, 0, "DebitTotal") == "450.00");
	CHECK(t.Cell(Entity::UNBALANCED_VOUCHERS, 0, "CreditTotal") == "500.00");
	CHECK(t.Cell(Entity::UNBALANCED_VOUCHERS, 0, "Difference") == "-50.00");
}

TEST_CASE("Balance tolerance is half a cent", "[integrity]") {
	CHECK(saft::IsBalanced(saft::Decimal(10000, 2), saft::Decimal(100005, 3)));
	CHECK_FALSE(saft::IsBalanced(saft::Decimal(10000, 2), saft::Decimal(100006, 3)));
}

TEST_CASE("Unknown elements sort by count, then section and tag", "[integrity]") {
	EmitterFixture f;
	f.emitter.CountElement("Zeta", "MasterFiles");
	f.emitter.CountElement("Alpha", "MasterFiles");
	f.emitter.CountElement("Beta", "Header");
	f.emitter.CountElement("Extra", "Line");
	f.emitter.CountElement("Extra", "Line");
	f.emitter.CountElement("Account", "MasterFiles");

	auto findings = IntegrityChecker::Check(f.emitter);
	REQUIRE(findings.unknown.size() == 4);
	CHECK(findings.unknown[0].tag == "Extra");
	CHECK(findings.unknown[0].count == 2);
	CHECK(findings.unknown[1].section == "Header");
	CHECK(findings.unknown[2].tag == "Alpha");
	CHECK(findings.unknown[3].tag == "Zeta");

	IntegrityChecker::WriteFindings(findings, f.target);
	CHECK(f.target.Table(Entity::UNKNOWN_ELEMENTS).front() == std::vector<std::string> {"Line", "Extra", "2"});
}
