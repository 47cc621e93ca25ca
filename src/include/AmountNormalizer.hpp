#pragma once

#include "Decimal.hpp"

#include <optional>
#include <string>

namespace saft {

// Parse locale-variant numeric text into an exact decimal.
//
// Spaces, non-breaking spaces, apostrophes and any character other than digits, '.',
// ',', '+', '-', '(' and ')' are dropped. A leading or trailing '-' or enclosing
// parentheses make the value negative. When both ',' and '.' occur the right-most of the
// two is the decimal separator and the other is grouping; when only one kind occurs its
// last occurrence is the decimal separator and earlier ones are grouping.
//
// Throws AmountFormatError when no digits remain, when the text uses exponent notation,
// when it carries more than one sign marker or a sign inside the number, or when the
// value does not fit the exact decimal range.
Decimal ParseAmount(const std::string &text);

// ParseAmount for optional fields: nullopt instead of AmountFormatError.
std::optional<Decimal> TryParseAmount(const std::string &text);

enum class AmountEncoding {
	NONE,
	DEBIT_CREDIT_PAIR, // distinct debit and credit elements
	INDICATOR,         // single magnitude plus a debit/credit indicator
	SIGNED             // single signed amount, negative is credit side
};

const char *AmountEncodingName(AmountEncoding encoding);

// Raw field texts of one line as resolved from the document; absent fields are nullopt.
struct SignedAmountInputs {
	std::optional<std::string> debit;
	std::optional<std::string> credit;
	std::optional<std::string> amount;
	std::optional<std::string> indicator;
};

struct SignedAmount {
	Decimal amount; // debit - credit
	Decimal debit;
	Decimal credit;
	AmountEncoding encoding = AmountEncoding::NONE;
};

// +1 for debit indicators (D, DR, Debit, S, Soll), -1 for credit indicators (C, CR,
// Credit, K, H, Haben), 0 when unrecognised.
int IndicatorSign(const std::string &indicator);

// Derive the signed amount of one line. Encodings are tried per line in order: debit/
// credit pair, indicator plus magnitude, signed amount. nullopt when none of them
// yields a value.
std::optional<SignedAmount> DeriveSignedAmount(const SignedAmountInputs &inputs);

} // namespace saft
