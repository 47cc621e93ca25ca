#include "AmountNormalizer.hpp"
#include "SaftErrors.hpp"

#include <algorithm>
#include <cctype>

namespace saft {

namespace {

bool IsKept(char ch) {
	return (ch >= '0' && ch <= '9') || ch == '.' || ch == ',' || ch == '+' || ch == '-' || ch == '(' || ch == ')';
}

std::string Upper(const std::string &s) {
	std::string out;
	out.reserve(s.size());
	for (unsigned char ch : s) {
		if (ch != ' ' && ch != '\t' && ch != '\n' && ch != '\r') {
			out.push_back(static_cast<char>(std::toupper(ch)));
		}
	}
	return out;
}

bool IsDigit(char ch) {
	return ch >= '0' && ch <= '9';
}

// "1e5", "2,5E-3": an exponent marker between a number and a digit or sign. Currency
// text such as "EUR 12" has no digit right before the letter.
bool HasExponent(const std::string &text) {
	for (size_t i = 1; i + 1 < text.size(); i++) {
		if (text[i] != 'e' && text[i] != 'E') {
			continue;
		}
		char before = text[i - 1];
		char after = text[i + 1];
		if ((IsDigit(before) || before == '.' || before == ',') && (IsDigit(after) || after == '+' || after == '-')) {
			return true;
		}
	}
	return false;
}

SignedAmount SplitSigned(const Decimal &value, AmountEncoding encoding) {
	SignedAmount result;
	result.amount = value;
	result.encoding = encoding;
	if (value.IsNegative()) {
		result.credit = value.Negated();
	} else {
		result.debit = value;
	}
	return result;
}

} // namespace

Decimal ParseAmount(const std::string &text) {
	if (HasExponent(text)) {
		throw AmountFormatError("AmountNormalizer: exponent notation in amount '" + text + "'");
	}
	std::string s;
	s.reserve(text.size());
	for (char ch : text) {
		if (IsKept(ch)) {
			s.push_back(ch);
		}
	}

	// at most one sign marker: parentheses, a leading sign or a trailing minus ("500,00-")
	bool negative = false;
	int sign_markers = 0;
	if (s.size() >= 2 && s.front() == '(' && s.back() == ')') {
		negative = true;
		sign_markers++;
		s = s.substr(1, s.size() - 2);
	}
	if (!s.empty() && (s.front() == '-' || s.front() == '+')) {
		negative = s.front() == '-';
		sign_markers++;
		s.erase(s.begin());
	}
	if (!s.empty() && s.back() == '-') {
		negative = true;
		sign_markers++;
		s.pop_back();
	}
	if (sign_markers > 1 || s.find_first_of("+-()") != std::string::npos) {
		throw AmountFormatError("AmountNormalizer: conflicting or misplaced sign in amount '" + text + "'");
	}

	size_t last_dot = s.rfind('.');
	size_t last_comma = s.rfind(',');
	size_t decimal_pos = std::string::npos;
	if (last_dot != std::string::npos && last_comma != std::string::npos) {
		decimal_pos = std::max(last_dot, last_comma);
	} else if (last_comma != std::string::npos) {
		decimal_pos = last_comma;
	} else if (last_dot != std::string::npos) {
		decimal_pos = last_dot;
	}

	std::string int_digits;
	std::string frac_digits;
	for (size_t i = 0; i < s.size(); i++) {
		char ch = s[i];
		if (ch < '0' || ch > '9') {
			continue;
		}
		if (decimal_pos != std::string::npos && i > decimal_pos) {
			frac_digits.push_back(ch);
		} else {
			int_digits.push_back(ch);
		}
	}
	if (int_digits.empty() && frac_digits.empty()) {
		throw AmountFormatError("AmountNormalizer: no digits in amount '" + text + "'");
	}

	size_t leading = int_digits.find_first_not_of('0');
	int_digits = leading == std::string::npos ? "" : int_digits.substr(leading);
	if (frac_digits.size() > static_cast<size_t>(Decimal::MAX_SCALE) ||
	    int_digits.size() + frac_digits.size() > 18) {
		throw AmountFormatError("AmountNormalizer: amount out of range '" + text + "'");
	}

	int64_t unscaled = 0;
	for (char ch : int_digits + frac_digits) {
		unscaled = unscaled * 10 + (ch - '0');
	}
	return Decimal(negative ? -unscaled : unscaled, static_cast<int>(frac_digits.size()));
}

std::optional<Decimal> TryParseAmount(const std::string &text) {
	try {
		return ParseAmount(text);
	} catch (const AmountFormatError &) {
		return std::nullopt;
	}
}

const char *AmountEncodingName(AmountEncoding encoding) {
	switch (encoding) {
	case AmountEncoding::DEBIT_CREDIT_PAIR:
		return "pair";
	case AmountEncoding::INDICATOR:
		return "indicator";
	case AmountEncoding::SIGNED:
		return "signed";
	case AmountEncoding::NONE:
	default:
		return "none";
	}
}

int IndicatorSign(const std::string &indicator) {
	auto value = Upper(indicator);
	if (value == "D" || value == "DR" || value == "DEBIT" || value == "DEB" || value == "S" || value == "SOLL") {
		return 1;
	}
	if (value == "C" || value == "CR" || value == "CREDIT" || value == "K" || value == "KREDIT" || value == "H" ||
	    value == "HABEN") {
		return -1;
	}
	return 0;
}

std::optional<SignedAmount> DeriveSignedAmount(const SignedAmountInputs &inputs) {
	if (inputs.debit || inputs.credit) {
		std::optional<Decimal> debit = inputs.debit ? TryParseAmount(*inputs.debit) : std::nullopt;
		std::optional<Decimal> credit = inputs.credit ? TryParseAmount(*inputs.credit) : std::nullopt;
		if (debit || credit) {
			SignedAmount result;
			result.debit = debit.value_or(Decimal());
			result.credit = credit.value_or(Decimal());
			result.amount = result.debit - result.credit;
			result.encoding = AmountEncoding::DEBIT_CREDIT_PAIR;
			return result;
		}
	}

	if (!inputs.amount) {
		return std::nullopt;
	}
	auto amount = TryParseAmount(*inputs.amount);
	if (!amount) {
		return std::nullopt;
	}
	if (inputs.indicator) {
		int sign = IndicatorSign(*inputs.indicator);
		if (sign != 0) {
			auto magnitude = amount->Abs();
			return SplitSigned(sign > 0 ? magnitude : magnitude.Negated(), AmountEncoding::INDICATOR);
		}
	}
	return SplitSigned(*amount, AmountEncoding::SIGNED);
}

} // namespace saft
