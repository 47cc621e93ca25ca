#include "Decimal.hpp"
#include "SaftErrors.hpp"

#include <algorithm>
#include <limits>

namespace saft {

namespace {

using wide_t = __int128;

wide_t Pow10(int exponent) {
	wide_t result = 1;
	for (int i = 0; i < exponent; i++) {
		result *= 10;
	}
	return result;
}

int64_t Narrow(wide_t value) {
	if (value > std::numeric_limits<int64_t>::max() || value < std::numeric_limits<int64_t>::min()) {
		throw AmountFormatError("Decimal: value out of range");
	}
	return static_cast<int64_t>(value);
}

} // namespace

Decimal::Decimal(int64_t unscaled, int scale) : unscaled_(unscaled), scale_(scale) {
	if (scale < 0 || scale > MAX_SCALE) {
		throw AmountFormatError("Decimal: scale " + std::to_string(scale) + " out of range");
	}
}

Decimal Decimal::Abs() const {
	return unscaled_ < 0 ? Negated() : *this;
}

Decimal Decimal::Negated() const {
	return Decimal(Narrow(-static_cast<wide_t>(unscaled_)), scale_);
}

Decimal Decimal::WithScale(int scale) const {
	if (scale <= scale_) {
		return *this;
	}
	if (scale > MAX_SCALE) {
		throw AmountFormatError("Decimal: scale " + std::to_string(scale) + " out of range");
	}
	return Decimal(Narrow(static_cast<wide_t>(unscaled_) * Pow10(scale - scale_)), scale);
}

Decimal Decimal::operator+(const Decimal &other) const {
	int scale = std::max(scale_, other.scale_);
	wide_t lhs = static_cast<wide_t>(unscaled_) * Pow10(scale - scale_);
	wide_t rhs = static_cast<wide_t>(other.unscaled_) * Pow10(scale - other.scale_);
	return Decimal(Narrow(lhs + rhs), scale);
}

Decimal Decimal::operator-(const Decimal &other) const {
	return *this + other.Negated();
}

Decimal &Decimal::operator+=(const Decimal &other) {
	*this = *this + other;
	return *this;
}

Decimal &Decimal::operator-=(const Decimal &other) {
	*this = *this - other;
	return *this;
}

bool Decimal::operator==(const Decimal &other) const {
	int scale = std::max(scale_, other.scale_);
	return static_cast<wide_t>(unscaled_) * Pow10(scale - scale_) ==
	       static_cast<wide_t>(other.unscaled_) * Pow10(scale - other.scale_);
}

bool Decimal::operator<(const Decimal &other) const {
	int scale = std::max(scale_, other.scale_);
	return static_cast<wide_t>(unscaled_) * Pow10(scale - scale_) <
	       static_cast<wide_t>(other.unscaled_) * Pow10(scale - other.scale_);
}

std::string Decimal::ToString() const {
	bool negative = unscaled_ < 0;
	wide_t magnitude = negative ? -static_cast<wide_t>(unscaled_) : static_cast<wide_t>(unscaled_);

	std::string digits;
	do {
		digits.push_back(static_cast<char>('0' + static_cast<int>(magnitude % 10)));
		magnitude /= 10;
	} while (magnitude > 0);
	while (digits.size() < static_cast<size_t>(scale_) + 1) {
		digits.push_back('0');
	}
	std::reverse(digits.begin(), digits.end());

	if (scale_ > 0) {
		digits.insert(digits.end() - scale_, '.');
	}
	return negative ? "-" + digits : digits;
}

} // namespace saft
