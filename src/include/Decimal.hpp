#pragma once

#include <cstdint>
#include <string>

namespace saft {

// Exact fixed-point decimal: value = unscaled / 10^scale. Sums keep the larger scale of
// their operands, so adding any number of two-decimal amounts reproduces the exact
// result. Arithmetic overflow raises AmountFormatError.
class Decimal {
public:
	static constexpr int MAX_SCALE = 18;

	Decimal() = default;
	Decimal(int64_t unscaled, int scale);

	static Decimal FromInteger(int64_t value) {
		return Decimal(value, 0);
	}

	[[nodiscard]] int64_t Unscaled() const {
		return unscaled_;
	}
	[[nodiscard]] int Scale() const {
		return scale_;
	}
	[[nodiscard]] bool IsZero() const {
		return unscaled_ == 0;
	}
	[[nodiscard]] bool IsNegative() const {
		return unscaled_ < 0;
	}

	[[nodiscard]] Decimal Abs() const;
	[[nodiscard]] Decimal Negated() const;
	// Same value expressed with at least `scale` fractional digits.
	[[nodiscard]] Decimal WithScale(int scale) const;

	Decimal operator+(const Decimal &other) const;
	Decimal operator-(const Decimal &other) const;
	Decimal &operator+=(const Decimal &other);
	Decimal &operator-=(const Decimal &other);

	// Value comparison, independent of scale: 1.50 == 1.5
	bool operator==(const Decimal &other) const;
	bool operator!=(const Decimal &other) const {
		return !(*this == other);
	}
	bool operator<(const Decimal &other) const;
	bool operator<=(const Decimal &other) const {
		return !(other < *this);
	}
	bool operator>(const Decimal &other) const {
		return other < *this;
	}
	bool operator>=(const Decimal &other) const {
		return !(*this < other);
	}

	// Plain notation with the value's own scale: "100.00", "-500.00", "0".
	[[nodiscard]] std::string ToString() const;

private:
	int64_t unscaled_ = 0;
	int scale_ = 0;
};

} // namespace saft
