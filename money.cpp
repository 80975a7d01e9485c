#include "money.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>

namespace ledger {

namespace {

// 16 integer digits keep every value, cents included, inside int64_t.
constexpr size_t kMaxIntegerDigits = 16;

}  // namespace

Money Money::fromMinorUnits(int64_t minor_units) {
  return Money(minor_units);
}

Money Money::fromUnits(int64_t units) {
  if (units > std::numeric_limits<int64_t>::max() / kMinorPerUnit ||
      units < std::numeric_limits<int64_t>::min() / kMinorPerUnit) {
    throw std::overflow_error("money value out of range");
  }
  return Money(units * kMinorPerUnit);
}

Money Money::parse(const std::string& text) {
  if (text.empty()) {
    throw std::invalid_argument("empty money value");
  }

  size_t pos = 0;
  bool negative = false;
  if (text[pos] == '-' || text[pos] == '+') {
    negative = text[pos] == '-';
    ++pos;
  }

  int64_t units = 0;
  size_t integer_digits = 0;
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
    if (++integer_digits > kMaxIntegerDigits) {
      throw std::invalid_argument("money value too large: " + text);
    }
    units = units * 10 + (text[pos] - '0');
    ++pos;
  }
  if (integer_digits == 0) {
    throw std::invalid_argument("invalid money value: " + text);
  }

  int64_t fraction = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    size_t fraction_digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if (++fraction_digits > static_cast<size_t>(kScale)) {
        throw std::invalid_argument("money value has more than 2 fractional digits: " + text);
      }
      fraction = fraction * 10 + (text[pos] - '0');
      ++pos;
    }
    if (fraction_digits == 0) {
      throw std::invalid_argument("invalid money value: " + text);
    }
    if (fraction_digits == 1) {
      fraction *= 10;
    }
  }

  if (pos != text.size()) {
    throw std::invalid_argument("invalid money value: " + text);
  }

  int64_t minor = units * kMinorPerUnit + fraction;
  return Money(negative ? -minor : minor);
}

std::optional<Money> Money::tryParse(const std::string& text) {
  try {
    return parse(text);
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  }
}

std::string Money::toString() const {
  // Work in unsigned space so INT64_MIN renders correctly.
  uint64_t magnitude = minor_units_ < 0
      ? static_cast<uint64_t>(-(minor_units_ + 1)) + 1
      : static_cast<uint64_t>(minor_units_);

  uint64_t units = magnitude / kMinorPerUnit;
  uint64_t cents = magnitude % kMinorPerUnit;

  std::string result = minor_units_ < 0 ? "-" : "";
  result += std::to_string(units);
  result += '.';
  result += static_cast<char>('0' + cents / 10);
  result += static_cast<char>('0' + cents % 10);
  return result;
}

Money Money::operator+(const Money& other) const {
  constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
  constexpr int64_t kMin = std::numeric_limits<int64_t>::min();
  if ((other.minor_units_ > 0 && minor_units_ > kMax - other.minor_units_) ||
      (other.minor_units_ < 0 && minor_units_ < kMin - other.minor_units_)) {
    throw std::overflow_error("money addition overflow");
  }
  return Money(minor_units_ + other.minor_units_);
}

Money Money::operator-(const Money& other) const {
  constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
  constexpr int64_t kMin = std::numeric_limits<int64_t>::min();
  if ((other.minor_units_ < 0 && minor_units_ > kMax + other.minor_units_) ||
      (other.minor_units_ > 0 && minor_units_ < kMin + other.minor_units_)) {
    throw std::overflow_error("money subtraction overflow");
  }
  return Money(minor_units_ - other.minor_units_);
}

Money& Money::operator+=(const Money& other) {
  *this = *this + other;
  return *this;
}

Money& Money::operator-=(const Money& other) {
  *this = *this - other;
  return *this;
}

std::ostream& operator<<(std::ostream& os, const Money& money) {
  return os << money.toString();
}

}  // namespace ledger
