#ifndef LEDGER_MONEY_HPP_
#define LEDGER_MONEY_HPP_

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace ledger {

/**
 * Exact monetary amount with two fractional digits.
 * Stored as a signed count of minor units (cents); there is no floating point
 * conversion in either direction.
 */
class Money {
 public:
  static constexpr int kScale = 2;
  static constexpr int64_t kMinorPerUnit = 100;

  Money() = default;

  static Money fromMinorUnits(int64_t minor_units);
  static Money fromUnits(int64_t units);

  /**
   * Parses "123", "123.4", "123.45", "-5.00" or "+5".
   * Throws std::invalid_argument on anything else, including more than two
   * fractional digits, exponents and values that do not fit.
   */
  static Money parse(const std::string& text);
  static std::optional<Money> tryParse(const std::string& text);

  int64_t minorUnits() const { return minor_units_; }

  bool isZero() const { return minor_units_ == 0; }
  bool isPositive() const { return minor_units_ > 0; }
  bool isNegative() const { return minor_units_ < 0; }

  /**
   * Canonical decimal rendering with exactly two fractional digits.
   */
  std::string toString() const;

  // Arithmetic throws std::overflow_error instead of wrapping.
  Money operator+(const Money& other) const;
  Money operator-(const Money& other) const;
  Money& operator+=(const Money& other);
  Money& operator-=(const Money& other);

  bool operator==(const Money& other) const { return minor_units_ == other.minor_units_; }
  bool operator!=(const Money& other) const { return minor_units_ != other.minor_units_; }
  bool operator<(const Money& other) const { return minor_units_ < other.minor_units_; }
  bool operator<=(const Money& other) const { return minor_units_ <= other.minor_units_; }
  bool operator>(const Money& other) const { return minor_units_ > other.minor_units_; }
  bool operator>=(const Money& other) const { return minor_units_ >= other.minor_units_; }

 private:
  explicit Money(int64_t minor_units) : minor_units_(minor_units) {}

  int64_t minor_units_ = 0;
};

std::ostream& operator<<(std::ostream& os, const Money& money);

}  // namespace ledger

#endif  // LEDGER_MONEY_HPP_
