#include "ledger_types.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace ledger {

Timestamp nowUtc() {
  return std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());
}

std::string formatTimestamp(Timestamp ts) {
  auto seconds = std::chrono::floor<std::chrono::seconds>(ts);
  auto micros = (ts - seconds).count();
  std::time_t time = std::chrono::system_clock::to_time_t(seconds);

  std::tm tm{};
  gmtime_r(&time, &tm);

  std::stringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
     << "." << std::setfill('0') << std::setw(6) << micros;
  return ss.str();
}

std::optional<Timestamp> parseTimestamp(const std::string& text) {
  std::tm tm{};
  std::istringstream in(text);
  in >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  if (in.fail()) {
    return std::nullopt;
  }

  int64_t micros = 0;
  if (in.peek() == '.') {
    in.get();
    std::string digits;
    while (std::isdigit(in.peek())) {
      digits += static_cast<char>(in.get());
    }
    if (digits.empty() || digits.size() > 6) {
      return std::nullopt;
    }
    digits.append(6 - digits.size(), '0');
    micros = std::stoll(digits);
  }

  // Trailing garbage (time zone suffixes included) is rejected.
  if (in.peek() != std::char_traits<char>::eof()) {
    return std::nullopt;
  }

  std::time_t seconds = timegm(&tm);
  if (seconds == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  return std::chrono::time_point_cast<std::chrono::microseconds>(
             std::chrono::system_clock::from_time_t(seconds)) +
         std::chrono::microseconds(micros);
}

std::string toString(AccountStatus status) {
  switch (status) {
    case AccountStatus::ACTIVE: return "ACTIVE";
    case AccountStatus::FROZEN: return "FROZEN";
    case AccountStatus::CLOSED: return "CLOSED";
  }
  return "UNKNOWN";
}

std::optional<AccountStatus> parseAccountStatus(const std::string& text) {
  std::string upper = text;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  if (upper == "ACTIVE") return AccountStatus::ACTIVE;
  if (upper == "FROZEN") return AccountStatus::FROZEN;
  if (upper == "CLOSED") return AccountStatus::CLOSED;
  return std::nullopt;
}

std::string defaultCustomerName(int64_t customer_id) {
  return "Customer " + std::to_string(customer_id);
}

}  // namespace ledger
