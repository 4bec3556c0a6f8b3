#include "../include/rotation_interval.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

#include "../include/errors.hpp"

namespace {

const char* kIntervalHint =
    "Invalid interval format. Use number or range (e.g., '60' or '30-120')";

std::string trim(const std::string& s) {
  auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
               return std::isspace(c) != 0;
             }).base();
  return begin < end ? std::string(begin, end) : std::string();
}

std::uint32_t parseSeconds(const std::string& raw, const std::string& whole) {
  const std::string part = trim(raw);
  if (part.empty() ||
      !std::all_of(part.begin(), part.end(),
                   [](unsigned char c) { return std::isdigit(c) != 0; })) {
    throw IntervalFormatError(std::string(kIntervalHint) + ": '" + whole +
                              "'");
  }
  unsigned long long value = 0;
  try {
    value = std::stoull(part);
  } catch (const std::out_of_range&) {
    throw IntervalFormatError("Interval value out of range: '" + whole + "'");
  }
  if (value > std::numeric_limits<std::uint32_t>::max()) {
    throw IntervalFormatError("Interval value out of range: '" + whole + "'");
  }
  return static_cast<std::uint32_t>(value);
}

}  // namespace

RotationInterval::RotationInterval(std::uint32_t lo, std::uint32_t hi)
    : lo_(lo), hi_(hi) {
  if (lo_ > hi_) {
    throw IntervalFormatError("Interval range is reversed: " +
                              std::to_string(lo_) + "-" + std::to_string(hi_));
  }
}

RotationInterval RotationInterval::parse(const std::string& text) {
  const std::string value = trim(text);
  if (value.empty()) {
    throw IntervalFormatError(std::string(kIntervalHint) + ": empty value");
  }

  const auto dash = value.find('-');
  if (dash == std::string::npos) {
    return RotationInterval(parseSeconds(value, text));
  }
  return RotationInterval(parseSeconds(value.substr(0, dash), text),
                          parseSeconds(value.substr(dash + 1), text));
}

std::string RotationInterval::toString() const {
  if (!isRange()) return std::to_string(lo_) + "s";
  return std::to_string(lo_) + "-" + std::to_string(hi_) + "s";
}
