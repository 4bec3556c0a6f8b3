#include "../include/exit_policy.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

std::string normalizeCountryCode(const std::string& code) {
  std::string result;
  result.reserve(code.size());
  for (unsigned char c : code) {
    if (!std::isspace(c)) result.push_back(static_cast<char>(std::tolower(c)));
  }
  return result;
}

ExitPolicy ExitPolicy::strictCountry(const std::string& country) {
  return ExitPolicy{{normalizeCountryCode(country)}, true};
}

std::string ExitPolicy::exitNodesValue() const {
  std::string value;
  for (const auto& country : countries) {
    if (!value.empty()) value += ',';
    value += '{' + country + '}';
  }
  return value;
}

std::string ExitPolicy::describe() const {
  std::ostringstream oss;
  if (countries.empty()) {
    oss << "any exit";
  } else {
    oss << "ExitNodes " << exitNodesValue();
  }
  oss << ", StrictNodes " << (strict ? 1 : 0);
  return oss.str();
}

FallbackSpec FallbackSpec::parse(const std::string& text) {
  FallbackSpec spec;
  if (normalizeCountryCode(text) == "any") return spec;

  std::istringstream items(text);
  std::string item;
  while (std::getline(items, item, ',')) {
    std::string code = normalizeCountryCode(item);
    if (!code.empty()) spec.countries.push_back(code);
  }
  return spec;
}
