#include "byte_size.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <string>
#include <unordered_map>

#include "internal/util/errors.hpp"

namespace upload::util {
namespace {

std::string Lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

const std::unordered_map<std::string, double>& Multipliers() {
  static const std::unordered_map<std::string, double> kMultipliers = {
      {"", 1.0},
      {"b", 1.0},
      {"k", 1024.0},
      {"kb", 1e3},
      {"kib", 1024.0},
      {"m", 1024.0 * 1024.0},
      {"mb", 1e6},
      {"mib", 1024.0 * 1024.0},
      {"g", 1024.0 * 1024.0 * 1024.0},
      {"gb", 1e9},
      {"gib", 1024.0 * 1024.0 * 1024.0},
      {"t", 1024.0 * 1024.0 * 1024.0 * 1024.0},
      {"tb", 1e12},
      {"tib", 1024.0 * 1024.0 * 1024.0 * 1024.0},
  };
  return kMultipliers;
}

} // namespace

std::uint64_t ParseByteSize(std::string_view text) {
  std::string input(text);
  input.erase(std::remove_if(input.begin(), input.end(), [](unsigned char c) { return std::isspace(c) || c == '_' || c == ','; }), input.end());
  if (input.empty()) {
    throw InvalidArgument("empty byte size");
  }

  std::size_t split = 0;
  while (split < input.size() && (std::isdigit(static_cast<unsigned char>(input[split])) || input[split] == '.')) {
    ++split;
  }
  if (split == 0) {
    throw InvalidArgument("byte size must start with a number: " + std::string(text));
  }

  char*        end   = nullptr;
  const auto   digits = input.substr(0, split);
  const double value = std::strtod(digits.c_str(), &end);
  if (end == nullptr || *end != '\0') {
    throw InvalidArgument("invalid number in byte size: " + std::string(text));
  }

  const auto suffix = Lower(input.substr(split));
  auto       it     = Multipliers().find(suffix);
  if (it == Multipliers().end()) {
    throw InvalidArgument("unknown byte size unit '" + suffix + "' in: " + std::string(text));
  }

  const double bytes = value * it->second;
  if (bytes >= static_cast<double>(std::numeric_limits<std::uint64_t>::max())) {
    throw InvalidArgument("byte size too large: " + std::string(text));
  }
  return static_cast<std::uint64_t>(std::llround(bytes));
}

std::string FormatByteSize(std::uint64_t bytes) {
  static constexpr const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};

  double value = static_cast<double>(bytes);
  int    unit  = 0;
  while (value >= 1024.0 && unit < 4) {
    value /= 1024.0;
    ++unit;
  }

  char buffer[32];
  if (unit == 0) {
    std::snprintf(buffer, sizeof(buffer), "%llu B", static_cast<unsigned long long>(bytes));
  } else {
    std::snprintf(buffer, sizeof(buffer), "%.1f %s", value, kUnits[unit]);
  }
  return buffer;
}

} // namespace upload::util
