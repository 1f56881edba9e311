#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace synth {

// One raw cell of a column. std::monostate marks a missing entry.
using Value = std::variant<std::monostate, std::int64_t, double, std::string>;

// A bin key (categorical) or a bin left edge (non-categorical).
using Bin = std::variant<double, std::string>;

enum class AttrType {
  Integer,
  Float,
  String,
  Datetime
};

std::string to_string(AttrType t);

// Accepts "integer", "float", "string", "datetime".
std::optional<AttrType> parse_attr_type(std::string_view s);

inline bool is_missing(const Value& v) {
  return std::holds_alternative<std::monostate>(v);
}

inline bool is_numerical(AttrType t) {
  return t == AttrType::Integer || t == AttrType::Float;
}

// Shortest round-trip text of a double. Integral values keep one decimal
// ("4.0"), matching how float columns are usually printed.
std::string format_double(double v);

// Text form of a cell; missing cells become "".
std::string value_to_string(const Value& v);

// Text form of a bin; integral edges of integer columns print without ".0".
std::string bin_to_string(const Bin& b, AttrType t);

}  // namespace synth
