// value.cpp
//
// Type tags and text formatting for raw cells and bins.

#include "synth/value.hpp"

#include <charconv>
#include <cmath>
#include <stdexcept>
#include <type_traits>

namespace synth {

std::string to_string(AttrType t) {
  switch (t) {
    case AttrType::Integer:
      return "integer";
    case AttrType::Float:
      return "float";
    case AttrType::String:
      return "string";
    case AttrType::Datetime:
      return "datetime";
  }
  throw std::logic_error("unknown AttrType");
}

std::optional<AttrType> parse_attr_type(std::string_view s) {
  if (s == "integer") return AttrType::Integer;
  if (s == "float") return AttrType::Float;
  if (s == "string") return AttrType::String;
  if (s == "datetime") return AttrType::Datetime;
  return std::nullopt;
}

std::string format_double(double v) {
  if (std::isnan(v)) return "nan";
  if (std::isinf(v)) return v > 0 ? "inf" : "-inf";

  char buf[64];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  if (ec != std::errc{}) {
    throw std::runtime_error("format_double: to_chars failed");
  }
  std::string out(buf, ptr);
  if (out.find_first_of(".eEn") == std::string::npos) {
    out += ".0";
  }
  return out;
}

std::string value_to_string(const Value& v) {
  return std::visit(
      [](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return {};
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          return std::to_string(x);
        } else if constexpr (std::is_same_v<T, double>) {
          return format_double(x);
        } else {
          return x;
        }
      },
      v);
}

std::string bin_to_string(const Bin& b, AttrType t) {
  if (const auto* s = std::get_if<std::string>(&b)) {
    return *s;
  }
  const double d = std::get<double>(b);
  if (t == AttrType::Integer && std::floor(d) == d && std::isfinite(d)) {
    return std::to_string(static_cast<std::int64_t>(d));
  }
  return format_double(d);
}

}  // namespace synth
