// type_inference.cpp
//
// Leaf step of pattern computation: decides the column type, imputes
// missing cells and decides categorical-ness.

#include "synth/type_inference.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>

#include "synth/time_utils.hpp"

namespace synth {

AttrType infer_type(const std::vector<Value>& values) {
  bool any_int = false;
  bool any_float = false;
  bool any_string = false;

  for (const auto& v : values) {
    if (std::holds_alternative<std::int64_t>(v)) {
      any_int = true;
    } else if (std::holds_alternative<double>(v)) {
      any_float = true;
    } else if (std::holds_alternative<std::string>(v)) {
      any_string = true;
    }
  }

  if (!any_int && !any_float && !any_string) {
    throw std::invalid_argument(
        "infer_type: column has no non-missing values (unsupported)");
  }

  if (!any_string) {
    return any_float ? AttrType::Float : AttrType::Integer;
  }

  const bool all_dates = std::all_of(values.begin(), values.end(),
                                     [](const Value& v) {
                                       return is_missing(v) ||
                                              is_datetime(value_to_string(v));
                                     });
  return all_dates ? AttrType::Datetime : AttrType::String;
}

Value mode_of(const std::vector<Value>& values) {
  std::map<Value, std::size_t> counts;
  std::vector<const Value*> first_seen;
  for (const auto& v : values) {
    if (is_missing(v)) continue;
    auto [it, inserted] = counts.try_emplace(v, 0);
    if (inserted) first_seen.push_back(&v);
    ++it->second;
  }
  if (first_seen.empty()) {
    throw std::invalid_argument(
        "mode_of: column has no non-missing values (unsupported)");
  }

  const Value* best = first_seen.front();
  std::size_t best_count = counts[*best];
  for (const Value* v : first_seen) {
    const std::size_t c = counts[*v];
    if (c > best_count) {
      best = v;
      best_count = c;
    }
  }
  return *best;
}

std::vector<Value> fill_missing_with_mode(const std::vector<Value>& values) {
  std::vector<Value> out = values;
  const bool any_missing =
      std::any_of(out.begin(), out.end(), [](const Value& v) {
        return is_missing(v);
      });
  if (!any_missing) return out;

  const Value mode = mode_of(values);
  for (auto& v : out) {
    if (is_missing(v)) v = mode;
  }
  return out;
}

bool has_duplicates(const std::vector<Value>& values) {
  std::set<Value> seen;
  for (const auto& v : values) {
    if (!seen.insert(v).second) return true;
  }
  return false;
}

bool infer_categorical(AttrType type, const std::vector<Value>& values,
                       bool forced) {
  if (forced) return true;
  return type == AttrType::String && has_duplicates(values);
}

}  // namespace synth
