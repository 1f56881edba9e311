// pattern_json.cpp
//
// Load/save helpers for AttributePattern records (nlohmann::json).

#include "synth/pattern_json.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using nlohmann::json;

namespace synth {

namespace {

json number_to_json(double v, AttrType t) {
  if (t == AttrType::Integer && std::isfinite(v) && std::trunc(v) == v &&
      std::fabs(v) < 9.0e15) {
    return json(static_cast<std::int64_t>(v));
  }
  return json(v);
}

json bin_to_json(const Bin& b, AttrType t) {
  if (const auto* s = std::get_if<std::string>(&b)) return json(*s);
  return number_to_json(std::get<double>(b), t);
}

const json& required(const json& j, const char* key, const std::string& who) {
  if (!j.contains(key)) {
    throw std::runtime_error("pattern " + who + " missing '" + key + "'");
  }
  return j.at(key);
}

double number_from_json(const json& v, const std::string& what) {
  if (!v.is_number()) {
    throw std::runtime_error(what + " is not a number");
  }
  return v.get<double>();
}

Bin bin_from_json(const json& v, const AttributePattern& p) {
  const std::string who = "'" + p.name + "' bins";
  const bool text_keys = p.categorical && (p.type == AttrType::String ||
                                           p.type == AttrType::Datetime);
  if (v.is_string()) {
    if (text_keys) return Bin{v.get<std::string>()};
    throw std::runtime_error(who + " hold a string for a numeric key");
  }
  if (!v.is_number()) {
    throw std::runtime_error(who + " hold a non-scalar entry");
  }
  if (text_keys) {
    // Labels such as "1" may have been written as numbers.
    if (v.is_number_integer()) return Bin{std::to_string(v.get<std::int64_t>())};
    return Bin{format_double(v.get<double>())};
  }
  return Bin{v.get<double>()};
}

AttributePattern parse_pattern(const json& j) {
  if (!j.is_object()) {
    throw std::runtime_error("pattern is not a JSON object");
  }

  AttributePattern p;
  p.name = required(j, "name", "<unnamed>").get<std::string>();

  const std::string type_name = required(j, "type", p.name).get<std::string>();
  const auto type = parse_attr_type(type_name);
  if (!type) {
    throw std::runtime_error("pattern '" + p.name + "' has unknown type '" +
                             type_name + "'");
  }
  p.type = *type;
  p.categorical = j.value("categorical", false);
  p.min = number_from_json(required(j, "min", p.name), "'" + p.name + "' min");
  p.max = number_from_json(required(j, "max", p.name), "'" + p.name + "' max");

  if (p.type == AttrType::Float && j.contains("decimals") &&
      !j.at("decimals").is_null()) {
    p.decimals = j.at("decimals").get<int>();
  }

  const auto& jbins = required(j, "bins", p.name);
  const auto& jprs = required(j, "prs", p.name);
  if (!jbins.is_array() || !jprs.is_array()) {
    throw std::runtime_error("pattern '" + p.name +
                             "' bins/prs must be arrays");
  }
  if (jbins.size() != jprs.size()) {
    throw std::runtime_error("pattern '" + p.name +
                             "' bins.size() != prs.size()");
  }
  if (jbins.empty()) {
    throw std::runtime_error("pattern '" + p.name + "' has no bins");
  }

  p.bins.reserve(jbins.size());
  for (const auto& jb : jbins) p.bins.push_back(bin_from_json(jb, p));

  p.prs.reserve(jprs.size());
  for (const auto& jp : jprs) {
    const double pr = number_from_json(jp, "'" + p.name + "' prs entry");
    if (pr < 0.0 || !std::isfinite(pr)) {
      throw std::runtime_error("pattern '" + p.name +
                               "' has a negative or non-finite probability");
    }
    p.prs.push_back(pr);
  }
  return p;
}

}  // namespace

json pattern_to_json(const AttributePattern& p) {
  json j;
  j["name"] = p.name;
  j["type"] = to_string(p.type);
  j["categorical"] = p.categorical;
  j["min"] = number_to_json(p.min, p.type);
  j["max"] = number_to_json(p.max, p.type);
  if (p.type == AttrType::Float && p.decimals) {
    j["decimals"] = *p.decimals;
  } else {
    j["decimals"] = nullptr;
  }

  json bins = json::array();
  for (const auto& b : p.bins) bins.push_back(bin_to_json(b, p.type));
  j["bins"] = std::move(bins);
  j["prs"] = p.prs;
  return j;
}

AttributePattern pattern_from_json(const json& j) {
  try {
    return parse_pattern(j);
  } catch (const json::exception& e) {
    throw std::runtime_error(std::string("bad pattern JSON: ") + e.what());
  }
}

json patterns_to_json(const std::vector<AttributePattern>& ps) {
  json arr = json::array();
  for (const auto& p : ps) arr.push_back(pattern_to_json(p));
  return json{{"attributes", std::move(arr)}};
}

std::vector<AttributePattern> patterns_from_json(const json& j) {
  if (!j.contains("attributes") || !j["attributes"].is_array()) {
    throw std::runtime_error("pattern JSON missing 'attributes' array");
  }
  std::vector<AttributePattern> out;
  out.reserve(j["attributes"].size());
  for (const auto& ja : j["attributes"]) out.push_back(pattern_from_json(ja));
  return out;
}

std::vector<AttributePattern> load_pattern_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Failed to open pattern JSON: " + path);
  }

  json j;
  try {
    in >> j;
  } catch (const json::parse_error& e) {
    throw std::runtime_error("Malformed pattern JSON " + path + ": " +
                             e.what());
  }

  if (j.contains("attributes")) return patterns_from_json(j);
  return {pattern_from_json(j)};
}

void save_pattern_file(const std::string& path,
                       const std::vector<AttributePattern>& ps) {
  std::filesystem::path p(path);
  if (p.has_parent_path()) {
    std::filesystem::create_directories(p.parent_path());
  }

  std::ofstream out(path);
  if (!out) {
    throw std::runtime_error("Failed to open output JSON: " + path);
  }
  out << patterns_to_json(ps).dump(2) << "\n";
}

}  // namespace synth
