#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include "synth/attribute.hpp"
#include "synth/pattern_json.hpp"

namespace {

using nlohmann::json;
using synth::Value;

std::filesystem::path temp_path(const std::string& name) {
  return std::filesystem::temp_directory_path() / ("synth_pattern_" + name);
}

json sample_pattern() {
  return json{
      {"name", "age"},    {"type", "integer"},
      {"categorical", false}, {"min", 18},
      {"max", 30},        {"decimals", nullptr},
      {"bins", {18, 24}}, {"prs", {0.25, 0.75}},
  };
}

}  // namespace

TEST(pattern_json, integer_values_written_as_ints) {
  synth::Attribute a("n", {Value{std::int64_t{1}}, Value{std::int64_t{3}}});
  const json j = synth::pattern_to_json(a.to_pattern());

  EXPECT_EQ(j.at("type"), "integer");
  EXPECT_TRUE(j.at("min").is_number_integer());
  EXPECT_TRUE(j.at("max").is_number_integer());
  EXPECT_TRUE(j.at("bins")[0].is_number_integer());
  EXPECT_TRUE(j.at("decimals").is_null());
  EXPECT_EQ(j.at("bins").size(), j.at("prs").size());
}

TEST(pattern_json, float_keeps_decimals) {
  synth::Attribute a("x", {Value{1.25}, Value{2.5}, Value{3.75}});
  const json j = synth::pattern_to_json(a.to_pattern());
  EXPECT_EQ(j.at("type"), "float");
  EXPECT_EQ(j.at("decimals"), 2);
}

TEST(pattern_json, round_trip_categorical_string) {
  synth::Attribute a("sex", {Value{std::string("M")}, Value{std::string("F")},
                             Value{std::string("M")}});
  const auto p = synth::pattern_from_json(synth::pattern_to_json(a.to_pattern()));

  EXPECT_EQ(p.name, "sex");
  EXPECT_EQ(p.type, synth::AttrType::String);
  EXPECT_TRUE(p.categorical);
  EXPECT_EQ(p.bins, a.bins());
  EXPECT_EQ(p.prs, a.prs());
}

TEST(pattern_json, round_trip_numeric_within_tolerance) {
  synth::Attribute a("x", {Value{0.1}, Value{0.7}, Value{2.9}, Value{3.3}});
  const auto before = a.to_pattern();
  const auto after = synth::pattern_from_json(
      json::parse(synth::pattern_to_json(before).dump()));

  EXPECT_EQ(after.type, before.type);
  EXPECT_EQ(after.categorical, before.categorical);
  EXPECT_NEAR(after.min, before.min, 1e-12);
  EXPECT_NEAR(after.max, before.max, 1e-12);
  EXPECT_EQ(after.decimals, before.decimals);
  ASSERT_EQ(after.bins.size(), before.bins.size());
  for (std::size_t i = 0; i < before.bins.size(); ++i) {
    EXPECT_NEAR(std::get<double>(after.bins[i]), std::get<double>(before.bins[i]),
                1e-12);
    EXPECT_NEAR(after.prs[i], before.prs[i], 1e-12);
  }
}

TEST(pattern_json, numeric_labels_of_text_columns) {
  json j = sample_pattern();
  j["type"] = "string";
  j["categorical"] = true;
  j["bins"] = {1, "b"};
  const auto p = synth::pattern_from_json(j);
  EXPECT_EQ(std::get<std::string>(p.bins[0]), "1");
  EXPECT_EQ(std::get<std::string>(p.bins[1]), "b");
}

TEST(pattern_json, validation_errors) {
  json bad_type = sample_pattern();
  bad_type["type"] = "bool";
  EXPECT_THROW(synth::pattern_from_json(bad_type), std::runtime_error);

  json mismatch = sample_pattern();
  mismatch["prs"] = {1.0};
  EXPECT_THROW(synth::pattern_from_json(mismatch), std::runtime_error);

  json negative = sample_pattern();
  negative["prs"] = {-0.25, 1.25};
  EXPECT_THROW(synth::pattern_from_json(negative), std::runtime_error);

  json missing = sample_pattern();
  missing.erase("bins");
  EXPECT_THROW(synth::pattern_from_json(missing), std::runtime_error);

  json wrong_shape = sample_pattern();
  wrong_shape["name"] = 5;
  EXPECT_THROW(synth::pattern_from_json(wrong_shape), std::runtime_error);

  json string_edge = sample_pattern();
  string_edge["bins"] = {"a", 24};
  EXPECT_THROW(synth::pattern_from_json(string_edge), std::runtime_error);
}

TEST(pattern_json, attributes_document) {
  const auto p = synth::pattern_from_json(sample_pattern());
  const json doc = synth::patterns_to_json({p, p});
  ASSERT_TRUE(doc.at("attributes").is_array());
  EXPECT_EQ(doc.at("attributes").size(), 2u);

  const auto back = synth::patterns_from_json(doc);
  ASSERT_EQ(back.size(), 2u);
  EXPECT_EQ(back[1].name, "age");
  EXPECT_THROW(synth::patterns_from_json(json{{"x", 1}}), std::runtime_error);
}

TEST(pattern_json, file_round_trip) {
  const auto path = temp_path("file_round_trip.json");
  const auto p = synth::pattern_from_json(sample_pattern());
  synth::save_pattern_file(path.string(), {p});

  const auto loaded = synth::load_pattern_file(path.string());
  ASSERT_EQ(loaded.size(), 1u);
  EXPECT_EQ(loaded[0].name, "age");
  EXPECT_EQ(loaded[0].bins, p.bins);
  std::filesystem::remove(path);
}

TEST(pattern_json, file_with_single_pattern) {
  const auto path = temp_path("single.json");
  {
    std::ofstream out(path);
    out << sample_pattern().dump();
  }
  const auto loaded = synth::load_pattern_file(path.string());
  ASSERT_EQ(loaded.size(), 1u);
  EXPECT_EQ(loaded[0].type, synth::AttrType::Integer);
  std::filesystem::remove(path);
}

TEST(pattern_json, file_errors) {
  EXPECT_THROW(synth::load_pattern_file(temp_path("does_not_exist.json").string()),
               std::runtime_error);

  const auto path = temp_path("malformed.json");
  {
    std::ofstream out(path);
    out << "{\"name\": ";
  }
  EXPECT_THROW(synth::load_pattern_file(path.string()), std::runtime_error);
  std::filesystem::remove(path);
}

TEST(pattern_json, round_trip_datetime) {
  synth::Attribute range("day", {Value{std::string("2020-01-02")},
                                 Value{std::string("2020-02-15")},
                                 Value{std::string("2020-03-30")}});
  const auto p = synth::pattern_from_json(
      json::parse(synth::pattern_to_json(range.to_pattern()).dump()));
  EXPECT_EQ(p.type, synth::AttrType::Datetime);
  EXPECT_FALSE(p.categorical);
  EXPECT_FALSE(p.decimals.has_value());
  EXPECT_DOUBLE_EQ(p.min, range.min());
  EXPECT_DOUBLE_EQ(p.max, range.max());
  EXPECT_EQ(p.bins, range.bins());
  EXPECT_EQ(p.prs, range.prs());

  synth::Attribute labels("day",
                          {Value{std::string("2020-01-10")},
                           Value{std::string("2020-01-02")},
                           Value{std::string("2020-01-10")}},
                          {true, synth::DEFAULT_BIN_COUNT});
  const auto q = synth::pattern_from_json(
      json::parse(synth::pattern_to_json(labels.to_pattern()).dump()));
  EXPECT_TRUE(q.categorical);
  ASSERT_EQ(q.bins.size(), 2u);
  EXPECT_EQ(std::get<std::string>(q.bins[0]), "1/2/2020");
  EXPECT_EQ(std::get<std::string>(q.bins[1]), "1/10/2020");
}
