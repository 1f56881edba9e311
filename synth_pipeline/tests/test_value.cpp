#include <gtest/gtest.h>

#include "synth/value.hpp"

TEST(attr_type, round_trips_names) {
  for (auto t : {synth::AttrType::Integer, synth::AttrType::Float,
                 synth::AttrType::String, synth::AttrType::Datetime}) {
    auto parsed = synth::parse_attr_type(synth::to_string(t));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, t);
  }
  EXPECT_FALSE(synth::parse_attr_type("bool").has_value());
  EXPECT_FALSE(synth::parse_attr_type("Integer").has_value());
}

TEST(value_text, format_double_keeps_one_decimal) {
  EXPECT_EQ(synth::format_double(4.0), "4.0");
  EXPECT_EQ(synth::format_double(-2.0), "-2.0");
  EXPECT_EQ(synth::format_double(3.125), "3.125");
  EXPECT_EQ(synth::format_double(0.1), "0.1");
}

TEST(value_text, value_to_string_per_alternative) {
  EXPECT_EQ(synth::value_to_string(synth::Value{}), "");
  EXPECT_EQ(synth::value_to_string(synth::Value{std::int64_t{42}}), "42");
  EXPECT_EQ(synth::value_to_string(synth::Value{2.5}), "2.5");
  EXPECT_EQ(synth::value_to_string(synth::Value{std::string("abc")}), "abc");
}

TEST(value_text, bin_to_string_drops_fraction_for_integers) {
  EXPECT_EQ(synth::bin_to_string(synth::Bin{3.0}, synth::AttrType::Integer), "3");
  EXPECT_EQ(synth::bin_to_string(synth::Bin{3.5}, synth::AttrType::Integer), "3.5");
  EXPECT_EQ(synth::bin_to_string(synth::Bin{3.0}, synth::AttrType::Float), "3.0");
  EXPECT_EQ(synth::bin_to_string(synth::Bin{std::string("M")},
                                 synth::AttrType::String),
            "M");
}

TEST(value_predicates, missing_and_numerical) {
  EXPECT_TRUE(synth::is_missing(synth::Value{}));
  EXPECT_FALSE(synth::is_missing(synth::Value{0.0}));
  EXPECT_TRUE(synth::is_numerical(synth::AttrType::Integer));
  EXPECT_TRUE(synth::is_numerical(synth::AttrType::Float));
  EXPECT_FALSE(synth::is_numerical(synth::AttrType::String));
  EXPECT_FALSE(synth::is_numerical(synth::AttrType::Datetime));
}
