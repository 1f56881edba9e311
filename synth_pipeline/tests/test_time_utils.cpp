#include <gtest/gtest.h>

#include "synth/time_utils.hpp"

TEST(parse_datetime, iso_dates) {
  auto s = synth::parse_datetime("1970-01-02");
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(*s, 86'400);

  auto t = synth::parse_datetime("2020-02-29");
  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(*t, 1'582'934'400);
}

TEST(parse_datetime, alternative_spellings_agree) {
  const auto iso = synth::parse_datetime("2021-03-07");
  ASSERT_TRUE(iso.has_value());
  EXPECT_EQ(synth::parse_datetime("2021/03/07"), iso);
  EXPECT_EQ(synth::parse_datetime("3/7/2021"), iso);
  EXPECT_EQ(synth::parse_datetime("03-07-2021"), iso);
  EXPECT_EQ(synth::parse_datetime("  2021-03-07  "), iso);
}

TEST(parse_datetime, time_of_day) {
  auto s = synth::parse_datetime("1970-01-01T01:02:03");
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(*s, 3723);

  auto m = synth::parse_datetime("1970-01-01 10:30");
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(*m, 37'800);
}

TEST(parse_datetime, rejects_non_dates) {
  EXPECT_FALSE(synth::parse_datetime("").has_value());
  EXPECT_FALSE(synth::parse_datetime("hello").has_value());
  EXPECT_FALSE(synth::parse_datetime("2021-02-30").has_value());
  EXPECT_FALSE(synth::parse_datetime("2021-13-01").has_value());
  EXPECT_FALSE(synth::parse_datetime("12345").has_value());
  EXPECT_FALSE(synth::parse_datetime("2021-03-07 25:00").has_value());
  EXPECT_FALSE(synth::is_datetime("1.5"));
}

TEST(time_utils, truncate_to_day_floors) {
  EXPECT_EQ(synth::truncate_to_day(86'400 + 3600), 86'400);
  EXPECT_EQ(synth::truncate_to_day(0), 0);
  EXPECT_EQ(synth::truncate_to_day(-1), -86'400);
}

TEST(time_utils, epoch_round_trip) {
  synth::DateTimeParts p{1999, 12, 31, 23, 59, 58};
  const auto secs = synth::to_epoch_seconds(p);
  const auto q = synth::from_epoch_seconds(secs);
  EXPECT_EQ(q.year, 1999);
  EXPECT_EQ(q.month, 12u);
  EXPECT_EQ(q.day, 31u);
  EXPECT_EQ(q.hour, 23);
  EXPECT_EQ(q.minute, 59);
  EXPECT_EQ(q.second, 58);
}

TEST(time_utils, formatting) {
  EXPECT_EQ(synth::format_date(0), "1/1/1970");
  EXPECT_EQ(synth::format_date(*synth::parse_datetime("2021-03-07")),
            "3/7/2021");
  EXPECT_EQ(synth::format_iso_datetime(3723), "1970-01-01 01:02:03");
}
