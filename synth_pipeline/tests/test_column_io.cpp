#include <gtest/gtest.h>
#include <zlib.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "synth/column_io.hpp"

namespace {

using synth::Value;

std::filesystem::path temp_path(const std::string& name) {
  return std::filesystem::temp_directory_path() / ("synth_io_" + name);
}

void write_text(const std::filesystem::path& p, const std::string& text) {
  std::ofstream out(p);
  out << text;
}

void write_gz(const std::filesystem::path& p, const std::string& text) {
  gzFile f = gzopen(p.string().c_str(), "wb");
  ASSERT_NE(f, nullptr);
  ASSERT_EQ(gzwrite(f, text.data(), static_cast<unsigned>(text.size())),
            static_cast<int>(text.size()));
  gzclose(f);
}

}  // namespace

TEST(parse_token, coercion) {
  EXPECT_EQ(synth::parse_token("42"), Value{std::int64_t{42}});
  EXPECT_EQ(synth::parse_token(" -7 "), Value{std::int64_t{-7}});
  EXPECT_EQ(synth::parse_token("+3"), Value{std::int64_t{3}});
  EXPECT_EQ(synth::parse_token("2.5"), Value{2.5});
  EXPECT_EQ(synth::parse_token("1e3"), Value{1000.0});
  EXPECT_EQ(synth::parse_token("abc"), Value{std::string("abc")});
  EXPECT_EQ(synth::parse_token("2020-01-01"), Value{std::string("2020-01-01")});
  EXPECT_EQ(synth::parse_token("inf"), Value{std::string("inf")});
  for (const char* m : {"", "NA", "n/a", "NULL", "None", "nan", "  "}) {
    EXPECT_TRUE(synth::is_missing(synth::parse_token(m))) << m;
  }
}

TEST(split_csv_line, quotes_and_delimiters) {
  const auto f = synth::split_csv_line(R"(a,"b,c","say ""hi""",)", ',');
  ASSERT_EQ(f.size(), 4u);
  EXPECT_EQ(f[0], "a");
  EXPECT_EQ(f[1], "b,c");
  EXPECT_EQ(f[2], "say \"hi\"");
  EXPECT_EQ(f[3], "");

  const auto g = synth::split_csv_line("1;2", ';');
  ASSERT_EQ(g.size(), 2u);
  EXPECT_EQ(g[1], "2");
}

TEST(read_csv_column, plain_file) {
  const auto p = temp_path("plain.csv");
  write_text(p, "id,name,score\r\n1,alice,3.5\r\n2,\"bob, jr\",NA\r\n3,carol,4\r\n");

  const auto names = synth::read_csv_column(p.string(), "name");
  ASSERT_EQ(names.size(), 3u);
  EXPECT_EQ(names[1], Value{std::string("bob, jr")});

  const auto scores = synth::read_csv_column(p.string(), "score");
  EXPECT_EQ(scores[0], Value{3.5});
  EXPECT_TRUE(synth::is_missing(scores[1]));
  EXPECT_EQ(scores[2], Value{std::int64_t{4}});

  EXPECT_THROW(synth::read_csv_column(p.string(), "nope"), std::runtime_error);
  std::filesystem::remove(p);
}

TEST(read_csv_column, gzip_file) {
  const auto p = temp_path("packed.csv.gz");
  write_gz(p, "a;b\n1;x\n2;y\n;z\n");

  const auto a = synth::read_csv_column(p.string(), "a", ';');
  ASSERT_EQ(a.size(), 3u);
  EXPECT_EQ(a[0], Value{std::int64_t{1}});
  EXPECT_TRUE(synth::is_missing(a[2]));

  const auto b = synth::read_column(p.string(), "b", ';');
  EXPECT_EQ(b[2], Value{std::string("z")});
  std::filesystem::remove(p);
}

TEST(read_csv_column, missing_file) {
  EXPECT_THROW(synth::read_csv_column(temp_path("absent.csv").string(), "a"),
               std::runtime_error);
}

TEST(write_csv_column, writes_header_and_values) {
  const auto p = temp_path("out.csv");
  synth::write_csv_column(p.string(), "v",
                          {Value{std::int64_t{1}}, Value{2.5},
                           Value{std::string("a,b")}, Value{}});

  const auto back = synth::read_csv_column(p.string(), "v");
  ASSERT_EQ(back.size(), 4u);
  EXPECT_EQ(back[0], Value{std::int64_t{1}});
  EXPECT_EQ(back[1], Value{2.5});
  EXPECT_EQ(back[2], Value{std::string("a,b")});
  EXPECT_TRUE(synth::is_missing(back[3]));
  std::filesystem::remove(p);
}

TEST(parquet_column, write_then_read) {
  const auto p = temp_path("col.parquet");
  synth::write_parquet_column(p.string(), "n", synth::AttrType::Integer,
                              {Value{std::int64_t{5}}, Value{}, Value{7.0}});

  const auto back = synth::read_column(p.string(), "n");
  ASSERT_EQ(back.size(), 3u);
  EXPECT_EQ(back[0], Value{std::int64_t{5}});
  EXPECT_TRUE(synth::is_missing(back[1]));
  EXPECT_EQ(back[2], Value{std::int64_t{7}});

  EXPECT_THROW(synth::read_parquet_column(p.string(), "missing"),
               std::runtime_error);
  std::filesystem::remove(p);
}

TEST(parquet_column, strings_and_type_mismatch) {
  const auto p = temp_path("names.parquet");
  synth::write_parquet_column(p.string(), "d", synth::AttrType::Datetime,
                              {Value{std::string("3/7/2021")}});
  const auto back = synth::read_parquet_column(p.string(), "d");
  ASSERT_EQ(back.size(), 1u);
  EXPECT_EQ(back[0], Value{std::string("3/7/2021")});

  EXPECT_THROW(synth::write_parquet_column(p.string(), "f", synth::AttrType::Float,
                                           {Value{std::string("x")}}),
               std::runtime_error);
  std::filesystem::remove(p);
}
