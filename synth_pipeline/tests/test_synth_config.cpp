#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "synth/synth_config.hpp"

namespace {

std::filesystem::path write_config(const std::string& name,
                                   const std::string& text) {
  const auto p = std::filesystem::temp_directory_path() / ("synth_cfg_" + name);
  std::ofstream out(p);
  out << text;
  return p;
}

}  // namespace

TEST(synth_config, defaults_for_missing_keys) {
  const auto p = write_config("empty.json", "{}");
  const auto cfg = synth::LoadSynthConfig(p.string());
  EXPECT_EQ(cfg.bin_count, synth::DEFAULT_BIN_COUNT);
  EXPECT_EQ(cfg.seed, 0u);
  EXPECT_EQ(cfg.delimiter, ',');
  EXPECT_TRUE(cfg.categorical_columns.empty());
  EXPECT_TRUE(cfg.timing_log.empty());
  std::filesystem::remove(p);
}

TEST(synth_config, reads_all_fields) {
  const auto p = write_config(
      "full.json",
      R"({"bin_count": 8, "seed": 42, "categorical_columns": ["zip", "sex"],
          "delimiter": ";", "timing_log": "logs/t.txt"})");
  const auto cfg = synth::LoadSynthConfig(p.string());
  EXPECT_EQ(cfg.bin_count, 8);
  EXPECT_EQ(cfg.seed, 42u);
  EXPECT_EQ(cfg.delimiter, ';');
  EXPECT_EQ(cfg.timing_log, "logs/t.txt");
  EXPECT_TRUE(cfg.is_categorical("zip"));
  EXPECT_FALSE(cfg.is_categorical("age"));
  std::filesystem::remove(p);
}

TEST(synth_config, rejects_bad_files) {
  EXPECT_THROW(synth::LoadSynthConfig("/nonexistent/synth.json"),
               std::runtime_error);

  const auto malformed = write_config("malformed.json", "{\"seed\": ");
  EXPECT_THROW(synth::LoadSynthConfig(malformed.string()), std::runtime_error);
  std::filesystem::remove(malformed);

  const auto wrong = write_config("wrong.json", R"({"bin_count": "many"})");
  EXPECT_THROW(synth::LoadSynthConfig(wrong.string()), std::runtime_error);
  std::filesystem::remove(wrong);

  const auto zero = write_config("zero.json", R"({"bin_count": 0})");
  EXPECT_THROW(synth::LoadSynthConfig(zero.string()), std::runtime_error);
  std::filesystem::remove(zero);

  const auto delim = write_config("delim.json", R"({"delimiter": "ab"})");
  EXPECT_THROW(synth::LoadSynthConfig(delim.string()), std::runtime_error);
  std::filesystem::remove(delim);
}
