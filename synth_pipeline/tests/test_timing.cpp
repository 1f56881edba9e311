#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "synth/timing.hpp"

TEST(timing_registry, scope_timer_records_rows) {
  auto& reg = synth::TimingRegistry::Instance();
  reg.Clear();
  {
    synth::ScopeTimer timer("read_column:age");
    timer.set_rows(1234);
  }
  {
    SYNTH_SCOPE_TIMER("load_config");
  }

  const auto entries = reg.Entries();
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].name, "read_column:age");
  EXPECT_EQ(entries[0].rows, 1234u);
  EXPECT_EQ(entries[1].name, "load_config");
  EXPECT_EQ(entries[1].rows, 0u);
  reg.Clear();
}

TEST(timing_report, lists_steps_and_rows) {
  auto& reg = synth::TimingRegistry::Instance();
  reg.Clear();
  {
    synth::ScopeTimer timer("synthesize:choice");
    timer.set_rows(500);
  }

  const auto path =
      std::filesystem::temp_directory_path() / "synth_timing_report.txt";
  std::filesystem::remove(path);
  synth::WriteTimingReport(path.string(), "synthesize_column",
                           {"--size", "500"}, false);

  std::ifstream in(path);
  ASSERT_TRUE(in.good());
  std::stringstream ss;
  ss << in.rdbuf();
  const std::string text = ss.str();
  EXPECT_NE(text.find("program: synthesize_column"), std::string::npos);
  EXPECT_NE(text.find("args: --size 500"), std::string::npos);
  EXPECT_NE(text.find("synthesize:choice"), std::string::npos);
  EXPECT_NE(text.find("500"), std::string::npos);
  EXPECT_NE(text.find("rows"), std::string::npos);

  std::filesystem::remove(path);
  reg.Clear();
}
