#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "synth/histogram.hpp"

namespace synth {

// Settings shared by build_pattern and synthesize_column. Flags given on
// the command line override the file.
struct SynthConfig {
  int bin_count = DEFAULT_BIN_COUNT;          // bins for range columns
  std::uint64_t seed = 0;                     // 0 = random_device
  std::vector<std::string> categorical_columns;
  char delimiter = ',';                       // CSV input delimiter
  std::string timing_log;                     // empty = no report

  bool is_categorical(const std::string& column) const;
};

// Load a JSON config. Missing keys keep their defaults.
// Throws std::runtime_error on an unreadable file, malformed JSON or a
// value of the wrong shape.
SynthConfig LoadSynthConfig(const std::string& path);

}  // namespace synth
