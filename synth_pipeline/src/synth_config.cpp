// synth_config.cpp
//
// JSON tool configuration, e.g.
//
//   {"bin_count": 20, "seed": 7, "categorical_columns": ["zip"],
//    "delimiter": ";", "timing_log": "logs/timing_log.txt"}

#include "synth/synth_config.hpp"

#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

using nlohmann::json;

namespace synth {

bool SynthConfig::is_categorical(const std::string& column) const {
  return std::find(categorical_columns.begin(), categorical_columns.end(),
                   column) != categorical_columns.end();
}

SynthConfig LoadSynthConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Failed to open synth config: " + path);
  }

  SynthConfig cfg;
  try {
    json j;
    in >> j;
    if (!j.is_object()) {
      throw std::runtime_error("synth config is not a JSON object: " + path);
    }

    cfg.bin_count = j.value("bin_count", cfg.bin_count);
    cfg.seed = j.value("seed", cfg.seed);
    cfg.categorical_columns =
        j.value("categorical_columns", cfg.categorical_columns);
    cfg.timing_log = j.value("timing_log", cfg.timing_log);

    const std::string delim = j.value("delimiter", std::string(1, cfg.delimiter));
    if (delim.size() != 1) {
      throw std::runtime_error("delimiter must be a single character");
    }
    cfg.delimiter = delim.front();
  } catch (const json::exception& e) {
    throw std::runtime_error("Malformed synth config " + path + ": " +
                             e.what());
  }

  if (cfg.bin_count <= 0) {
    throw std::runtime_error("bin_count must be > 0 in " + path);
  }
  return cfg;
}

}  // namespace synth
