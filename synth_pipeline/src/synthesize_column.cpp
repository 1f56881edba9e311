// synthesize_column.cpp
//
// CLI: load a pattern JSON document and write one synthesized column as
// CSV or Parquet.
//
//  - choice       : values drawn bin-wise by the learned probabilities
//  - random       : evenly spaced values over the learned range
//  - pseudonymize : masked values (SHA-1 hex) of resampled bins

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "synth/attribute.hpp"
#include "synth/column_io.hpp"
#include "synth/pattern_json.hpp"
#include "synth/synth_config.hpp"
#include "synth/timing.hpp"

namespace {

struct SynthArgs {
  std::string pattern_path;
  std::string column;  // empty = the only / first pattern
  std::string mode = "choice";
  std::size_t size = 0;
  std::string out_path;
  std::string config_path;
  std::uint64_t seed = 0;
  bool has_seed = false;
};

void usage_and_exit(const char* argv0) {
  std::fprintf(stderr,
               R"(Usage:
  %s --pattern <pattern.json> --mode <choice|random|pseudonymize> --size <N>
     --out <file.csv|file.parquet> [--column <name>] [--seed <S>] [--config <cfg.json>]

Description:
  Synthesizes N values of one column from its learned pattern. With a
  multi-column pattern file, --column picks the attribute (default: first).

Example:
  %s --pattern patterns/people.json --column age --mode choice \
     --size 10000 --seed 42 --out synth/age.parquet
)",
               argv0, argv0);
  std::exit(2);
}

SynthArgs parse_args(int argc, char** argv) {
  SynthArgs args;
  bool has_size = false;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--pattern" && i + 1 < argc) {
      args.pattern_path = argv[++i];
    } else if (a == "--column" && i + 1 < argc) {
      args.column = argv[++i];
    } else if (a == "--mode" && i + 1 < argc) {
      args.mode = argv[++i];
    } else if (a == "--size" && i + 1 < argc) {
      char* end = nullptr;
      const unsigned long long n = std::strtoull(argv[++i], &end, 10);
      if (*end != '\0') usage_and_exit(argv[0]);
      args.size = static_cast<std::size_t>(n);
      has_size = true;
    } else if (a == "--out" && i + 1 < argc) {
      args.out_path = argv[++i];
    } else if (a == "--seed" && i + 1 < argc) {
      char* end = nullptr;
      args.seed = std::strtoull(argv[++i], &end, 10);
      if (*end != '\0') usage_and_exit(argv[0]);
      args.has_seed = true;
    } else if (a == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (a == "--help" || a == "-h") {
      usage_and_exit(argv[0]);
    } else {
      std::fprintf(stderr, "Unknown or incomplete arg: %s\n", a.c_str());
      usage_and_exit(argv[0]);
    }
  }

  if (args.pattern_path.empty() || args.out_path.empty() || !has_size) {
    usage_and_exit(argv[0]);
  }
  if (args.mode != "choice" && args.mode != "random" &&
      args.mode != "pseudonymize") {
    std::fprintf(stderr, "Unknown mode: %s\n", args.mode.c_str());
    usage_and_exit(argv[0]);
  }
  return args;
}

const synth::AttributePattern& pick_pattern(
    const std::vector<synth::AttributePattern>& patterns,
    const std::string& column) {
  if (patterns.empty()) {
    throw std::runtime_error("pattern file holds no attributes");
  }
  if (column.empty()) return patterns.front();
  for (const auto& p : patterns) {
    if (p.name == column) return p;
  }
  throw std::runtime_error("no pattern for column '" + column + "'");
}

}  // namespace

int main(int argc, char** argv) {
  const SynthArgs args = parse_args(argc, argv);

  try {
    synth::SynthConfig cfg;
    if (!args.config_path.empty()) {
      SYNTH_SCOPE_TIMER("load_config");
      cfg = synth::LoadSynthConfig(args.config_path);
    }
    const std::uint64_t seed = args.has_seed ? args.seed : cfg.seed;
    std::mt19937_64 rng(seed != 0 ? seed : std::random_device{}());

    std::vector<synth::AttributePattern> patterns;
    {
      SYNTH_SCOPE_TIMER("load_patterns");
      patterns = synth::load_pattern_file(args.pattern_path);
    }
    const synth::Attribute attr(pick_pattern(patterns, args.column));

    std::vector<synth::Value> values;
    synth::AttrType out_type = attr.type();
    {
      synth::ScopeTimer timer("synthesize:" + args.mode);
      timer.set_rows(args.size);
      if (args.mode == "choice") {
        values = attr.choice(args.size, rng);
      } else if (args.mode == "random") {
        values = attr.random(args.size, rng);
      } else {
        const auto masked = attr.pseudonymize(args.size, rng);
        values.assign(masked.begin(), masked.end());
        out_type = synth::AttrType::String;
      }
    }

    {
      synth::ScopeTimer timer("write_output");
      timer.set_rows(values.size());
      if (std::filesystem::path(args.out_path).extension() == ".parquet") {
        synth::write_parquet_column(args.out_path, attr.name(), out_type,
                                    values);
      } else {
        synth::write_csv_column(args.out_path, attr.name(), values);
      }
    }
    std::cout << "[synthesize_column] " << attr.name() << ": wrote "
              << values.size() << " values (" << args.mode << ") to "
              << args.out_path << "\n";

    if (!cfg.timing_log.empty()) {
      synth::WriteTimingReport(cfg.timing_log, "synthesize_column",
                               std::vector<std::string>(argv + 1, argv + argc));
    }
  } catch (const std::exception& e) {
    std::fprintf(stderr, "FATAL: %s\n", e.what());
    return 1;
  }
  return 0;
}
