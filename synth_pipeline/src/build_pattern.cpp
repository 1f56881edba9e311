// build_pattern.cpp
//
// CLI: learn per-column patterns from a CSV / CSV.GZ / Parquet file and
// write them as a pattern JSON document.

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "synth/attribute.hpp"
#include "synth/column_io.hpp"
#include "synth/pattern_json.hpp"
#include "synth/synth_config.hpp"
#include "synth/timing.hpp"

namespace {

struct BuildArgs {
  std::string in_path;
  std::vector<std::string> columns;
  std::string out_path;
  std::string config_path;
  bool categorical = false;
  int bin_count = 0;  // 0 = config / default
  std::vector<std::string> domain;
};

void usage_and_exit(const char* argv0) {
  std::fprintf(stderr,
               R"(Usage:
  %s --in <file.csv|file.csv.gz|file.parquet> --column <name[,name...]> --out <pattern.json>
     [--categorical] [--bins <N>] [--domain <v1,v2,...>] [--config <cfg.json>]

Description:
  Reads the named column(s), infers type, categorical flag and a binned
  distribution for each, and writes the patterns as JSON. --domain
  replaces the domain of a single column: [min,max] for ranges, the
  category list otherwise.

Example:
  %s --in data/people.csv.gz --column age,zip --out patterns/people.json --bins 20
)",
               argv0, argv0);
  std::exit(2);
}

std::vector<std::string> split_list(const std::string& s) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

BuildArgs parse_args(int argc, char** argv) {
  BuildArgs args;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--in" && i + 1 < argc) {
      args.in_path = argv[++i];
    } else if (a == "--column" && i + 1 < argc) {
      args.columns = split_list(argv[++i]);
    } else if (a == "--out" && i + 1 < argc) {
      args.out_path = argv[++i];
    } else if (a == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (a == "--categorical") {
      args.categorical = true;
    } else if (a == "--bins" && i + 1 < argc) {
      char* end = nullptr;
      const long n = std::strtol(argv[++i], &end, 10);
      if (*end != '\0' || n <= 0) usage_and_exit(argv[0]);
      args.bin_count = static_cast<int>(n);
    } else if (a == "--domain" && i + 1 < argc) {
      args.domain = split_list(argv[++i]);
    } else if (a == "--help" || a == "-h") {
      usage_and_exit(argv[0]);
    } else {
      std::fprintf(stderr, "Unknown or incomplete arg: %s\n", a.c_str());
      usage_and_exit(argv[0]);
    }
  }

  if (args.in_path.empty() || args.columns.empty() || args.out_path.empty()) {
    usage_and_exit(argv[0]);
  }
  if (!args.domain.empty() && args.columns.size() != 1) {
    std::fprintf(stderr, "--domain needs exactly one --column\n");
    usage_and_exit(argv[0]);
  }
  return args;
}

}  // namespace

int main(int argc, char** argv) {
  const BuildArgs args = parse_args(argc, argv);

  try {
    synth::SynthConfig cfg;
    if (!args.config_path.empty()) {
      SYNTH_SCOPE_TIMER("load_config");
      cfg = synth::LoadSynthConfig(args.config_path);
    }
    if (args.bin_count > 0) cfg.bin_count = args.bin_count;

    std::vector<synth::AttributePattern> patterns;
    {
      SYNTH_SCOPE_TIMER("build_patterns");
      for (const auto& column : args.columns) {
        std::vector<synth::Value> values;
        {
          synth::ScopeTimer timer("read_column:" + column);
          values = synth::read_column(args.in_path, column, cfg.delimiter);
          timer.set_rows(values.size());
        }

        synth::AttributeOptions opts;
        opts.categorical = args.categorical || cfg.is_categorical(column);
        opts.bin_count = cfg.bin_count;

        synth::ScopeTimer timer("pattern:" + column);
        timer.set_rows(values.size());
        synth::Attribute attr(column, std::move(values), opts);
        if (!args.domain.empty()) {
          std::vector<synth::Value> domain;
          domain.reserve(args.domain.size());
          for (const auto& d : args.domain) {
            domain.push_back(synth::parse_token(d));
          }
          attr.set_domain(domain);
        }

        std::cout << "[build_pattern] " << column << ": "
                  << synth::to_string(attr.type())
                  << (attr.categorical() ? " categorical" : "")
                  << ", rows=" << attr.size()
                  << ", bins=" << attr.bins().size() << "\n";
        patterns.push_back(attr.to_pattern());
      }
    }

    {
      SYNTH_SCOPE_TIMER("write_json");
      synth::save_pattern_file(args.out_path, patterns);
    }
    std::cout << "[build_pattern] wrote " << args.out_path << "\n";

    if (!cfg.timing_log.empty()) {
      synth::WriteTimingReport(cfg.timing_log, "build_pattern",
                               std::vector<std::string>(argv + 1, argv + argc));
    }
  } catch (const std::exception& e) {
    std::fprintf(stderr, "FATAL: %s\n", e.what());
    return 1;
  }
  return 0;
}
