#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace synth {

struct TimingEntry {
  std::string name;
  std::chrono::steady_clock::duration duration;
  std::uint64_t rows = 0;  // values read or produced by the step, 0 = n/a
};

// Process-wide list of named step durations.
class TimingRegistry {
 public:
  static TimingRegistry& Instance();

  void Add(std::string name, std::chrono::steady_clock::duration d,
           std::uint64_t rows = 0);

  std::vector<TimingEntry> Entries() const;
  void Clear();

 private:
  TimingRegistry() = default;

  mutable std::mutex mu_;
  std::vector<TimingEntry> entries_;
};

class ScopeTimer {
 public:
  explicit ScopeTimer(std::string name)
      : name_(std::move(name)),
        start_(std::chrono::steady_clock::now()) {}

  ~ScopeTimer() {
    const auto end = std::chrono::steady_clock::now();
    TimingRegistry::Instance().Add(name_, end - start_, rows_);
  }

  // Row count reported next to the step (e.g. column length).
  void set_rows(std::uint64_t rows) { rows_ = rows; }

  ScopeTimer(const ScopeTimer&) = delete;
  ScopeTimer& operator=(const ScopeTimer&) = delete;

 private:
  std::string name_;
  std::chrono::steady_clock::time_point start_;
  std::uint64_t rows_ = 0;
};

#define SYNTH_CONCAT_INNER(a, b) a##b
#define SYNTH_CONCAT(a, b) SYNTH_CONCAT_INNER(a, b)

/// Helper macro so you can write: SYNTH_SCOPE_TIMER("step_name");
#define SYNTH_SCOPE_TIMER(label) \
  ::synth::ScopeTimer SYNTH_CONCAT(synth_scope_timer_, __LINE__)(label)

/// Append a timing report for the current run to a log file.
///
/// `append` defaults to true so build_pattern and synthesize_column runs
/// can share one log.
void WriteTimingReport(const std::string& out_path,
                       const std::string& program_name,
                       const std::vector<std::string>& args,
                       bool append = true);

}  // namespace synth
