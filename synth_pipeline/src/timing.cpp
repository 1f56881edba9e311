#include "synth/timing.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>

namespace synth {

TimingRegistry& TimingRegistry::Instance() {
  static TimingRegistry instance;
  return instance;
}

void TimingRegistry::Add(std::string name,
                         std::chrono::steady_clock::duration d,
                         std::uint64_t rows) {
  std::lock_guard<std::mutex> lock(mu_);
  entries_.push_back(TimingEntry{std::move(name), d, rows});
}

std::vector<TimingEntry> TimingRegistry::Entries() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_;
}

void TimingRegistry::Clear() {
  std::lock_guard<std::mutex> lock(mu_);
  entries_.clear();
}

namespace {

double DurationMillis(const std::chrono::steady_clock::duration& d) {
  using ms = std::chrono::duration<double, std::milli>;
  return std::chrono::duration_cast<ms>(d).count();
}

}  // namespace

void WriteTimingReport(const std::string& out_path,
                       const std::string& program_name,
                       const std::vector<std::string>& args,
                       bool append) {
  std::filesystem::path p(out_path);
  if (p.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(p.parent_path(), ec);
    if (ec) {
      std::cerr << "Warning: failed to create timing directory: "
                << ec.message() << "\n";
    }
  }

  std::ios_base::openmode mode = std::ios::out;
  if (append) mode |= std::ios::app;

  std::ofstream out(out_path, mode);
  if (!out) {
    std::cerr << "Warning: failed to open timing report file: " << out_path
              << "\n";
    return;
  }

  out << "\n" << std::string(60, '=') << "\n";

  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  out << "timestamp: " << std::put_time(std::localtime(&t), "%F %T") << "\n";
  out << "program: " << program_name << "\n";
  out << "args:";
  for (const auto& a : args) out << " " << a;
  out << "\n\n";

  out << std::left << std::setw(40) << "step"
      << std::right << std::setw(15) << "ms"
      << std::right << std::setw(12) << "rows"
      << std::right << std::setw(15) << "rows/s"
      << "\n";
  out << std::string(82, '-') << "\n";

  double total_ms = 0.0;
  std::uint64_t total_rows = 0;
  for (const auto& e : TimingRegistry::Instance().Entries()) {
    const double ms = DurationMillis(e.duration);
    total_ms += ms;
    total_rows += e.rows;
    out << std::left << std::setw(40) << e.name
        << std::right << std::setw(15) << std::fixed << std::setprecision(3)
        << ms;
    if (e.rows == 0) {
      out << std::right << std::setw(12) << "-"
          << std::right << std::setw(15) << "-";
    } else {
      out << std::right << std::setw(12) << e.rows
          << std::right << std::setw(15) << std::fixed << std::setprecision(0)
          << (ms > 0.0 ? static_cast<double>(e.rows) * 1000.0 / ms : 0.0);
    }
    out << "\n";
  }
  out << std::string(82, '-') << "\n"
      << std::left << std::setw(40) << "sum"
      << std::right << std::setw(15) << std::fixed << std::setprecision(3)
      << total_ms
      << std::right << std::setw(12) << total_rows << "\n";
}

}  // namespace synth
