// csv_column.cpp
//
// Single-column CSV reader/writer. Input goes through zlib so plain and
// gzip-compressed files are read the same way.

#include <zlib.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "synth/column_io.hpp"

namespace fs = std::filesystem;

namespace synth {

namespace {

// Buffered line reader over gzopen(); gzread passes uncompressed input
// through unchanged.
struct GzLine {
  gzFile f{nullptr};
  std::string buf;

  explicit GzLine(const fs::path& p) {
    f = gzopen(p.string().c_str(), "rb");
    if (f) gzbuffer(f, 1 << 20);
    buf.resize(1 << 16);
  }
  ~GzLine() {
    if (f) gzclose(f);
  }
  GzLine(const GzLine&) = delete;
  GzLine& operator=(const GzLine&) = delete;

  bool good() const { return f != nullptr; }

  bool getline(std::string& out) {
    out.clear();
    if (!f) return false;
    for (;;) {
      char* r = gzgets(f, buf.data(), static_cast<int>(buf.size()));
      if (!r) return !out.empty();
      std::size_t n = std::strlen(r);
      if (n && r[n - 1] == '\n') {
        out.append(r, n - 1);
        if (!out.empty() && out.back() == '\r') out.pop_back();
        return true;
      }
      out.append(r, n);
    }
  }
};

std::string trim(const std::string& s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

bool is_missing_token(const std::string& t) {
  std::string lower(t);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return lower.empty() || lower == "na" || lower == "n/a" ||
         lower == "null" || lower == "none" || lower == "nan";
}

// Empty fields are quoted so a one-column row never becomes a blank line.
std::string quote_field(const std::string& s) {
  if (s.empty()) return "\"\"";
  if (s.find_first_of(",\"\r\n") == std::string::npos) return s;
  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += '"';
    out += c;
  }
  out += '"';
  return out;
}

}  // namespace

Value parse_token(const std::string& token) {
  const std::string t = trim(token);
  if (is_missing_token(t)) return std::monostate{};

  const char* b = t.data();
  const char* e = b + t.size();
  if (*b == '+') ++b;

  std::int64_t i = 0;
  auto ri = std::from_chars(b, e, i);
  if (ri.ec == std::errc() && ri.ptr == e) return i;

  double d = 0.0;
  auto rd = std::from_chars(b, e, d);
  if (rd.ec == std::errc() && rd.ptr == e && std::isfinite(d)) return d;

  return t;
}

std::vector<std::string> split_csv_line(const std::string& line,
                                        char delimiter) {
  std::vector<std::string> fields;
  std::string cur;
  bool quoted = false;

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quoted) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          cur += '"';
          ++i;
        } else {
          quoted = false;
        }
      } else {
        cur += c;
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == delimiter) {
      fields.push_back(std::move(cur));
      cur.clear();
    } else {
      cur += c;
    }
  }
  fields.push_back(std::move(cur));
  return fields;
}

std::vector<Value> read_csv_column(const std::string& path,
                                   const std::string& column,
                                   char delimiter) {
  GzLine gz(path);
  if (!gz.good()) throw std::runtime_error("open csv failed: " + path);

  std::string line;
  if (!gz.getline(line)) {
    throw std::runtime_error("empty csv: " + path);
  }
  const auto header = split_csv_line(line, delimiter);
  auto it = std::find_if(header.begin(), header.end(), [&](const auto& h) {
    return trim(h) == column;
  });
  if (it == header.end()) {
    throw std::runtime_error("column '" + column + "' not found in " + path);
  }
  const auto col = static_cast<std::size_t>(it - header.begin());

  std::vector<Value> out;
  while (gz.getline(line)) {
    if (line.empty()) continue;
    const auto fields = split_csv_line(line, delimiter);
    if (col < fields.size()) {
      out.push_back(parse_token(fields[col]));
    } else {
      out.emplace_back(std::monostate{});
    }
  }
  return out;
}

void write_csv_column(const std::string& path, const std::string& name,
                      const std::vector<Value>& values) {
  fs::path p(path);
  if (p.has_parent_path()) fs::create_directories(p.parent_path());

  std::ofstream out(path);
  if (!out) throw std::runtime_error("open output failed: " + path);

  out << quote_field(name) << "\n";
  for (const auto& v : values) out << quote_field(value_to_string(v)) << "\n";
  if (!out) throw std::runtime_error("write failed: " + path);
}

std::vector<Value> read_column(const std::string& path,
                               const std::string& column, char delimiter) {
  if (fs::path(path).extension() == ".parquet") {
    return read_parquet_column(path, column);
  }
  return read_csv_column(path, column, delimiter);
}

}  // namespace synth
