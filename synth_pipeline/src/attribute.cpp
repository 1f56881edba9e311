// attribute.cpp
//
// Implements Attribute: pattern computation from raw values (type, domain,
// binned distribution), pattern install, indexing/encoding and the three
// synthesizers (random, choice, pseudonymize).

#include "synth/attribute.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

#include "synth/text_utils.hpp"
#include "synth/time_utils.hpp"
#include "synth/type_inference.hpp"

namespace synth {

namespace {

// 1e-8 keeps values sitting exactly on max inside the last encoded bin.
constexpr double ENCODE_EPS = 1e-8;

double round_percent(double x) { return std::round(x * 100.0) / 100.0; }

double round_to(double x, std::optional<int> decimals) {
  if (!decimals) return x;
  const double scale = std::pow(10.0, *decimals);
  return std::round(x * scale) / scale;
}

// Round to `decimals` places without leaving [lo, hi]: a value rounded past
// a bound moves to the nearest representable value inside it, or to the
// bound itself when no such value exists.
double round_within(double x, std::optional<int> decimals, double lo,
                    double hi) {
  if (!decimals) return std::clamp(x, lo, hi);
  const double scale = std::pow(10.0, *decimals);
  double r = round_to(x, decimals);
  if (r > hi) r = std::floor(hi * scale) / scale;
  if (r < lo) r = std::ceil(lo * scale) / scale;
  return std::clamp(r, lo, hi);
}

Value to_value(const Bin& b) {
  if (const auto* s = std::get_if<std::string>(&b)) return *s;
  return std::get<double>(b);
}

std::optional<double> parse_number(const std::string& s) {
  const char* b = s.data();
  const char* e = b + s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(*b))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(*(e - 1)))) --e;
  if (b < e && *b == '+') ++b;
  double out = 0.0;
  auto [p, ec] = std::from_chars(b, e, out);
  if (ec != std::errc{} || p != e || b == e) return std::nullopt;
  return out;
}

double as_double(const Value& v) {
  if (const auto* i = std::get_if<std::int64_t>(&v)) {
    return static_cast<double>(*i);
  }
  return std::get<double>(v);
}

}  // namespace

Attribute::Attribute(std::string name, std::vector<Value> values,
                     AttributeOptions opts)
    : name_(std::move(name)),
      raw_(std::move(values)),
      has_data_(true),
      forced_categorical_(opts.categorical),
      bin_count_(opts.bin_count) {
  if (bin_count_ <= 0) {
    throw std::invalid_argument("Attribute '" + name_ +
                                "': bin_count must be > 0");
  }
  set_pattern();
}

Attribute::Attribute(const AttributePattern& pattern) : name_(pattern.name) {
  set_pattern(pattern);
}

void Attribute::set_pattern() {
  if (state_ == PatternState::Computed) return;
  require_data("set_pattern");
  compute_pattern();
  state_ = PatternState::Computed;
}

void Attribute::set_pattern(const AttributePattern& pattern) {
  if (state_ == PatternState::Computed) return;
  apply_pattern(pattern);
  state_ = PatternState::Computed;
}

void Attribute::compute_pattern() {
  type_ = infer_type(raw_);
  const std::vector<Value> filled = fill_missing_with_mode(raw_);

  numbers_.clear();
  texts_.clear();
  numbers_.reserve(filled.size());

  switch (type_) {
    case AttrType::Integer:
    case AttrType::Float:
      for (const auto& v : filled) numbers_.push_back(as_double(v));
      break;
    case AttrType::String:
      texts_.reserve(filled.size());
      for (const auto& v : filled) {
        texts_.push_back(value_to_string(v));
        numbers_.push_back(static_cast<double>(texts_.back().size()));
      }
      break;
    case AttrType::Datetime:
      for (const auto& v : filled) {
        const auto secs = parse_datetime(value_to_string(v));
        if (!secs) {
          throw std::runtime_error("Attribute '" + name_ +
                                   "': unparseable datetime '" +
                                   value_to_string(v) + "'");
        }
        numbers_.push_back(static_cast<double>(truncate_to_day(*secs)));
      }
      break;
  }

  decimals_.reset();
  if (type_ == AttrType::Float) {
    decimals_ = float_decimals(numbers_);
  }

  if (type_ == AttrType::String) {
    const std::vector<Value> text_values(texts_.begin(), texts_.end());
    categorical_ =
        infer_categorical(type_, text_values, forced_categorical_);
  } else {
    categorical_ = infer_categorical(type_, filled, forced_categorical_);
  }

  const auto [lo, hi] = std::minmax_element(numbers_.begin(), numbers_.end());
  min_ = *lo;
  max_ = *hi;
  set_distribution({});
}

void Attribute::apply_pattern(const AttributePattern& pattern) {
  if (pattern.bins.size() != pattern.prs.size()) {
    throw std::invalid_argument("pattern '" + pattern.name +
                                "': bins and prs differ in length");
  }
  if (pattern.bins.empty()) {
    throw std::invalid_argument("pattern '" + pattern.name +
                                "': no bins");
  }
  if (!pattern.categorical) {
    const bool numeric_edges =
        std::all_of(pattern.bins.begin(), pattern.bins.end(),
                    [](const Bin& b) { return std::holds_alternative<double>(b); });
    if (!numeric_edges) {
      throw std::invalid_argument("pattern '" + pattern.name +
                                  "': range bins must be numeric");
    }
  }

  name_ = pattern.name;
  type_ = pattern.type;
  categorical_ = pattern.categorical;
  decimals_ = type_ == AttrType::Float ? pattern.decimals : std::nullopt;
  min_ = pattern.min;
  max_ = pattern.max;
  bins_ = pattern.bins;
  prs_ = pattern.prs;
  counts_.clear();
  if (!categorical_) {
    bin_count_ = static_cast<int>(bins_.size());
  }
}

void Attribute::set_distribution(const std::vector<Bin>& declared) {
  if (categorical_) {
    // Keys are numbers (datetimes as epoch seconds) or strings; the map
    // gives the sorted bin order.
    std::map<Bin, std::uint64_t> tally;
    for (std::size_t i = 0; i < numbers_.size(); ++i) {
      if (type_ == AttrType::String) {
        ++tally[Bin{texts_[i]}];
      } else {
        ++tally[Bin{numbers_[i]}];
      }
    }
    for (const auto& b : declared) tally.try_emplace(b, 0);

    bins_.clear();
    counts_.clear();
    for (const auto& [key, n] : tally) {
      if (type_ == AttrType::Datetime) {
        bins_.emplace_back(
            format_date(static_cast<std::int64_t>(std::get<double>(key))));
      } else {
        bins_.push_back(key);
      }
      counts_.push_back(n);
    }
  } else {
    // Integer ranges are whole numbers; every edge stays within [min, max].
    if (type_ == AttrType::Integer) {
      min_ = std::floor(min_);
      max_ = std::ceil(max_);
    }
    Histogram h = build_histogram(numbers_, min_, max_, bin_count_);
    bins_.assign(h.edges.begin(), h.edges.end());
    counts_ = std::move(h.counts);
  }
  prs_ = normalize_distribution(counts_);
}

AttributePattern Attribute::to_pattern() const {
  AttributePattern p;
  p.name = name_;
  p.type = type_;
  p.categorical = categorical_;
  p.min = min_;
  p.max = max_;
  if (type_ == AttrType::Float) p.decimals = decimals_;
  p.bins = bins_;
  p.prs = prs_;
  return p;
}

std::vector<Bin> Attribute::domain() const {
  if (categorical_) return bins_;
  return {Bin{min_}, Bin{max_}};
}

void Attribute::set_domain(const std::vector<Value>& domain) {
  require_data("set_domain");
  if (domain.empty()) {
    throw std::invalid_argument("set_domain: empty domain for '" + name_ + "'");
  }

  // Numeric columns given a longer list are coded identifiers.
  if (is_numerical() && !categorical_ && domain.size() > 2) {
    categorical_ = true;
  }

  std::vector<double> extent;
  extent.reserve(domain.size());

  if (categorical_) {
    std::vector<Bin> declared;
    declared.reserve(domain.size());
    for (const auto& v : domain) {
      if (is_missing(v)) {
        throw std::invalid_argument("set_domain: missing entry in domain of '" +
                                    name_ + "'");
      }
      if (type_ == AttrType::String) {
        std::string s = value_to_string(v);
        extent.push_back(static_cast<double>(s.size()));
        declared.emplace_back(std::move(s));
        continue;
      }
      const auto x = number_for(v);
      if (!x) {
        throw std::invalid_argument("set_domain: '" + value_to_string(v) +
                                    "' is not a valid " + to_string(type_) +
                                    " value");
      }
      extent.push_back(*x);
      declared.emplace_back(*x);
    }
    const auto [lo, hi] = std::minmax_element(extent.begin(), extent.end());
    min_ = *lo;
    max_ = *hi;
    set_distribution(declared);
    return;
  }

  for (const auto& v : domain) {
    std::optional<double> x;
    if (type_ == AttrType::String && !std::holds_alternative<std::string>(v)) {
      // A string range may be given directly as lengths.
      if (!is_missing(v)) x = as_double(v);
    } else {
      x = number_for(v);
    }
    if (!x) {
      throw std::invalid_argument("set_domain: '" + value_to_string(v) +
                                  "' is not a valid bound for '" + name_ + "'");
    }
    extent.push_back(*x);
  }

  if (type_ == AttrType::String) {
    const auto [lo, hi] = std::minmax_element(extent.begin(), extent.end());
    min_ = *lo;
    max_ = *hi;
  } else {
    if (extent.size() != 2) {
      throw std::invalid_argument(
          "set_domain: expected [min, max] for non-categorical '" + name_ +
          "', got " + std::to_string(extent.size()) + " values");
    }
    if (extent[0] > extent[1]) {
      throw std::invalid_argument("set_domain: min > max for '" + name_ + "'");
    }
    min_ = extent[0];
    max_ = extent[1];
  }
  set_distribution({});
}

std::vector<double> Attribute::counts(const std::vector<Bin>& bins,
                                      bool normalize) const {
  require_data("counts");
  std::vector<double> out;
  out.reserve(bins.size());

  if (categorical_) {
    std::map<Bin, std::uint64_t> tally;
    for (std::size_t i = 0; i < numbers_.size(); ++i) ++tally[key_at(i)];
    const double total = static_cast<double>(numbers_.size());

    for (const auto& b : bins) {
      std::uint64_t c = 0;
      if (const auto key = key_for(to_value(b))) {
        const auto it = tally.find(*key);
        if (it != tally.end()) c = it->second;
      }
      out.push_back(normalize ? round_percent(static_cast<double>(c) / total * 100.0)
                              : static_cast<double>(c));
    }
    return out;
  }

  if (bins.size() == 1) {
    return {static_cast<double>(numbers_.size())};
  }

  std::vector<double> edges;
  edges.reserve(bins.size());
  for (const auto& b : bins) {
    std::optional<double> x;
    if (const auto* d = std::get_if<double>(&b)) {
      x = *d;
    } else {
      x = number_for(to_value(b));
    }
    if (!x) {
      throw std::invalid_argument("counts: bin '" + bin_to_string(b, type_) +
                                  "' is not a valid edge for '" + name_ + "'");
    }
    edges.push_back(*x);
  }

  const auto hist = histogram_counts(numbers_, edges);
  const std::uint64_t total =
      std::accumulate(hist.begin(), hist.end(), std::uint64_t{0});
  for (std::uint64_t h : hist) {
    if (!normalize) {
      out.push_back(static_cast<double>(h));
    } else if (total == 0) {
      out.push_back(0.0);
    } else {
      out.push_back(round_percent(static_cast<double>(h) /
                                  static_cast<double>(total) * 100.0));
    }
  }
  return out;
}

std::vector<int> Attribute::bin_indexes() const {
  require_data("bin_indexes");
  std::vector<int> out(numbers_.size());
  const int sentinel = static_cast<int>(bins_.size());

  if (categorical_) {
    const auto lookup = key_lookup();
    for (std::size_t i = 0; i < numbers_.size(); ++i) {
      const auto it = lookup.find(key_at(i));
      out[i] = it == lookup.end() ? sentinel : it->second;
    }
  } else {
    const auto edges = edge_values();
    for (std::size_t i = 0; i < numbers_.size(); ++i) {
      out[i] = edge_index(edges, numbers_[i]);
    }
  }
  return out;
}

std::vector<int> Attribute::bin_indexes(const std::vector<Value>& values) const {
  std::vector<int> out(values.size());
  const int sentinel = static_cast<int>(bins_.size());

  if (categorical_) {
    const auto lookup = key_lookup();
    for (std::size_t i = 0; i < values.size(); ++i) {
      const auto key = key_for(values[i]);
      const auto it = key ? lookup.find(*key) : lookup.end();
      out[i] = it == lookup.end() ? sentinel : it->second;
    }
  } else {
    const auto edges = edge_values();
    for (std::size_t i = 0; i < values.size(); ++i) {
      const auto x = number_for(values[i]);
      out[i] = x ? edge_index(edges, *x) : sentinel;
    }
  }
  return out;
}

EncodedColumns Attribute::encode() const {
  if (!categorical_ && type_ == AttrType::String) {
    throw std::logic_error("encode: non-categorical string attribute '" +
                           name_ + "' has no numeric encoding");
  }
  require_data("encode");

  EncodedColumns enc;
  if (categorical_) {
    enc.names.reserve(bins_.size());
    enc.columns.assign(bins_.size(), std::vector<double>(numbers_.size(), 0.0));
    for (std::size_t j = 0; j < bins_.size(); ++j) {
      enc.names.push_back(bin_to_string(bins_[j], type_));
    }
    const auto lookup = key_lookup();
    for (std::size_t i = 0; i < numbers_.size(); ++i) {
      const auto it = lookup.find(key_at(i));
      if (it != lookup.end()) {
        enc.columns[static_cast<std::size_t>(it->second)][i] = 1.0;
      }
    }
    return enc;
  }

  enc.names.push_back(name_);
  std::vector<double> col;
  col.reserve(numbers_.size());
  for (double x : numbers_) col.push_back(encode_number(x));
  enc.columns.push_back(std::move(col));
  return enc;
}

EncodedColumns Attribute::encode(const std::vector<Value>& values) const {
  if (!categorical_ && type_ == AttrType::String) {
    throw std::logic_error("encode: non-categorical string attribute '" +
                           name_ + "' has no numeric encoding");
  }

  EncodedColumns enc;
  if (categorical_) {
    enc.names.reserve(bins_.size());
    enc.columns.assign(bins_.size(), std::vector<double>(values.size(), 0.0));
    for (std::size_t j = 0; j < bins_.size(); ++j) {
      enc.names.push_back(bin_to_string(bins_[j], type_));
    }
    const auto lookup = key_lookup();
    for (std::size_t i = 0; i < values.size(); ++i) {
      const auto key = key_for(values[i]);
      if (!key) continue;
      const auto it = lookup.find(*key);
      if (it != lookup.end()) {
        enc.columns[static_cast<std::size_t>(it->second)][i] = 1.0;
      }
    }
    return enc;
  }

  enc.names.push_back(name_);
  std::vector<double> col;
  col.reserve(values.size());
  for (const auto& v : values) {
    const auto x = number_for(v);
    col.push_back(x ? encode_number(*x)
                    : std::numeric_limits<double>::quiet_NaN());
  }
  enc.columns.push_back(std::move(col));
  return enc;
}

std::vector<Value> Attribute::random(std::size_t size,
                                     std::mt19937_64& rng) const {
  std::vector<double> points(size, min_);
  if (min_ != max_ && size > 0) {
    const double step = (max_ - min_) / static_cast<double>(size);
    for (std::size_t i = 0; i < size; ++i) {
      points[i] = min_ + step * static_cast<double>(i);
    }
  }
  std::shuffle(points.begin(), points.end(), rng);

  std::vector<Value> out;
  out.reserve(size);
  switch (type_) {
    case AttrType::String: {
      const long long lo = std::max(0LL, std::llround(min_));
      const long long hi = std::max(lo, std::llround(max_));
      std::uniform_int_distribution<long long> length(lo, hi);
      for (std::size_t i = 0; i < size; ++i) {
        out.emplace_back(random_string(static_cast<std::size_t>(length(rng)), rng));
      }
      break;
    }
    case AttrType::Integer:
      for (double p : points) {
        out.emplace_back(static_cast<std::int64_t>(std::trunc(p)));
      }
      break;
    case AttrType::Float:
      for (double p : points) out.emplace_back(p);
      break;
    case AttrType::Datetime:
      for (double p : points) {
        out.emplace_back(format_date(static_cast<std::int64_t>(std::floor(p))));
      }
      break;
  }
  return out;
}

std::vector<Value> Attribute::choice(std::size_t size,
                                     std::mt19937_64& rng) const {
  return choice(draw_indexes(size, rng), rng);
}

std::vector<Value> Attribute::choice(const std::vector<int>& indexes,
                                     std::mt19937_64& rng) const {
  const int n = static_cast<int>(bins_.size());
  std::vector<Value> out;
  out.reserve(indexes.size());

  for (int idx : indexes) {
    if (idx < 0 || idx >= n) {
      throw std::out_of_range("choice: bin index " + std::to_string(idx) +
                              " outside [0, " + std::to_string(n) + ") for '" +
                              name_ + "'");
    }
    const auto k = static_cast<std::size_t>(idx);
    if (categorical_) {
      out.push_back(bin_value(bins_[k]));
      continue;
    }

    // Uniform within [edge_k, edge_{k+1}], the last bin ending at max.
    const double lo = std::get<double>(bins_[k]);
    const double hi = idx + 1 < n ? std::get<double>(bins_[k + 1]) : max_;
    const double u = std::generate_canonical<double, 53>(rng);
    const double x = std::clamp(lo + (hi - lo) * u, std::min(lo, hi),
                                std::max(lo, hi));

    switch (type_) {
      case AttrType::Datetime:
        out.emplace_back(format_date(static_cast<std::int64_t>(std::floor(x))));
        break;
      case AttrType::Float:
        out.emplace_back(round_within(x, decimals_, std::min(min_, max_),
                                      std::max(min_, max_)));
        break;
      case AttrType::Integer:
        out.emplace_back(static_cast<std::int64_t>(std::llround(x)));
        break;
      case AttrType::String:
        out.emplace_back(random_string(
            static_cast<std::size_t>(std::max(0.0, std::trunc(x))), rng));
        break;
    }
  }
  return out;
}

std::vector<std::string> Attribute::pseudonymize(std::optional<std::size_t> size,
                                                 std::mt19937_64& rng) const {
  const std::size_t n = size.value_or(raw_.size());
  const bool use_resident = has_data_ && n == raw_.size();

  std::map<std::string, std::string> mapping;
  if (categorical_) {
    for (const auto& b : bins_) {
      const std::string label = bin_to_string(b, type_);
      mapping.emplace(label, mask_string(label));
    }
  }
  auto mask = [&](const std::string& text) {
    if (categorical_) {
      const auto it = mapping.find(text);
      if (it != mapping.end()) return it->second;
    }
    return mask_string(text);
  };

  std::vector<std::string> out;
  out.reserve(n);
  if (use_resident) {
    for (std::size_t i = 0; i < n; ++i) out.push_back(mask(text_at(i)));
    return out;
  }

  for (int idx : draw_indexes(n, rng)) {
    const Bin& b = bins_[static_cast<std::size_t>(idx)];
    if (!categorical_ && type_ == AttrType::Datetime) {
      out.push_back(mask(format_date(static_cast<std::int64_t>(std::get<double>(b)))));
    } else {
      out.push_back(mask(bin_to_string(b, type_)));
    }
  }
  return out;
}

void Attribute::require_data(const char* op) const {
  if (!has_data_) {
    throw std::logic_error(std::string(op) + ": attribute '" + name_ +
                           "' has no raw values");
  }
}

std::optional<double> Attribute::number_for(const Value& v) const {
  if (is_missing(v)) return std::nullopt;

  switch (type_) {
    case AttrType::Integer:
    case AttrType::Float:
      if (const auto* s = std::get_if<std::string>(&v)) return parse_number(*s);
      return as_double(v);
    case AttrType::String:
      return static_cast<double>(value_to_string(v).size());
    case AttrType::Datetime: {
      if (const auto* s = std::get_if<std::string>(&v)) {
        const auto secs = parse_datetime(*s);
        if (!secs) return std::nullopt;
        return static_cast<double>(truncate_to_day(*secs));
      }
      const auto secs = static_cast<std::int64_t>(std::floor(as_double(v)));
      return static_cast<double>(truncate_to_day(secs));
    }
  }
  return std::nullopt;
}

std::optional<Bin> Attribute::key_for(const Value& v) const {
  if (is_missing(v)) return std::nullopt;
  if (type_ == AttrType::String) return Bin{value_to_string(v)};

  const auto x = number_for(v);
  if (!x) return std::nullopt;
  if (type_ == AttrType::Datetime) {
    return Bin{format_date(static_cast<std::int64_t>(*x))};
  }
  return Bin{*x};
}

Bin Attribute::key_at(std::size_t i) const {
  switch (type_) {
    case AttrType::String:
      return Bin{texts_[i]};
    case AttrType::Datetime:
      return Bin{format_date(static_cast<std::int64_t>(numbers_[i]))};
    case AttrType::Integer:
    case AttrType::Float:
      break;
  }
  return Bin{numbers_[i]};
}

std::string Attribute::text_at(std::size_t i) const {
  switch (type_) {
    case AttrType::String:
      return texts_[i];
    case AttrType::Integer:
      return std::to_string(static_cast<std::int64_t>(numbers_[i]));
    case AttrType::Float:
      return format_double(numbers_[i]);
    case AttrType::Datetime:
      return format_date(static_cast<std::int64_t>(numbers_[i]));
  }
  return {};
}

std::map<Bin, int> Attribute::key_lookup() const {
  std::map<Bin, int> lookup;
  for (std::size_t i = 0; i < bins_.size(); ++i) {
    lookup.emplace(bins_[i], static_cast<int>(i));
  }
  return lookup;
}

std::vector<double> Attribute::edge_values() const {
  std::vector<double> edges;
  edges.reserve(bins_.size());
  for (const auto& b : bins_) edges.push_back(std::get<double>(b));
  return edges;
}

int Attribute::edge_index(const std::vector<double>& edges, double x) const {
  const int sentinel = static_cast<int>(edges.size());
  if (edges.empty() || x < edges.front() || x > max_) return sentinel;
  return bisect_right_index(edges, x);
}

double Attribute::encode_number(double x) const {
  const double step = (max_ - min_) / static_cast<double>(bin_count_);
  return std::trunc((x - min_) / (step + ENCODE_EPS)) /
         static_cast<double>(bin_count_);
}

std::vector<int> Attribute::draw_indexes(std::size_t size,
                                         std::mt19937_64& rng) const {
  if (prs_.empty()) {
    throw std::logic_error("attribute '" + name_ + "' has no distribution");
  }
  std::discrete_distribution<int> pick(prs_.begin(), prs_.end());
  std::vector<int> out(size);
  for (auto& idx : out) idx = pick(rng);
  return out;
}

Value Attribute::bin_value(const Bin& b) const {
  switch (type_) {
    case AttrType::Integer:
      if (const auto* d = std::get_if<double>(&b)) {
        return static_cast<std::int64_t>(std::llround(*d));
      }
      break;
    case AttrType::Float:
      if (const auto* d = std::get_if<double>(&b)) return *d;
      break;
    case AttrType::String:
    case AttrType::Datetime:
      break;
  }
  return bin_to_string(b, type_);
}

int float_decimals(const std::vector<double>& values) {
  if (values.empty()) return 0;

  std::map<int, std::size_t> tally;
  for (double v : values) ++tally[decimals_of(v)];

  // Most frequent digit counts first; ties keep fewer digits first.
  std::vector<std::pair<int, std::size_t>> ranked(tally.begin(), tally.end());
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const auto& a, const auto& b) { return a.second > b.second; });

  const std::size_t total = values.size();
  std::size_t covered = 0;
  int decimals = 0;
  for (const auto& [digits, n] : ranked) {
    covered += n;
    decimals = std::max(decimals, digits);
    if (covered * 5 >= total * 4) break;  // covered / total >= 0.8
  }
  return decimals;
}

}  // namespace synth
