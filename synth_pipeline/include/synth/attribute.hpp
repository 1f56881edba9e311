#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "synth/attribute_pattern.hpp"
#include "synth/histogram.hpp"
#include "synth/value.hpp"

namespace synth {

// One-way latch: Unset -> Computed, never back.
enum class PatternState {
  Unset,
  Computed
};

struct AttributeOptions {
  bool categorical = false;             // force categorical handling
  int bin_count = DEFAULT_BIN_COUNT;    // histogram bins for ranges
};

// Column-major table produced by Attribute::encode. Categorical attributes
// give one 0/1 column per bin, others a single normalized column.
struct EncodedColumns {
  std::vector<std::string> names;
  std::vector<std::vector<double>> columns;
};

// One column of tabular data plus its learned pattern.
//
// Two modes:
//   - built from raw values: the pattern is computed once from the data,
//     and the raw values stay resident (domain overrides, own-value
//     indexing/encoding and pseudonymization need them);
//   - built from an AttributePattern: no raw values, only the pattern.
//
// Domain:
//   categorical      -> the bins (category keys)
//   non-categorical  -> [min, max]; string columns use string lengths and
//                       datetime columns epoch seconds.
class Attribute {
 public:
  Attribute(std::string name, std::vector<Value> values,
            AttributeOptions opts = {});
  explicit Attribute(const AttributePattern& pattern);

  // Compute the pattern from the resident values. No-op once Computed.
  void set_pattern();
  // Install a pattern record. No-op once Computed.
  void set_pattern(const AttributePattern& pattern);

  AttributePattern to_pattern() const;

  const std::string& name() const { return name_; }
  AttrType type() const { return type_; }
  bool categorical() const { return categorical_; }
  bool is_numerical() const { return synth::is_numerical(type_); }
  std::optional<int> decimals() const { return decimals_; }
  double min() const { return min_; }
  double max() const { return max_; }
  const std::vector<Bin>& bins() const { return bins_; }
  const std::vector<double>& prs() const { return prs_; }
  int bin_count() const { return bin_count_; }
  PatternState pattern_state() const { return state_; }
  bool has_data() const { return has_data_; }
  std::size_t size() const { return raw_.size(); }
  const std::vector<Value>& values() const { return raw_; }

  std::vector<Bin> domain() const;

  // Replace the domain and recompute counts/prs from the resident values.
  //
  //   categorical               : the list is the category set
  //   integer/float, > 2 values : treated as a category set (coded ids);
  //                               the attribute becomes categorical
  //   integer/float/datetime    : exactly [min, max]
  //   string                    : lengths (numbers) or strings; min/max of
  //                               their lengths
  //
  // Datetime entries may be date strings or epoch seconds.
  // Throws std::logic_error without raw values, std::invalid_argument on
  // an unusable domain.
  void set_domain(const std::vector<Value>& domain);

  // Per-bin counts of the resident values (empty for pattern-only mode).
  const std::vector<std::uint64_t>& counts() const { return counts_; }

  // Re-tabulate the resident values against caller bins. Categorical:
  // one entry per key. Otherwise `bins` are full edges (n + 1 edges give n
  // counts); a single edge returns the total size. With `normalize` the
  // result is in percent, rounded to 2 decimals.
  std::vector<double> counts(const std::vector<Bin>& bins,
                             bool normalize = true) const;

  // Bin index per value; missing, unknown or out-of-range values map to
  // bins().size().
  std::vector<int> bin_indexes() const;
  std::vector<int> bin_indexes(const std::vector<Value>& values) const;

  // Throws std::logic_error for non-categorical string attributes.
  EncodedColumns encode() const;
  EncodedColumns encode(const std::vector<Value>& values) const;

  // Evenly spaced values over [min, max), shuffled. Ignores prs.
  std::vector<Value> random(std::size_t size, std::mt19937_64& rng) const;

  // Values drawn bin-wise according to prs.
  std::vector<Value> choice(std::size_t size, std::mt19937_64& rng) const;
  // Values drawn from caller-chosen bins. Throws std::out_of_range for an
  // index outside [0, bins().size()).
  std::vector<Value> choice(const std::vector<int>& indexes,
                            std::mt19937_64& rng) const;

  // Masked values. With no size (or the resident size) the resident values
  // are masked; otherwise `size` values are first resampled from the bins.
  std::vector<std::string> pseudonymize(std::optional<std::size_t> size,
                                        std::mt19937_64& rng) const;

 private:
  void compute_pattern();
  void apply_pattern(const AttributePattern& pattern);
  void set_distribution(const std::vector<Bin>& declared);
  void require_data(const char* op) const;

  // Normalized numeric view of a foreign value (numbers, epoch seconds, or
  // string length), std::nullopt when it has none.
  std::optional<double> number_for(const Value& v) const;
  // Categorical lookup key of a foreign value.
  std::optional<Bin> key_for(const Value& v) const;
  // Same, for the i-th resident value.
  Bin key_at(std::size_t i) const;
  // Display text of the i-th resident value.
  std::string text_at(std::size_t i) const;

  std::map<Bin, int> key_lookup() const;
  std::vector<double> edge_values() const;
  int edge_index(const std::vector<double>& edges, double x) const;
  double encode_number(double x) const;
  std::vector<int> draw_indexes(std::size_t size, std::mt19937_64& rng) const;
  Value bin_value(const Bin& b) const;

  std::string name_;
  std::vector<Value> raw_;
  bool has_data_ = false;
  bool forced_categorical_ = false;

  // Normalized copies of the imputed values: numbers (ints, floats,
  // datetime seconds, or string lengths) and, for strings, the text.
  std::vector<double> numbers_;
  std::vector<std::string> texts_;

  AttrType type_ = AttrType::String;
  bool categorical_ = false;
  std::optional<int> decimals_;
  double min_ = 0.0;
  double max_ = 0.0;
  int bin_count_ = DEFAULT_BIN_COUNT;
  std::vector<Bin> bins_;
  std::vector<double> prs_;
  std::vector<std::uint64_t> counts_;
  PatternState state_ = PatternState::Unset;
};

// Decimal places used when synthesizing a float column: the largest digit
// count among the most frequent digit counts that together cover at least
// 80% of the values.
int float_decimals(const std::vector<double>& values);

}  // namespace synth
