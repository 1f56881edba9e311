#pragma once

#include <optional>
#include <string>
#include <vector>

#include "synth/value.hpp"

namespace synth {

// Portable summary of one attribute. Together these fields are enough to
// index, encode and sample without the raw column.
struct AttributePattern {
  std::string name;
  AttrType type = AttrType::String;
  bool categorical = false;
  double min = 0.0;
  double max = 0.0;
  std::optional<int> decimals;  // float columns only
  std::vector<Bin> bins;
  std::vector<double> prs;
};

}  // namespace synth
