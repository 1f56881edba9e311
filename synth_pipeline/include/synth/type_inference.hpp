#pragma once

#include <vector>

#include "synth/value.hpp"

namespace synth {

// Classify a raw column.
//
//   - only int64 cells               -> Integer
//   - double cells (with or w/o int)  -> Float
//   - any string cell                 -> String, or Datetime when every
//                                        non-missing cell parses as a date
//
// Missing cells are skipped.
// Throws std::invalid_argument when no non-missing cell exists.
AttrType infer_type(const std::vector<Value>& values);

// Most frequent non-missing value; ties go to the value seen first.
// Throws std::invalid_argument when no non-missing cell exists.
Value mode_of(const std::vector<Value>& values);

// Copy of `values` with every missing cell replaced by mode_of(values).
std::vector<Value> fill_missing_with_mode(const std::vector<Value>& values);

// True if any value occurs more than once.
bool has_duplicates(const std::vector<Value>& values);

// Caller's flag wins; otherwise a string column with duplicates is
// categorical.
bool infer_categorical(AttrType type, const std::vector<Value>& values,
                       bool forced);

}  // namespace synth
