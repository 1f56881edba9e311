#pragma once

#include <string>
#include <vector>

#include "synth/value.hpp"

namespace synth {

// Readers and writers for a single named column.
//
// Text tokens are coerced the same way for every source:
//   "", NA, N/A, null, none, nan (any case) -> missing
//   integer literal                         -> int64
//   decimal / exponent literal              -> double
//   anything else                           -> string

// Coerce one raw text token.
Value parse_token(const std::string& token);

// Split one CSV record. Double-quoted fields may contain the delimiter and
// "" escapes.
std::vector<std::string> split_csv_line(const std::string& line,
                                        char delimiter);

// Read `column` from a .csv or gzip-compressed .csv.gz file (zlib).
// Throws std::runtime_error if the file cannot be opened or has no such
// header.
std::vector<Value> read_csv_column(const std::string& path,
                                   const std::string& column,
                                   char delimiter = ',');

// Write a one-column CSV file: header, then one line per value.
void write_csv_column(const std::string& path, const std::string& name,
                      const std::vector<Value>& values);

// Read `column` from a Parquet file (Arrow). Integer, floating, boolean,
// string, date32 and timestamp arrays are supported; dates and timestamps
// come back as ISO strings. Nulls become missing cells.
std::vector<Value> read_parquet_column(const std::string& path,
                                       const std::string& column);

// Write a one-column Parquet file. Integer -> int64, Float -> double,
// String/Datetime -> utf8. Missing cells are written as nulls.
void write_parquet_column(const std::string& path, const std::string& name,
                          AttrType type, const std::vector<Value>& values);

// Dispatch on the file extension (.parquet vs. anything else as CSV).
std::vector<Value> read_column(const std::string& path,
                               const std::string& column,
                               char delimiter = ',');

}  // namespace synth
