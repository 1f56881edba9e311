#pragma once
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace synth {

// Generic declaration for typed value extraction from Arrow arrays
template <typename T>
T ValueAt(const std::shared_ptr<arrow::Array>& arr, int64_t i);

// Specialization for integer-like columns (booleans read as 0/1)
template <>
inline int64_t ValueAt<int64_t>(const std::shared_ptr<arrow::Array>& arr,
                                int64_t i) {
  switch (arr->type_id()) {
    case arrow::Type::INT8:
      return static_cast<const arrow::Int8Array&>(*arr).Value(i);
    case arrow::Type::INT16:
      return static_cast<const arrow::Int16Array&>(*arr).Value(i);
    case arrow::Type::INT32:
      return static_cast<const arrow::Int32Array&>(*arr).Value(i);
    case arrow::Type::INT64:
      return static_cast<const arrow::Int64Array&>(*arr).Value(i);
    case arrow::Type::UINT8:
      return static_cast<const arrow::UInt8Array&>(*arr).Value(i);
    case arrow::Type::UINT16:
      return static_cast<const arrow::UInt16Array&>(*arr).Value(i);
    case arrow::Type::UINT32:
      return static_cast<const arrow::UInt32Array&>(*arr).Value(i);
    case arrow::Type::UINT64:
      return static_cast<int64_t>(
          static_cast<const arrow::UInt64Array&>(*arr).Value(i));
    case arrow::Type::BOOL:
      return static_cast<const arrow::BooleanArray&>(*arr).Value(i) ? 1 : 0;
    default:
      throw std::runtime_error("Unsupported type: " + arr->type()->ToString());
  }
}

// Specialization for extracting numeric columns as double or float
template <>
inline double ValueAt<double>(const std::shared_ptr<arrow::Array>& arr,
                              int64_t i) {
  switch (arr->type_id()) {
    case arrow::Type::FLOAT:
      return static_cast<double>(
          static_cast<const arrow::FloatArray&>(*arr).Value(i));
    case arrow::Type::DOUBLE:
      return static_cast<const arrow::DoubleArray&>(*arr).Value(i);
    default:
      throw std::runtime_error("Unsupported type: " + arr->type()->ToString());
  }
}

// Specialization for text columns
template <>
inline std::string ValueAt<std::string>(
    const std::shared_ptr<arrow::Array>& arr, int64_t i) {
  switch (arr->type_id()) {
    case arrow::Type::STRING:
      return static_cast<const arrow::StringArray&>(*arr).GetString(i);
    case arrow::Type::LARGE_STRING:
      return static_cast<const arrow::LargeStringArray&>(*arr).GetString(i);
    default:
      throw std::runtime_error("Unsupported type: " + arr->type()->ToString());
  }
}

inline std::unique_ptr<parquet::arrow::FileReader> open_parquet_reader(
    const std::string& path, std::shared_ptr<arrow::Schema>& out_schema) {
  auto readable_file_result = arrow::io::ReadableFile::Open(path);
  if (!readable_file_result.ok()) {
    throw std::runtime_error("open input failed: " +
                             readable_file_result.status().ToString());
  }

  auto parquet_read_result = parquet::arrow::OpenFile(
      *readable_file_result, arrow::default_memory_pool());
  if (!parquet_read_result.ok()) {
    throw std::runtime_error("open parquet reader failed: " +
                             parquet_read_result.status().ToString());
  }

  auto reader = std::move(parquet_read_result).ValueOrDie();
  auto st = reader->GetSchema(&out_schema);
  if (!st.ok()) {
    throw std::runtime_error("get schema failed: " + st.ToString());
  }
  return reader;
}

// helper used at runtime for validation
static inline void ARROW_OK(const arrow::Status& st) {
  if (!st.ok()) throw std::runtime_error(st.ToString());
}

}  // namespace synth
