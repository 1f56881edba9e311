// parquet_column.cpp
//
// Single-column Parquet reader/writer on top of Arrow.

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

#include <cmath>
#include <filesystem>
#include <numeric>
#include <stdexcept>

#include "synth/arrow_utils.hpp"
#include "synth/column_io.hpp"
#include "synth/time_utils.hpp"

namespace synth {

namespace {

constexpr std::int64_t SECONDS_PER_DAY = 86'400;

std::int64_t timestamp_seconds(const std::shared_ptr<arrow::Array>& arr,
                               int64_t i) {
  const auto& ts_type =
      static_cast<const arrow::TimestampType&>(*arr->type());
  const int64_t raw = static_cast<const arrow::TimestampArray&>(*arr).Value(i);
  auto floor_div = [](int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
  };
  switch (ts_type.unit()) {
    case arrow::TimeUnit::SECOND:
      return raw;
    case arrow::TimeUnit::MILLI:
      return floor_div(raw, 1'000);
    case arrow::TimeUnit::MICRO:
      return floor_div(raw, 1'000'000);
    case arrow::TimeUnit::NANO:
      return floor_div(raw, 1'000'000'000);
  }
  throw std::runtime_error("Unsupported timestamp unit");
}

Value cell_value(const std::shared_ptr<arrow::Array>& arr, int64_t i) {
  if (arr->IsNull(i)) return std::monostate{};

  switch (arr->type_id()) {
    case arrow::Type::FLOAT:
    case arrow::Type::DOUBLE: {
      const double d = ValueAt<double>(arr, i);
      if (std::isnan(d)) return std::monostate{};
      return d;
    }
    case arrow::Type::STRING:
    case arrow::Type::LARGE_STRING:
      return parse_token(ValueAt<std::string>(arr, i));
    case arrow::Type::DATE32: {
      const int32_t days = static_cast<const arrow::Date32Array&>(*arr).Value(i);
      return format_iso_datetime(days * SECONDS_PER_DAY).substr(0, 10);
    }
    case arrow::Type::TIMESTAMP:
      return format_iso_datetime(timestamp_seconds(arr, i));
    default:
      return ValueAt<int64_t>(arr, i);
  }
}

std::shared_ptr<arrow::Array> build_array(AttrType type,
                                          const std::vector<Value>& values) {
  std::shared_ptr<arrow::Array> out;
  switch (type) {
    case AttrType::Integer: {
      arrow::Int64Builder b(arrow::default_memory_pool());
      for (const auto& v : values) {
        if (is_missing(v)) {
          ARROW_OK(b.AppendNull());
        } else if (const auto* x = std::get_if<std::int64_t>(&v)) {
          ARROW_OK(b.Append(*x));
        } else if (const auto* d = std::get_if<double>(&v)) {
          ARROW_OK(b.Append(std::llround(*d)));
        } else {
          throw std::runtime_error("string cell in integer column");
        }
      }
      ARROW_OK(b.Finish(&out));
      break;
    }
    case AttrType::Float: {
      arrow::DoubleBuilder b(arrow::default_memory_pool());
      for (const auto& v : values) {
        if (is_missing(v)) {
          ARROW_OK(b.AppendNull());
        } else if (const auto* x = std::get_if<std::int64_t>(&v)) {
          ARROW_OK(b.Append(static_cast<double>(*x)));
        } else if (const auto* d = std::get_if<double>(&v)) {
          ARROW_OK(b.Append(*d));
        } else {
          throw std::runtime_error("string cell in float column");
        }
      }
      ARROW_OK(b.Finish(&out));
      break;
    }
    case AttrType::String:
    case AttrType::Datetime: {
      arrow::StringBuilder b(arrow::default_memory_pool());
      for (const auto& v : values) {
        if (is_missing(v)) {
          ARROW_OK(b.AppendNull());
        } else {
          ARROW_OK(b.Append(value_to_string(v)));
        }
      }
      ARROW_OK(b.Finish(&out));
      break;
    }
  }
  return out;
}

std::shared_ptr<arrow::DataType> arrow_type(AttrType type) {
  switch (type) {
    case AttrType::Integer:
      return arrow::int64();
    case AttrType::Float:
      return arrow::float64();
    case AttrType::String:
    case AttrType::Datetime:
      return arrow::utf8();
  }
  throw std::logic_error("unknown AttrType");
}

}  // namespace

std::vector<Value> read_parquet_column(const std::string& path,
                                       const std::string& column) {
  std::shared_ptr<arrow::Schema> schema;
  auto reader = open_parquet_reader(path, schema);

  const int col = schema->GetFieldIndex(column);
  if (col < 0) {
    throw std::runtime_error("column '" + column + "' not found in " + path);
  }

  std::vector<int> row_groups(reader->num_row_groups());
  std::iota(row_groups.begin(), row_groups.end(), 0);

  auto rb_res = reader->GetRecordBatchReader(row_groups, {col});
  if (!rb_res.ok()) {
    throw std::runtime_error("GetRecordBatchReader failed: " +
                             rb_res.status().ToString());
  }
  auto rb_reader = std::move(rb_res).ValueOrDie();

  std::vector<Value> out;
  while (true) {
    std::shared_ptr<arrow::RecordBatch> batch;
    auto st = rb_reader->ReadNext(&batch);
    if (!st.ok()) {
      throw std::runtime_error("ReadNext failed: " + st.ToString());
    }
    if (!batch) break;

    auto arr = batch->column(0);
    const int64_t n = batch->num_rows();
    out.reserve(out.size() + static_cast<std::size_t>(n));
    for (int64_t i = 0; i < n; ++i) out.push_back(cell_value(arr, i));
  }
  return out;
}

void write_parquet_column(const std::string& path, const std::string& name,
                          AttrType type, const std::vector<Value>& values) {
  std::filesystem::path p(path);
  if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());

  auto schema = arrow::schema({arrow::field(name, arrow_type(type))});
  auto array = build_array(type, values);

  auto of_res = arrow::io::FileOutputStream::Open(path);
  if (!of_res.ok()) {
    throw std::runtime_error("open output failed: " +
                             of_res.status().ToString());
  }
  auto outfile = *of_res;

  auto fw_res = parquet::arrow::FileWriter::Open(
      *schema, arrow::default_memory_pool(), outfile);
  if (!fw_res.ok()) {
    throw std::runtime_error("create writer failed: " +
                             fw_res.status().ToString());
  }
  auto writer = std::move(fw_res).ValueOrDie();

  auto batch = arrow::RecordBatch::Make(
      schema, static_cast<int64_t>(values.size()), {array});
  ARROW_OK(writer->WriteRecordBatch(*batch));
  ARROW_OK(writer->Close());
}

}  // namespace synth
