#include "arrow_table.hpp"

#include <arrow/api.h>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <variant>

#include "arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace idsync::interop {

namespace {

constexpr std::int64_t kMillisPerDay = 86400000;

template <typename ArrayType, typename Target>
void AppendNumbers(const arrow::Array& array, std::vector<model::Value>& out) {
  const auto& typed = static_cast<const ArrayType&>(array);
  for (std::int64_t i = 0; i < typed.length(); ++i) {
    if (typed.IsNull(i)) {
      out.emplace_back();
    } else {
      out.emplace_back(static_cast<Target>(typed.Value(i)));
    }
  }
}

template <typename ArrayType>
void AppendStrings(const arrow::Array& array, std::vector<model::Value>& out) {
  const auto& typed = static_cast<const ArrayType&>(array);
  for (std::int64_t i = 0; i < typed.length(); ++i) {
    if (typed.IsNull(i)) {
      out.emplace_back();
    } else {
      out.emplace_back(typed.GetString(i));
    }
  }
}

void AppendDate32(const arrow::Array& array, std::vector<model::Value>& out) {
  const auto& typed = static_cast<const arrow::Date32Array&>(array);
  for (std::int64_t i = 0; i < typed.length(); ++i) {
    if (typed.IsNull(i)) {
      out.emplace_back();
    } else {
      out.emplace_back(model::Date::FromDays(typed.Value(i)));
    }
  }
}

void AppendDate64(const arrow::Array& array, std::vector<model::Value>& out) {
  const auto& typed = static_cast<const arrow::Date64Array&>(array);
  for (std::int64_t i = 0; i < typed.length(); ++i) {
    if (typed.IsNull(i)) {
      out.emplace_back();
      continue;
    }
    const std::int64_t millis = typed.Value(i);
    std::int64_t       days   = millis / kMillisPerDay;
    if (millis % kMillisPerDay < 0) --days;
    out.emplace_back(model::Date::FromDays(days));
  }
}

void AppendChunk(const std::string& column, const arrow::Array& chunk, std::vector<model::Value>& out) {
  switch (chunk.type_id()) {
    case arrow::Type::STRING:
      return AppendStrings<arrow::StringArray>(chunk, out);
    case arrow::Type::LARGE_STRING:
      return AppendStrings<arrow::LargeStringArray>(chunk, out);
    case arrow::Type::INT8:
      return AppendNumbers<arrow::Int8Array, std::int64_t>(chunk, out);
    case arrow::Type::INT16:
      return AppendNumbers<arrow::Int16Array, std::int64_t>(chunk, out);
    case arrow::Type::INT32:
      return AppendNumbers<arrow::Int32Array, std::int64_t>(chunk, out);
    case arrow::Type::INT64:
      return AppendNumbers<arrow::Int64Array, std::int64_t>(chunk, out);
    case arrow::Type::UINT8:
      return AppendNumbers<arrow::UInt8Array, std::int64_t>(chunk, out);
    case arrow::Type::UINT16:
      return AppendNumbers<arrow::UInt16Array, std::int64_t>(chunk, out);
    case arrow::Type::UINT32:
      return AppendNumbers<arrow::UInt32Array, std::int64_t>(chunk, out);
    case arrow::Type::UINT64:
      return AppendNumbers<arrow::UInt64Array, std::int64_t>(chunk, out);
    case arrow::Type::FLOAT:
      return AppendNumbers<arrow::FloatArray, double>(chunk, out);
    case arrow::Type::DOUBLE:
      return AppendNumbers<arrow::DoubleArray, double>(chunk, out);
    case arrow::Type::BOOL:
      return AppendNumbers<arrow::BooleanArray, std::int64_t>(chunk, out);
    case arrow::Type::DATE32:
      return AppendDate32(chunk, out);
    case arrow::Type::DATE64:
      return AppendDate64(chunk, out);
    default:
      throw std::runtime_error("column `" + column + "` has unsupported type " + chunk.type()->ToString());
  }
}

std::vector<model::Record> RecordsFromTable(const std::shared_ptr<arrow::Table>& table) {
  if (!table) throw std::runtime_error("arrow table is null");

  std::vector<model::Record> records(static_cast<std::size_t>(table->num_rows()));
  for (int c = 0; c < table->num_columns(); ++c) {
    const auto name = table->field(c)->name();

    std::vector<model::Value> values;
    values.reserve(records.size());
    for (const auto& chunk : table->column(c)->chunks()) AppendChunk(name, *chunk, values);

    for (std::size_t r = 0; r < records.size(); ++r) records[r].Set(name, std::move(values[r]));
  }
  return records;
}

// ------------------------------------------------------------
// Result columns
// ------------------------------------------------------------

enum class ColumnKind { kInt64, kDouble, kDate, kString };

ColumnKind KindOf(const std::vector<model::ResultRow>& rows, std::size_t column) {
  std::optional<std::size_t> index;
  for (const auto& row : rows) {
    const auto& value = row.join_values[column];
    if (model::IsNull(value)) continue;
    if (!index) {
      index = value.index();
    } else if (*index != value.index()) {
      return ColumnKind::kString;
    }
  }

  if (!index) return ColumnKind::kString;
  switch (*index) {
    case 2:
      return ColumnKind::kInt64;
    case 3:
      return ColumnKind::kDouble;
    case 4:
      return ColumnKind::kDate;
    default:
      return ColumnKind::kString;
  }
}

std::shared_ptr<arrow::Array> Finish(arrow::ArrayBuilder& builder) {
  std::shared_ptr<arrow::Array> array;
  Unwrap(builder.Finish(&array));
  return array;
}

std::shared_ptr<arrow::Array> BuildIdColumn(const std::vector<model::ResultRow>& rows, std::size_t provider) {
  arrow::StringBuilder builder;
  for (const auto& row : rows) {
    const auto& id = row.ids[provider];
    if (id) {
      Unwrap(builder.Append(*id));
    } else {
      Unwrap(builder.AppendNull());
    }
  }
  return Finish(builder);
}

std::shared_ptr<arrow::Array> BuildJoinColumn(const std::vector<model::ResultRow>& rows,
                                              std::size_t                          column,
                                              ColumnKind                           kind) {
  switch (kind) {
    case ColumnKind::kInt64: {
      arrow::Int64Builder builder;
      for (const auto& row : rows) {
        const auto& value = row.join_values[column];
        if (model::IsNull(value)) {
          Unwrap(builder.AppendNull());
        } else {
          Unwrap(builder.Append(std::get<std::int64_t>(value)));
        }
      }
      return Finish(builder);
    }
    case ColumnKind::kDouble: {
      arrow::DoubleBuilder builder;
      for (const auto& row : rows) {
        const auto& value = row.join_values[column];
        if (model::IsNull(value)) {
          Unwrap(builder.AppendNull());
        } else {
          Unwrap(builder.Append(std::get<double>(value)));
        }
      }
      return Finish(builder);
    }
    case ColumnKind::kDate: {
      arrow::Date32Builder builder;
      for (const auto& row : rows) {
        const auto& value = row.join_values[column];
        if (model::IsNull(value)) {
          Unwrap(builder.AppendNull());
        } else {
          Unwrap(builder.Append(static_cast<std::int32_t>(std::get<model::Date>(value).ToDays())));
        }
      }
      return Finish(builder);
    }
    case ColumnKind::kString:
    default: {
      arrow::StringBuilder builder;
      for (const auto& row : rows) {
        auto text = model::CanonicalKey(row.join_values[column]);
        if (text) {
          Unwrap(builder.Append(*text));
        } else {
          Unwrap(builder.AppendNull());
        }
      }
      return Finish(builder);
    }
  }
}

std::shared_ptr<arrow::DataType> TypeOf(ColumnKind kind) {
  switch (kind) {
    case ColumnKind::kInt64:
      return arrow::int64();
    case ColumnKind::kDouble:
      return arrow::float64();
    case ColumnKind::kDate:
      return arrow::date32();
    case ColumnKind::kString:
    default:
      return arrow::utf8();
  }
}

} // namespace

model::SyncableContent ContentFromTable(model::EntityType                    entity_type,
                                        const std::string&                   provider,
                                        const std::shared_ptr<arrow::Table>& table) {
  return model::SyncableContent(entity_type, provider, RecordsFromTable(table));
}

std::vector<model::SyncableContent> SplitByProvider(model::EntityType                    entity_type,
                                                    const std::shared_ptr<arrow::Table>& table,
                                                    const std::string&                   provider_column) {
  auto records = RecordsFromTable(table);
  if (table->schema()->GetFieldIndex(provider_column) < 0) {
    throw util::ConfigurationError("table has no provider column `" + provider_column + "`");
  }

  std::vector<model::SyncableContent>          contents;
  std::unordered_map<std::string, std::size_t> index;
  for (auto& record : records) {
    auto provider = model::CanonicalKey(record.Get(provider_column));
    if (!provider) {
      throw util::ConfigurationError("null value in provider column `" + provider_column + "`");
    }

    auto it = index.find(*provider);
    if (it == index.end()) {
      it = index.emplace(*provider, contents.size()).first;
      contents.emplace_back(entity_type, *provider);
    }
    contents[it->second].mutable_records().push_back(std::move(record));
  }

  for (auto& content : contents) content.TransformProviderFields(provider_column);
  return contents;
}

std::shared_ptr<arrow::Table> ResultToTable(const model::ResultTable& result) {
  const auto& rows = result.rows();

  arrow::FieldVector                         fields;
  std::vector<std::shared_ptr<arrow::Array>> arrays;

  for (std::size_t p = 0; p < result.id_columns().size(); ++p) {
    fields.push_back(arrow::field(result.id_columns()[p], arrow::utf8()));
    arrays.push_back(BuildIdColumn(rows, p));
  }
  for (std::size_t k = 0; k < result.join_columns().size(); ++k) {
    const auto kind = KindOf(rows, k);
    fields.push_back(arrow::field(result.join_columns()[k], TypeOf(kind)));
    arrays.push_back(BuildJoinColumn(rows, k, kind));
  }

  return arrow::Table::Make(arrow::schema(fields), arrays, static_cast<std::int64_t>(rows.size()));
}

} // namespace idsync::interop
