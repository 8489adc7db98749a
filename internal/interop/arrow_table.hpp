#pragma once

#include <arrow/table.h>

#include <memory>
#include <string>
#include <vector>

#include "internal/model/entity_type.hpp"
#include "internal/model/result_table.hpp"
#include "internal/model/syncable_content.hpp"

namespace idsync::interop {

/*
  Conversions between Arrow tables and the engine's record model.

  Readable column types: utf8, large_utf8, every integer width, float,
  double, bool (read as 0/1), date32, date64. Any other type raises
  std::runtime_error naming the column.
*/

// One record per row, one field per column.
model::SyncableContent ContentFromTable(model::EntityType                    entity_type,
                                        const std::string&                   provider,
                                        const std::shared_ptr<arrow::Table>& table);

/*
  Splits a long-format table holding several providers into one content
  per provider, in first-seen order. Each content goes through
  SyncableContent::TransformProviderFields(provider_column), which renames
  `provider_{entity}_id` and drops the provider column. A null provider
  value raises util::ConfigurationError.
*/
std::vector<model::SyncableContent> SplitByProvider(model::EntityType                    entity_type,
                                                    const std::shared_ptr<arrow::Table>& table,
                                                    const std::string&                   provider_column = "provider");

/*
  Identifier columns become utf8. A join column is int64, double or date32
  when every non-null value is of that type, utf8 otherwise.
*/
std::shared_ptr<arrow::Table> ResultToTable(const model::ResultTable& result);

} // namespace idsync::interop
