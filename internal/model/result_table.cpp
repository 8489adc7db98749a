#include "result_table.hpp"

#include <stdexcept>

namespace idsync::model {

namespace {
const Value kNullValue{};
}

std::size_t ResultRow::IdCount() const {
  std::size_t count = 0;
  for (const auto& id : ids) {
    if (id) ++count;
  }
  return count;
}

ResultTable::ResultTable(EntityType entity_type, std::vector<std::string> providers, std::vector<std::string> join_columns)
    : entity_type_(entity_type), providers_(std::move(providers)), join_columns_(std::move(join_columns)) {
  id_columns_.reserve(providers_.size());
  for (const auto& provider : providers_) id_columns_.push_back(IdField(provider, entity_type_));
}

void ResultTable::AddRow(ResultRow row) {
  if (row.ids.size() != id_columns_.size() || row.join_values.size() != join_columns_.size()) {
    throw std::invalid_argument("result row shape does not match table columns");
  }
  if (row.IdCount() == 0) {
    throw std::invalid_argument("result row has no identifier");
  }
  rows_.push_back(std::move(row));
}

std::optional<std::size_t> ResultTable::ProviderIndex(std::string_view provider) const {
  for (std::size_t i = 0; i < providers_.size(); ++i) {
    if (providers_[i] == provider) return i;
  }
  return std::nullopt;
}

std::optional<std::string> ResultTable::IdOf(const ResultRow& row, std::string_view provider) const {
  auto index = ProviderIndex(provider);
  if (!index) return std::nullopt;
  return row.ids[*index];
}

const ResultRow* ResultTable::FindById(std::string_view provider, std::string_view id) const {
  auto index = ProviderIndex(provider);
  if (!index) return nullptr;
  for (const auto& row : rows_) {
    if (row.ids[*index] && *row.ids[*index] == id) return &row;
  }
  return nullptr;
}

const Value& ResultTable::JoinValue(const ResultRow& row, std::string_view column) const {
  for (std::size_t i = 0; i < join_columns_.size(); ++i) {
    if (join_columns_[i] == column) return row.join_values[i];
  }
  return kNullValue;
}

} // namespace idsync::model
