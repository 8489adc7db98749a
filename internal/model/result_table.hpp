#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "entity_type.hpp"
#include "value.hpp"

namespace idsync::model {

/*
  One resolved (or unresolved) entity.

  `ids` is aligned with ResultTable::id_columns(), `join_values` with
  ResultTable::join_columns(). At least one id is always set.
*/
struct ResultRow {
  std::vector<std::optional<std::string>> ids;
  std::vector<Value>                      join_values;

  std::size_t IdCount() const;
};

class ResultTable {
 public:
  ResultTable() = default;
  ResultTable(EntityType entity_type, std::vector<std::string> providers, std::vector<std::string> join_columns);

  EntityType entity_type() const {
    return entity_type_;
  }
  const std::vector<std::string>& providers() const {
    return providers_;
  }
  const std::vector<std::string>& id_columns() const {
    return id_columns_;
  }
  const std::vector<std::string>& join_columns() const {
    return join_columns_;
  }
  const std::vector<ResultRow>& rows() const {
    return rows_;
  }

  std::size_t size() const {
    return rows_.size();
  }
  bool empty() const {
    return rows_.empty();
  }

  void AddRow(ResultRow row);

  // Column index for a provider tag, nullopt when the provider is unknown.
  std::optional<std::size_t> ProviderIndex(std::string_view provider) const;

  std::optional<std::string> IdOf(const ResultRow& row, std::string_view provider) const;

  // Row holding `id` for `provider`, nullptr when there is none.
  const ResultRow* FindById(std::string_view provider, std::string_view id) const;

  const Value& JoinValue(const ResultRow& row, std::string_view column) const;

 private:
  EntityType               entity_type_ = EntityType::kMatch;
  std::vector<std::string> providers_;
  std::vector<std::string> id_columns_;
  std::vector<std::string> join_columns_;
  std::vector<ResultRow>   rows_;
};

} // namespace idsync::model
