#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/record.hpp"
#include "internal/model/result_table.hpp"

namespace idsync::engine {

/*
  Unions pairwise links into identity rows.

  Providers are addressed by their column index in the result table. Every
  identifier lives in at most one row; a link or merge that would put two
  different identifiers of the same provider into one row is refused and
  leaves both sides where they were.

  Join values of a row come from the record that created it, nulls are
  filled from records and rows merged in later.
*/
class IdentityMerger {
 public:
  IdentityMerger(std::size_t provider_count, std::vector<std::string> join_columns);

  // Returns false when the link was refused.
  bool Link(std::size_t               left_provider,
            const std::string&        left_id,
            const model::Record&      left,
            std::size_t               right_provider,
            const std::string&        right_id,
            const model::Record&      right);

  // Adds a single-identifier row. Returns false when the identifier is
  // already placed.
  bool AddResidual(std::size_t provider, const std::string& id, const model::Record& record);

  bool Contains(std::size_t provider, const std::string& id) const;

  // True when the row holding `id` has an identifier for every provider in
  // `providers`. False for identifiers not placed yet.
  bool Covers(std::size_t provider, const std::string& id, const std::vector<std::size_t>& providers) const;

  // Rows alive after linking, in creation order.
  std::size_t RowCount() const;

  /*
    Groups rows whose join values are all non-null and equal, folding each
    row into the first compatible row of its group. Rows with a null join
    value (or no join columns at all) stay on their own.
  */
  std::vector<model::ResultRow> Deduplicate() const;

 private:
  struct Row {
    std::vector<std::optional<std::string>> ids;
    std::vector<model::Value>               join_values;
    bool                                    merged_away = false;
  };

  std::optional<std::size_t> RowOf(std::size_t provider, const std::string& id) const;
  std::size_t                NewRow(std::size_t provider, const std::string& id, const model::Record& record);
  void                       Place(std::size_t row, std::size_t provider, const std::string& id, const model::Record& record);
  void                       Absorb(std::size_t into, std::size_t from);

  std::size_t                                                provider_count_;
  std::vector<std::string>                                   join_columns_;
  std::vector<Row>                                           rows_;
  std::vector<std::unordered_map<std::string, std::size_t>> index_;
};

} // namespace idsync::engine
