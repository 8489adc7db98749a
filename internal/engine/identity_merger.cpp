#include "identity_merger.hpp"

#include <algorithm>
#include <utility>

namespace idsync::engine {

namespace {

constexpr char kKeySeparator = '\x1f';

template <typename A, typename B>
bool Conflicts(const A& a, const B& b) {
  for (std::size_t i = 0; i < a.ids.size(); ++i) {
    if (a.ids[i] && b.ids[i] && *a.ids[i] != *b.ids[i]) return true;
  }
  return false;
}

template <typename Into, typename From>
void FillIds(Into& into, const From& from) {
  for (std::size_t i = 0; i < into.ids.size(); ++i) {
    if (!into.ids[i]) into.ids[i] = from.ids[i];
  }
}

void FillJoinValues(std::vector<model::Value>& into, const std::vector<model::Value>& from) {
  for (std::size_t k = 0; k < into.size(); ++k) {
    if (model::IsNull(into[k])) into[k] = from[k];
  }
}

} // namespace

IdentityMerger::IdentityMerger(std::size_t provider_count, std::vector<std::string> join_columns)
    : provider_count_(provider_count), join_columns_(std::move(join_columns)), index_(provider_count) {
}

std::optional<std::size_t> IdentityMerger::RowOf(std::size_t provider, const std::string& id) const {
  const auto& index = index_.at(provider);
  auto        it    = index.find(id);
  if (it == index.end()) return std::nullopt;
  return it->second;
}

bool IdentityMerger::Contains(std::size_t provider, const std::string& id) const {
  return RowOf(provider, id).has_value();
}

bool IdentityMerger::Covers(std::size_t                     provider,
                            const std::string&              id,
                            const std::vector<std::size_t>& providers) const {
  const auto row = RowOf(provider, id);
  if (!row) return false;
  const auto& ids = rows_[*row].ids;
  return std::all_of(providers.begin(), providers.end(), [&](std::size_t p) { return ids[p].has_value(); });
}

std::size_t IdentityMerger::RowCount() const {
  return static_cast<std::size_t>(
      std::count_if(rows_.begin(), rows_.end(), [](const Row& row) { return !row.merged_away; }));
}

std::size_t IdentityMerger::NewRow(std::size_t provider, const std::string& id, const model::Record& record) {
  Row row;
  row.ids.resize(provider_count_);
  row.join_values.reserve(join_columns_.size());
  for (const auto& column : join_columns_) row.join_values.push_back(record.Get(column));

  rows_.push_back(std::move(row));
  const auto index = rows_.size() - 1;
  rows_[index].ids[provider] = id;
  index_[provider][id]       = index;
  return index;
}

void IdentityMerger::Place(std::size_t row, std::size_t provider, const std::string& id, const model::Record& record) {
  auto& target         = rows_[row];
  target.ids[provider] = id;
  index_[provider][id] = row;
  for (std::size_t k = 0; k < join_columns_.size(); ++k) {
    if (model::IsNull(target.join_values[k])) target.join_values[k] = record.Get(join_columns_[k]);
  }
}

void IdentityMerger::Absorb(std::size_t into, std::size_t from) {
  auto& target = rows_[into];
  auto& source = rows_[from];

  for (std::size_t p = 0; p < provider_count_; ++p) {
    if (!source.ids[p]) continue;
    target.ids[p]             = source.ids[p];
    index_[p][*source.ids[p]] = into;
  }
  FillJoinValues(target.join_values, source.join_values);

  source.ids.assign(provider_count_, std::nullopt);
  source.merged_away = true;
}

bool IdentityMerger::Link(std::size_t          left_provider,
                          const std::string&   left_id,
                          const model::Record& left,
                          std::size_t          right_provider,
                          const std::string&   right_id,
                          const model::Record& right) {
  const auto left_row  = RowOf(left_provider, left_id);
  const auto right_row = RowOf(right_provider, right_id);

  if (left_row && right_row) {
    if (*left_row == *right_row) return true;
    if (Conflicts(rows_[*left_row], rows_[*right_row])) return false;

    // the older row survives so row order stays stable
    Absorb(std::min(*left_row, *right_row), std::max(*left_row, *right_row));
    return true;
  }

  if (left_row) {
    if (rows_[*left_row].ids[right_provider]) return false;
    Place(*left_row, right_provider, right_id, right);
    return true;
  }

  if (right_row) {
    if (rows_[*right_row].ids[left_provider]) return false;
    Place(*right_row, left_provider, left_id, left);
    return true;
  }

  const auto row = NewRow(left_provider, left_id, left);
  Place(row, right_provider, right_id, right);
  return true;
}

bool IdentityMerger::AddResidual(std::size_t provider, const std::string& id, const model::Record& record) {
  if (Contains(provider, id)) return false;
  NewRow(provider, id, record);
  return true;
}

std::vector<model::ResultRow> IdentityMerger::Deduplicate() const {
  std::vector<model::ResultRow>                              out;
  std::unordered_map<std::string, std::vector<std::size_t>> groups;

  for (const auto& row : rows_) {
    if (row.merged_away) continue;

    std::optional<std::string> key;
    if (!join_columns_.empty()) {
      key.emplace();
      for (const auto& value : row.join_values) {
        auto part = model::CanonicalKey(value);
        if (!part) {
          key.reset();
          break;
        }
        *key += *part;
        *key += kKeySeparator;
      }
    }

    bool placed = false;
    if (key) {
      for (auto index : groups[*key]) {
        if (Conflicts(out[index], row)) continue;
        FillIds(out[index], row);
        FillJoinValues(out[index].join_values, row.join_values);
        placed = true;
        break;
      }
    }
    if (placed) continue;

    model::ResultRow result;
    result.ids         = row.ids;
    result.join_values = row.join_values;
    out.push_back(std::move(result));
    if (key) groups[*key].push_back(out.size() - 1);
  }

  return out;
}

} // namespace idsync::engine
