#include "sync_engine.hpp"

#include <algorithm>
#include <map>
#include <numeric>
#include <unordered_set>
#include <utility>

#include "config/config.pb.h"
#include "identity_merger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/strategy/stage_runner.hpp"
#include "internal/strategy/strategies.hpp"
#include "internal/util/errors.hpp"

namespace idsync::engine {

namespace {

using observability::DoubleField;
using observability::IntField;
using observability::StringField;
using strategy::RecordList;

constexpr char kContextSeparator = '\x1f';
constexpr char kNullContext[]    = "\x1enull";

std::string RecordId(const model::Record& record, const std::string& id_field) {
  return model::CanonicalKey(record.Get(id_field)).value();
}

std::string PartitionKey(const model::Record& record, const std::vector<std::string>& context_columns) {
  std::string key;
  for (const auto& column : context_columns) {
    auto part = model::CanonicalKey(record.Get(column));
    key += part ? *part : kNullContext;
    key += kContextSeparator;
  }
  return key;
}

/*
  A committed pair from one provider pair, with the stage that produced it.
  `pair` is the position of the provider pair in processing order.
*/
struct PendingLink {
  std::size_t              pair         = 0;
  std::size_t              left_column  = 0;
  std::size_t              right_column = 0;
  const model::Record*     left         = nullptr;
  const model::Record*     right        = nullptr;
  strategy::MatchCandidate match;
};

/*
  Runs layers 1 and 2 over one partition and feeds every committed pair
  into the merger.

  Links are applied in confidence order: non-fallback stages first, then
  stage number, then descending score, then pair position and record
  indices. A fallback pairing from one provider pair therefore never takes
  a row slot that a stronger stage of another pair claims.
*/
class LayerRunner {
 public:
  LayerRunner(const strategy::MatchingStrategy&          strategy,
              const std::vector<model::SyncableContent>& contents,
              const std::vector<std::string>&            id_fields,
              bool                                       verbose,
              IdentityMerger&                            merger)
      : strategy_(strategy), contents_(contents), id_fields_(id_fields), verbose_(verbose), merger_(merger) {
  }

  void Run(const std::vector<RecordList>& lists, const std::vector<std::size_t>& order) {
    std::vector<std::pair<std::size_t, std::size_t>> pairs;
    for (std::size_t i = 0; i < order.size(); ++i) {
      for (std::size_t j = i + 1; j < order.size(); ++j) pairs.emplace_back(order[i], order[j]);
    }

    // layer 1: every pair over full pools, links applied together
    std::vector<PendingLink> pending;
    for (std::size_t p = 0; p < pairs.size(); ++p) {
      const auto [a, b] = pairs[p];
      if (lists[a].empty() || lists[b].empty()) continue;

      const auto outcome = strategy::RunStrategy(strategy_, lists[a], lists[b]);
      for (const auto& match : outcome.matches) {
        pending.push_back({p, a, b, lists[a][match.left_index], lists[b][match.right_index], match});
      }
    }

    std::sort(pending.begin(), pending.end(), [&](const PendingLink& x, const PendingLink& y) {
      return Before(x, y);
    });
    for (const auto& link : pending) Apply("pairwise", link);

    // layer 2: records whose row does not span every provider of the partition
    std::vector<std::size_t> present;
    for (auto c : order) {
      if (!lists[c].empty()) present.push_back(c);
    }

    std::vector<RecordList> leftovers(lists.size());
    for (auto c : present) {
      for (const auto* record : lists[c]) {
        if (!merger_.Covers(c, RecordId(*record, id_fields_[c]), present)) leftovers[c].push_back(record);
      }
    }

    // stage by stage across every pair; a pair only sees records whose row
    // still lacks the other provider, so refused links keep their records
    for (std::size_t s = 0; s < strategy_.stages.size(); ++s) {
      for (std::size_t p = 0; p < pairs.size(); ++p) {
        const auto [a, b] = pairs[p];

        const auto left_pool  = OpenTo(leftovers[a], a, b);
        const auto right_pool = OpenTo(leftovers[b], b, a);
        if (left_pool.empty() || right_pool.empty()) continue;

        const auto outcome = strategy::RunStage(
            strategy_.stages[s], static_cast<int>(s) + 1, leftovers[a], left_pool, leftovers[b], right_pool);
        for (const auto& match : outcome.committed) {
          Apply("cross", {p, a, b, leftovers[a][match.left_index], leftovers[b][match.right_index], match});
        }
      }
    }
  }

 private:
  // Indices of `records` whose row has no identifier of provider `other` yet.
  std::vector<std::size_t> OpenTo(const RecordList& records, std::size_t column, std::size_t other) const {
    std::vector<std::size_t> open;
    for (std::size_t k = 0; k < records.size(); ++k) {
      if (!merger_.Covers(column, RecordId(*records[k], id_fields_[column]), {other})) open.push_back(k);
    }
    return open;
  }

  bool Before(const PendingLink& x, const PendingLink& y) const {
    const bool x_fallback = strategy_.stages[x.match.stage - 1].fallback;
    const bool y_fallback = strategy_.stages[y.match.stage - 1].fallback;
    if (x_fallback != y_fallback) return y_fallback;
    if (x.match.stage != y.match.stage) return x.match.stage < y.match.stage;
    if (x.match.score != y.match.score) return x.match.score > y.match.score;
    if (x.pair != y.pair) return x.pair < y.pair;
    if (x.match.left_index != y.match.left_index) return x.match.left_index < y.match.left_index;
    return x.match.right_index < y.match.right_index;
  }

  void Apply(const char* layer, const PendingLink& link) {
    const auto& stage  = strategy_.stages[link.match.stage - 1];
    const bool  linked = merger_.Link(link.left_column,
                                     RecordId(*link.left, id_fields_[link.left_column]),
                                     *link.left,
                                     link.right_column,
                                     RecordId(*link.right, id_fields_[link.right_column]),
                                     *link.right);
    if (!verbose_) return;

    if (linked) {
      IDSYNC_LOG_INFO("stage matched",
                      {StringField("entity", model::ToString(strategy_.entity_type)),
                       StringField("layer", layer),
                       IntField("stage", link.match.stage),
                       StringField("rule", stage.title),
                       StringField("left", Describe(link.left_column, *link.left)),
                       StringField("right", Describe(link.right_column, *link.right)),
                       DoubleField("score", link.match.score)});
    } else {
      IDSYNC_LOG_INFO("link refused, provider already linked in row",
                      {StringField("layer", layer),
                       IntField("stage", link.match.stage),
                       StringField("left", Describe(link.left_column, *link.left)),
                       StringField("right", Describe(link.right_column, *link.right))});
    }
  }

  std::string Describe(std::size_t column, const model::Record& record) const {
    return contents_[column].provider() + ":" + RecordId(record, id_fields_[column]);
  }

  const strategy::MatchingStrategy&          strategy_;
  const std::vector<model::SyncableContent>& contents_;
  const std::vector<std::string>&            id_fields_;
  bool                                       verbose_;
  IdentityMerger&                            merger_;
};

} // namespace

SyncOptions OptionsFromConfig(const idsync::runtime::config::RuntimeConfig& config) {
  SyncOptions options;
  options.use_competition_context = config.engine().use_competition_context();
  options.verbose                 = config.engine().verbose();
  return options;
}

SyncEngine::SyncEngine(model::EntityType type, std::vector<model::SyncableContent> contents, SyncOptions options)
    : type_(type),
      contents_(std::move(contents)),
      options_(options),
      strategy_(strategy::StrategyFor(type, options.use_competition_context)) {
  Validate();
}

void SyncEngine::Validate() {
  std::unordered_set<std::string> providers;

  for (const auto& content : contents_) {
    if (content.entity_type() != type_) {
      throw util::ConfigurationError("provider " + content.provider() + " carries " +
                                     std::string(model::ToString(content.entity_type())) + " content, expected " +
                                     std::string(model::ToString(type_)));
    }
    if (content.provider().empty()) {
      throw util::ConfigurationError("provider tag must not be empty");
    }
    if (!providers.insert(content.provider()).second) {
      throw util::DuplicateProvider(content.provider());
    }

    const auto                      id_field = content.IdField();
    std::unordered_set<std::string> ids;
    for (const auto& record : content.records()) {
      if (!record.Has(id_field)) {
        throw util::MissingColumn(content.provider(), id_field);
      }
      for (const auto& column : strategy_.required_columns) {
        if (!record.Has(column)) {
          throw util::MissingColumn(content.provider(), column);
        }
      }

      auto id = model::CanonicalKey(record.Get(id_field));
      if (!id) {
        throw util::ConfigurationError("provider " + content.provider() + " has a null `" + id_field + "`");
      }
      if (!ids.insert(*id).second) {
        throw util::ConfigurationError("provider " + content.provider() + " repeats `" + id_field + "` " + *id);
      }
    }
  }

  if (type_ == model::EntityType::kPlayer) {
    strategy_.join_columns = strategy::ReliablePlayerJoinColumns(contents_);
    if (strategy_.join_columns.empty()) {
      throw util::ConfigurationError(
          "no player join column: jersey_number, team_id and player_name are each missing or null somewhere");
    }
  }
}

model::ResultTable SyncEngine::Synchronize() const {
  std::vector<std::string> providers;
  std::vector<std::string> id_fields;
  for (const auto& content : contents_) {
    providers.push_back(content.provider());
    id_fields.push_back(content.IdField());
  }

  model::ResultTable table(type_, providers, strategy_.join_columns);

  std::vector<std::size_t> order(contents_.size());
  std::iota(order.begin(), order.end(), 0);
  std::sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) { return providers[a] < providers[b]; });

  std::map<std::string, std::vector<RecordList>> partitions;
  for (std::size_t c = 0; c < contents_.size(); ++c) {
    for (const auto& record : contents_[c].records()) {
      auto& lists = partitions[PartitionKey(record, strategy_.context_columns)];
      if (lists.empty()) lists.resize(contents_.size());
      lists[c].push_back(&record);
    }
  }

  IdentityMerger merger(contents_.size(), strategy_.join_columns);
  LayerRunner    runner(strategy_, contents_, id_fields, options_.verbose, merger);
  for (const auto& partition : partitions) {
    runner.Run(partition.second, order);
  }

  for (auto c : order) {
    for (const auto& record : contents_[c].records()) {
      const auto id = RecordId(record, id_fields[c]);
      if (merger.AddResidual(c, id, record) && options_.verbose) {
        IDSYNC_LOG_INFO("unmatched",
                        {StringField("entity", model::ToString(type_)), StringField("record", providers[c] + ":" + id)});
      }
    }
  }

  for (auto& row : merger.Deduplicate()) {
    table.AddRow(std::move(row));
  }

  if (options_.verbose) {
    IDSYNC_LOG_INFO("synchronized",
                    {StringField("entity", model::ToString(type_)),
                     IntField("providers", static_cast<std::int64_t>(contents_.size())),
                     IntField("linked_rows", static_cast<std::int64_t>(merger.RowCount())),
                     IntField("rows", static_cast<std::int64_t>(table.size()))});
  }
  return table;
}

} // namespace idsync::engine
