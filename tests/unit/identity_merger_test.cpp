#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>

#include "internal/engine/identity_merger.hpp"
#include "internal/model/record.hpp"

namespace {

using idsync::engine::IdentityMerger;
using idsync::model::Record;
using idsync::model::Value;

Record Named(const char* name) {
  return Record{{"name", Value{std::string(name)}}};
}

void TestLinksChainIntoOneRow() {
  IdentityMerger merger(3, {"name"});
  assert(merger.Link(0, "a1", Named("Lyon"), 1, "b1", Named("Lyon")));
  assert(merger.Link(1, "b1", Named("Lyon"), 2, "c1", Named("Olympique Lyonnais")));
  assert(merger.RowCount() == 1);

  const auto rows = merger.Deduplicate();
  assert(rows.size() == 1);
  assert(rows[0].ids[0] == std::string("a1"));
  assert(rows[0].ids[1] == std::string("b1"));
  assert(rows[0].ids[2] == std::string("c1"));
  // join values come from the record that created the row
  assert(std::get<std::string>(rows[0].join_values[0]) == "Lyon");
}

void TestConflictingLinkIsRefused() {
  IdentityMerger merger(2, {"name"});
  assert(merger.Link(0, "a1", Named("X"), 1, "b1", Named("X")));
  assert(!merger.Link(0, "a1", Named("X"), 1, "b2", Named("X")));
  assert(!merger.Contains(1, "b2"));

  assert(merger.AddResidual(1, "b2", Named("X")));
  assert(!merger.AddResidual(1, "b2", Named("X")));
  assert(merger.RowCount() == 2);
}

void TestRowsMergeWhenCompatible() {
  IdentityMerger merger(4, {"name"});
  assert(merger.Link(0, "a1", Named("A"), 1, "b1", Named("A")));
  assert(merger.Link(2, "c1", Named("A"), 3, "d1", Named("A")));
  assert(merger.RowCount() == 2);

  // a1 and c1 live in rows with disjoint providers
  assert(merger.Link(0, "a1", Named("A"), 2, "c1", Named("A")));
  assert(merger.RowCount() == 1);

  const auto rows = merger.Deduplicate();
  assert(rows.size() == 1);
  assert(rows[0].IdCount() == 4);
}

void TestMergeWithConflictKeepsRowsApart() {
  IdentityMerger merger(3, {"name"});
  assert(merger.Link(0, "a1", Named("A"), 1, "b1", Named("A")));
  assert(merger.Link(0, "a2", Named("A"), 2, "c1", Named("A")));
  assert(merger.Link(1, "b2", Named("A"), 2, "c2", Named("A")));

  // would put b1 and b2 into one row
  assert(!merger.Link(1, "b1", Named("A"), 2, "c2", Named("A")));
  assert(merger.RowCount() == 3);
}

void TestDeduplicateGroupsByJoinValues() {
  IdentityMerger merger(2, {"name"});
  merger.AddResidual(0, "a1", Named("Lens"));
  merger.AddResidual(1, "b1", Named("Lens"));
  merger.AddResidual(1, "b2", Named("Lens"));
  merger.AddResidual(0, "a2", Record{{"name", Value{}}});
  merger.AddResidual(1, "b3", Record{{"name", Value{}}});

  const auto rows = merger.Deduplicate();
  // a1+b1 fold together, b2 conflicts with b1 and stays alone, null names never join
  assert(rows.size() == 4);
  assert(rows[0].ids[0] == std::string("a1") && rows[0].ids[1] == std::string("b1"));
  assert(!rows[1].ids[0] && rows[1].ids[1] == std::string("b2"));
  assert(rows[2].ids[0] == std::string("a2") && !rows[2].ids[1]);
  assert(!rows[3].ids[0] && rows[3].ids[1] == std::string("b3"));
}

void TestNullJoinValuesFilledFromLaterRecords() {
  IdentityMerger merger(2, {"name", "code"});
  assert(merger.Link(0,
                     "a1",
                     Record{{"name", Value{std::string("Genk")}}, {"code", Value{}}},
                     1,
                     "b1",
                     Record{{"name", Value{std::string("KRC Genk")}}, {"code", Value{std::int64_t{12}}}}));

  const auto rows = merger.Deduplicate();
  assert(rows.size() == 1);
  assert(std::get<std::string>(rows[0].join_values[0]) == "Genk");
  assert(std::get<std::int64_t>(rows[0].join_values[1]) == 12);
}

void TestNoJoinColumnsMeansNoDedup() {
  IdentityMerger merger(2, {});
  merger.AddResidual(0, "a1", Record{});
  merger.AddResidual(1, "b1", Record{});
  assert(merger.Deduplicate().size() == 2);
}

} // namespace

int main() {
  TestLinksChainIntoOneRow();
  TestConflictingLinkIsRefused();
  TestRowsMergeWhenCompatible();
  TestMergeWithConflictKeepsRowsApart();
  TestDeduplicateGroupsByJoinValues();
  TestNullJoinValuesFilledFromLaterRecords();
  TestNoJoinColumnsMeansNoDedup();

  std::cout << "idsync_unit_identity_merger: pass\n";
  return 0;
}
