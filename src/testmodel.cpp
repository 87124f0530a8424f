#include <string>
#include <vector>
#include <core/entity.hpp>
#include <core/errors.hpp>
#include <core/id_set.hpp>
#include "testing.hpp"

using std::string;
using namespace ontograph;
using namespace ontograph::core;
using testing::expect, testing::expectStrEq;

namespace {

  void testIdSet() {
    auto s = IdSet();
    expect(s.empty(), "new set is empty");
    expect(s.insert("B"), "first insert succeeds");
    expect(s.insert("A"), "second insert succeeds");
    expect(!s.insert("B"), "repeated insert is rejected");
    expect(s.size() == 2, "set holds two ids");
    expect((s.items() == std::vector<Id>{"B", "A"}), "insertion order is kept");
    expect(s.contains("A") && !s.contains("C"), "membership");
    expect((s == IdSet{"A", "B"}), "equality ignores order");
    expect((s != IdSet{"A"}), "different sets are unequal");

    s.insert(IdSet{"C", "A", "D"});
    expect((s.items() == std::vector<Id>{"B", "A", "C", "D"}), "set union appends new ids in order");

    auto joined = std::string();
    for (auto const& id: s) joined += id;
    expectStrEq(joined, "BACD", "iteration follows insertion order");
  }

  void testTermRelate() {
    auto t = Term{.id = "Hamlet"};
    expect(t.relate("written_by", "Shakespeare"), "new edge");
    expect(!t.relate("written_by", "Shakespeare"), "repeated edge is ignored");
    t.relate("adapted_as", "Haider");
    expect(t.relationships.size() == 2, "one entry per relation");
    expect((t.relationships.begin()->first == "adapted_as"), "relations are ordered by typedef id");
    expect(!t.obsolete && t.isA.empty(), "defaults");
  }

  void testDiagnosticKinds() {
    using enum Diagnostic::Kind;
    expectStrEq(string(kindName(malformedLine)), "malformed-line", "kind name");
    expectStrEq(string(kindName(unresolvedReference)), "unresolved-reference", "kind name");
    expectStrEq(string(kindName(nameConflict)), "name-conflict", "kind name");
  }

  void testUnresolvedReference() {
    auto const a = UnresolvedReference{"Hamlet", "is_a", "Play"};
    auto const b = UnresolvedReference{"Hamlet", "relationship", "adapted_as", true};
    expectStrEq(a.toString(), "Hamlet is_a -> undeclared term Play", "term reference");
    expectStrEq(b.toString(), "Hamlet relationship -> undeclared typedef adapted_as", "typedef reference");
    expect(a != b, "inequality");
  }

  void testErrors() {
    auto const parse = ParseError("[Term] stanza has no id", 12);
    expect(parse.line == 12, "parse error keeps its line");
    expectStrEq(parse.what(), "line 12: [Term] stanza has no id", "parse error message");

    auto const cycle = CycleDetectedError({"A", "B"});
    expect((cycle.cycle == std::vector<Id>{"A", "B"}), "cycle ids");
    expectStrEq(cycle.what(), "is_a cycle detected: A -> B -> A", "cycle message");

    auto const merge = MergeConflictError("part_of", "has_part", std::nullopt);
    expect(merge.primaryInverse == "has_part" && !merge.secondaryInverse, "merge conflict fields");
    expectStrEq(merge.what(), "cannot merge typedef part_of: inverse_of has_part vs (none)", "merge conflict message");

    auto const missing = NotFoundError("GO:0000001");
    expectStrEq(missing.what(), "no such id: GO:0000001", "not found message");

    auto const strict = UnresolvedReferenceError({UnresolvedReference{"A", "is_a", "B"}});
    expect(strict.references.size() == 1, "strict error keeps references");

    // All structural failures share one base.
    try {
      throw InverseConflictError("part_of", "has_part", "contains");
    } catch (OntologyError const& e) {
      expectStrEq(e.what(), "typedef part_of is declared inverse of both has_part and contains", "inverse conflict");
    }
  }

  void testTrim() {
    expectStrEq(string(trim("  a b \t\r")), "a b", "trim both ends");
    expectStrEq(string(trim(" \t ")), "", "trim blanks only");
  }

}

auto main() -> int {
  testIdSet();
  testTermRelate();
  testDiagnosticKinds();
  testUnresolvedReference();
  testErrors();
  testTrim();
  return testing::summary("testmodel");
}
