#include <string>
#include <vector>
#include <core/errors.hpp>
#include <core/ontology.hpp>
#include <graph/builder.hpp>
#include <graph/merge.hpp>
#include <parsing/format.hpp>
#include <parsing/stream.hpp>
#include "testing.hpp"

using std::string;
using namespace ontograph;
using core::Diagnostic, core::IdSet, core::Ontology;
using testing::expect, testing::expectStrEq, testing::expectThrows;

namespace {

  auto build(string text) -> Ontology {
    auto format = parsing::OboFormat();
    auto lines = parsing::StringLineStream(std::move(text));
    return graph::load(format, lines);
  }

  auto const plays = string(
    "format-version: 1.2\n"
    "default-namespace: plays\n"
    "remark: plays\n"
    "\n"
    "[Typedef]\n"
    "id: written_by\n"
    "inverse_of: has_written\n"
    "\n"
    "[Typedef]\n"
    "id: has_written\n"
    "\n"
    "[Term]\n"
    "id: Drama\n"
    "name: drama\n"
    "\n"
    "[Term]\n"
    "id: Hamlet\n"
    "name: Hamlet\n"
    "is_a: Drama\n"
    "relationship: written_by Shakespeare\n"
  );

  auto const people = string(
    "format-version: 1.4\n"
    "default-namespace: people\n"
    "remark: people\n"
    "\n"
    "[Typedef]\n"
    "id: written_by\n"
    "\n"
    "[Term]\n"
    "id: Shakespeare\n"
    "name: William Shakespeare\n"
    "\n"
    "[Term]\n"
    "id: Hamlet\n"
    "name: The Tragedy of Hamlet\n"
    "def: \"A play.\" []\n"
    "is_a: Tragedy\n"
    "\n"
    "[Term]\n"
    "id: Tragedy\n"
    "is_a: Drama\n"
  );

  void testIdempotence() {
    auto const o = build(plays);
    auto const m = graph::merge(o, o);
    expect(m == o, "merge(O, O) == O");
    expect(m.size() == o.size(), "no new terms");
    expect(m.at("Hamlet").name == "Hamlet", "names kept");
  }

  void testUnion() {
    auto const a = build(plays);
    auto const b = build(people);
    auto const m = graph::merge(a, b);

    auto ids = std::vector<string>();
    for (auto const& t: m) ids.push_back(t.id);
    expect((ids == std::vector<string>{"Drama", "Hamlet", "Shakespeare", "Tragedy"}), "primary order first");

    expectStrEq(m.at("Hamlet").name, "Hamlet", "left-biased name");
    expect(m.at("Hamlet").def == "\"A play.\" []", "missing def filled from secondary");
    expectStrEq(m.at("Hamlet").ns, "plays", "primary namespace kept");
    expectStrEq(m.at("Shakespeare").ns, "people", "secondary namespace kept on its terms");
    expect((m.parents("Hamlet") == IdSet{"Drama", "Tragedy"}), "parents unioned");
    expect((m.related("Shakespeare", "has_written") == IdSet{"Hamlet"}), "reference across inputs resolved");
    expect(m.unresolved().empty(), "nothing left unresolved");
    expect(m.typedefAt("written_by").inverseOf == "has_written", "absent inverse is compatible");

    auto conflicts = 0uz;
    for (auto const& d: m.diagnostics())
      if (d.kind == Diagnostic::Kind::nameConflict) conflicts++;
    expect(conflicts == 1, "name conflict reported");

    auto const& meta = m.metadata();
    expect(meta.formatVersion == "1.2" && meta.defaultNamespace == "plays", "primary header wins");
    expect((meta.remarks == std::vector<string>{"plays", "people"}), "remarks unioned");

    expect(a.unresolved().size() == 1 && a.find("Shakespeare") == nullptr, "primary untouched");
    expect(b.at("Hamlet").name == "The Tragedy of Hamlet", "secondary untouched");

    auto const r = graph::merge(b, a);
    expectStrEq(r.at("Hamlet").name, "The Tragedy of Hamlet", "left bias the other way round");
  }

  void testAssociativity() {
    auto const a = build(plays);
    auto const b = build(people);
    auto const c = build("[Term]\nid: Macbeth\nis_a: Tragedy\nrelationship: written_by Shakespeare\n");
    auto const left = graph::merge(graph::merge(a, b), c);
    auto const right = graph::merge(a, graph::merge(b, c));
    expect(left == right, "associative");
    expect((left.related("Shakespeare", "has_written") == IdSet{"Hamlet", "Macbeth"}), "both plays");
  }

  void testConflict() {
    auto const a = build("[Typedef]\nid: part_of\ninverse_of: has_part\n\n[Typedef]\nid: has_part\n");
    auto const b = build("[Typedef]\nid: part_of\ninverse_of: contains\n\n[Typedef]\nid: contains\n");
    auto const e = expectThrows<core::MergeConflictError>([&] { graph::merge(a, b); }, "different inverses");
    expect(e && e->typedefId == "part_of", "conflicting typedef");
    expect(e && e->primaryInverse == "has_part" && e->secondaryInverse == "contains", "both inverses reported");

    // The clash is on the inverse side: only the primary pairs has_part with part_of.
    auto const c = build("[Typedef]\nid: component_of\ninverse_of: has_part\n");
    auto const f = expectThrows<core::MergeConflictError>([&] { graph::merge(a, c); }, "claimed inverse");
    expect(f && f->typedefId == "has_part", "typedef claimed twice");
    expect(f && f->primaryInverse == "part_of" && f->secondaryInverse == "component_of", "both claimants reported");
  }

  void testCycle() {
    auto const a = build("[Term]\nid: A\nis_a: B\n\n[Term]\nid: B\n");
    auto const b = build("[Term]\nid: B\nis_a: A\n\n[Term]\nid: A\n");
    expectThrows<core::CycleDetectedError>([&] { graph::merge(a, b); }, "merge introduces a cycle");
    expect((a.parents("A") == IdSet{"B"}) && a.parents("B").empty(), "primary untouched");
    expect((b.parents("B") == IdSet{"A"}) && b.parents("A").empty(), "secondary untouched");
  }

  void testStrict() {
    auto const a = build("[Term]\nid: A\nis_a: Elsewhere\n");
    auto const b = build("[Term]\nid: B\n");
    expectThrows<core::UnresolvedReferenceError>(
      [&] { graph::merge(a, b, graph::BuildParams{.strictReferences = true}); }, "strict merge"
    );
    auto const c = build("[Term]\nid: Elsewhere\n");
    expect(graph::merge(a, c, graph::BuildParams{.strictReferences = true}).unresolved().empty(), "resolved by merge");
  }

  void testInclude() {
    auto const o = build(plays);
    auto macbeth = core::Term{.id = "Macbeth", .name = "Macbeth"};
    macbeth.isA.insert("Drama");
    macbeth.relate("written_by", "Shakespeare");
    auto const m = graph::include(o, {macbeth});
    expect(m.size() == o.size() + 1, "one term added");
    expect((m.children("Drama") == IdSet{"Hamlet", "Macbeth"}), "new child");
    expectStrEq(m.at("Macbeth").ns, "plays", "default namespace applied");
    expect(!o.contains("Macbeth"), "original untouched");
  }

}

auto main() -> int {
  testIdempotence();
  testUnion();
  testAssociativity();
  testConflict();
  testCycle();
  testStrict();
  testInclude();
  return testing::summary("testmerge");
}
