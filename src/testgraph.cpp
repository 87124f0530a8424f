#include <string>
#include <thread>
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
using testing::expect, testing::expectThrows;

namespace {

  auto build(string text, graph::BuildParams params = {}) -> Ontology {
    auto format = parsing::OboFormat();
    auto lines = parsing::StringLineStream(std::move(text));
    return graph::load(format, lines, params);
  }

  auto count(Ontology const& o, Diagnostic::Kind kind) -> size_t {
    auto res = 0uz;
    for (auto const& d: o.diagnostics())
      if (d.kind == kind) res++;
    return res;
  }

  auto const literature = string(
    "format-version: 1.2\n"
    "default-namespace: literature\n"
    "\n"
    "[Typedef]\n"
    "id: has_written\n"
    "name: has written\n"
    "inverse_of: written_by\n"
    "\n"
    "[Typedef]\n"
    "id: written_by\n"
    "name: written by\n"
    "inverse_of: has_written\n"
    "\n"
    "[Term]\n"
    "id: LiteratureForm\n"
    "name: literature form\n"
    "\n"
    "[Term]\n"
    "id: Drama\n"
    "name: drama\n"
    "is_a: LiteratureForm\n"
    "\n"
    "[Term]\n"
    "id: Hamlet\n"
    "name: Hamlet\n"
    "is_a: Drama\n"
    "relationship: written_by Shakespeare\n"
    "\n"
    "[Term]\n"
    "id: Playwright\n"
    "name: playwright\n"
    "\n"
    "[Term]\n"
    "id: Shakespeare\n"
    "name: William Shakespeare\n"
    "is_a: Playwright\n"
  );

  // A term is never its own ancestor or descendant; parents and children mirror each other.
  void checkHierarchy(Ontology const& o) {
    for (auto const& t: o) {
      expect(!o.ancestors(t.id).contains(t.id), t.id + " is not its own ancestor");
      expect(!o.descendants(t.id).contains(t.id), t.id + " is not its own descendant");
      for (auto const& p: o.parents(t.id)) expect(o.children(p).contains(t.id), t.id + " is a child of " + p);
      for (auto const& c: o.children(t.id)) expect(o.parents(c).contains(t.id), t.id + " is a parent of " + c);
    }
  }

  // Every edge whose typedef has an inverse is visible from the other end.
  void checkInverses(Ontology const& o) {
    for (auto const& t: o)
      for (auto const& [relation, targets]: t.relationships) {
        auto const td = o.findTypedef(relation);
        if (!td || !td->inverseOf) continue;
        for (auto const& v: targets)
          if (o.contains(v)) expect(o.related(v, *td->inverseOf).contains(t.id), v + " sees " + t.id);
      }
  }

  void testLiterature() {
    auto const o = build(literature);
    expect(o.size() == 5, "five terms");
    expect(o.typedefs().size() == 2, "two typedefs");
    expect(o.unresolved().empty(), "forward reference to Shakespeare resolved");
    expect(o.defaultNamespace() == "literature", "default namespace");

    expect((o.children("Drama") == IdSet{"Hamlet"}), "children of Drama");
    expect((o.parents("Hamlet") == IdSet{"Drama"}), "parents of Hamlet");
    auto const& below = o.descendants("LiteratureForm");
    expect(below.contains("Drama") && below.contains("Hamlet"), "descendants of the root");
    expect((o.ancestors("Hamlet") == IdSet{"Drama", "LiteratureForm"}), "ancestors of Hamlet");

    expect((o.related("Hamlet", "written_by") == IdSet{"Shakespeare"}), "declared edge");
    expect((o.related("Shakespeare", "has_written") == IdSet{"Hamlet"}), "mirrored edge");
    expect(o.at("Shakespeare").relationships.empty(), "mirrored edge is not stored on the term");
    expect(o.related("Drama", "written_by").empty(), "no edge");
    expect(o.relations("Shakespeare").size() == 1, "one relation on Shakespeare");

    checkHierarchy(o);
    checkInverses(o);
  }

  void testLookup() {
    auto const o = build(literature);
    expect(o.contains("Hamlet") && !o.contains("Macbeth"), "contains");
    expect(o.find("Macbeth") == nullptr, "find misses");
    expect(o["Drama"].name == "drama", "subscript");
    expect(o.findTypedef("written_by") != nullptr && o.typedefAt("written_by").name == "written by", "typedef lookup");

    auto ids = std::vector<string>();
    for (auto const& t: o) ids.push_back(t.id);
    expect((ids == std::vector<string>{"LiteratureForm", "Drama", "Hamlet", "Playwright", "Shakespeare"}), "insertion order");

    auto const e = expectThrows<core::NotFoundError>([&] { (void)o.at("Macbeth"); }, "at on a missing id");
    expect(e && e->id == "Macbeth", "missing id reported");
    expectThrows<core::NotFoundError>([&] { (void)o.parents("Macbeth"); }, "parents of a missing id");
    expectThrows<core::NotFoundError>([&] { (void)o.ancestors("Macbeth"); }, "ancestors of a missing id");
    expectThrows<core::NotFoundError>([&] { (void)o.typedefAt("wrote"); }, "missing typedef");
  }

  void testCycle() {
    auto const cyclic = literature + "\n[Term]\nid: Drama\nis_a: Hamlet\n";
    auto const e = expectThrows<core::CycleDetectedError>([&] { build(cyclic); }, "two-cycle through duplicate stanza");
    expect(e && e->cycle.size() == 2, "cycle of two");

    // Adding the edge to a built ontology fails and leaves it as it was.
    auto const o = build(literature);
    auto drama = core::Term{.id = "Drama"};
    drama.isA.insert("Hamlet");
    expectThrows<core::CycleDetectedError>([&] { graph::include(o, {drama}); }, "two-cycle through include");
    expect((o.parents("Drama") == IdSet{"LiteratureForm"}), "parents untouched");
    expect((o.ancestors("Hamlet") == IdSet{"Drama", "LiteratureForm"}), "ancestors untouched");

    auto const self = expectThrows<core::CycleDetectedError>([] { build("[Term]\nid: A\nis_a: A\n"); }, "self loop");
    expect(self && (self->cycle == std::vector<string>{"A"}), "self loop cycle");

    auto const longer = expectThrows<core::CycleDetectedError>(
      [] { build("[Term]\nid: A\nis_a: B\n\n[Term]\nid: B\nis_a: C\n\n[Term]\nid: C\nis_a: A\n"); }, "three-cycle"
    );
    expect(longer && (longer->cycle == std::vector<string>{"A", "B", "C"}), "cycle in edge order");
  }

  void testInverseRepair() {
    auto const o = build(
      "[Typedef]\nid: part_of\ninverse_of: has_part\n\n"
      "[Typedef]\nid: has_part\n\n"
      "[Term]\nid: Wheel\nrelationship: part_of Car\n\n"
      "[Term]\nid: Car\n"
    );
    expect(o.typedefAt("has_part").inverseOf == "part_of", "one-sided inverse repaired");
    expect(count(o, Diagnostic::Kind::inverseRepaired) == 1, "repair reported");
    expect((o.related("Car", "has_part") == IdSet{"Wheel"}), "repaired inverse materialized");

    expectThrows<core::InverseConflictError>(
      [] {
        build(
          "[Typedef]\nid: a\ninverse_of: b\n\n"
          "[Typedef]\nid: b\ninverse_of: c\n\n"
          "[Typedef]\nid: c\ninverse_of: b\n"
        );
      },
      "conflicting inverses"
    );

    auto const sym = build(
      "[Typedef]\nid: interacts_with\ninverse_of: interacts_with\n\n"
      "[Term]\nid: X\nrelationship: interacts_with Y\n\n"
      "[Term]\nid: Y\n"
    );
    expect((sym.related("Y", "interacts_with") == IdSet{"X"}), "symmetric relation");
  }

  void testUnresolved() {
    auto const text = string(
      "[Typedef]\nid: part_of\ninverse_of: has_part\n\n"
      "[Term]\nid: A\nis_a: Missing\nrelationship: part_of Nowhere\nrelationship: adjacent_to B\n\n"
      "[Term]\nid: B\n"
    );
    auto const o = build(text);
    auto const& u = o.unresolved();
    expect(u.size() == 4, "four unresolved references");
    expect((u[0] == core::UnresolvedReference{"part_of", "inverse_of", "has_part", true}), "undeclared inverse");
    expect((u[1] == core::UnresolvedReference{"A", "is_a", "Missing"}), "unresolved parent");
    expect((u[2] == core::UnresolvedReference{"A", "relationship", "adjacent_to", true}), "undeclared typedef");
    expect((u[3] == core::UnresolvedReference{"A", "part_of", "Nowhere"}), "unresolved target");
    expect(count(o, Diagnostic::Kind::unresolvedReference) == 4, "each reported as a diagnostic");

    expect(o.parents("A").empty(), "unresolved parent is not an edge");
    expect(o.at("A").isA.contains("Missing"), "but stays on the term");
    expect((o.related("A", "adjacent_to") == IdSet{"B"}), "edge of an undeclared typedef kept");
    expect(o.relations("B").empty(), "without an inverse");

    auto const e = expectThrows<core::UnresolvedReferenceError>(
      [&] { build(text, graph::BuildParams{.strictReferences = true}); }, "strict build"
    );
    expect(e && e->references.size() == 4, "strict error lists every reference");
  }

  void testDuplicateStanzas() {
    auto const o = build(
      "[Term]\nid: A\nname: first\nis_a: P\n\n"
      "[Term]\nid: P\n\n"
      "[Term]\nid: Q\n\n"
      "[Term]\nid: A\nname: second\nis_a: Q\ndef: \"late\" []\n"
    );
    expect(o.size() == 3, "stanzas unified");
    expect(o.at("A").name == "first", "first name kept");
    expect(o.at("A").def == "\"late\" []", "missing def filled");
    expect((o.parents("A") == IdSet{"P", "Q"}), "parents unioned");
    expect(count(o, Diagnostic::Kind::duplicateStanza) == 1, "duplicate reported");
  }

  void testDepth() {
    auto const o = build(
      "[Term]\nid: A\n\n"
      "[Term]\nid: B\nis_a: A\n\n"
      "[Term]\nid: C\nis_a: B\n\n"
      "[Term]\nid: D\nis_a: C\nis_a: A\n"
    );
    using Depth = Ontology::Depth;
    expect((o.ancestors("D", Depth{1}) == IdSet{"C", "A"}), "one step up");
    expect((o.ancestors("D", Depth{2}) == IdSet{"C", "A", "B"}), "two steps up");
    expect((o.ancestors("D", Depth{2, false}) == IdSet{"B"}), "exactly two steps up");
    expect((o.ancestors("D", Depth{}) == o.ancestors("D")), "unbounded");
    expect(o.descendants("A", Depth{0}).empty(), "zero steps");
    expect((o.descendants("A", Depth{3, false}) == IdSet{"D"}), "exactly three steps down");
    expect((o.descendants("A", Depth{1}) == IdSet{"B", "D"}), "direct children");

    auto const& twice = o.ancestors("D", Depth{2});
    expect(&twice == &o.ancestors("D", Depth{2}), "depth-limited result is cached");
    expect(&twice != &o.ancestors("D", Depth{2, false}), "cached per intermediate flag");
    expect((o.ancestors("D", Depth{2, false}) == IdSet{"B"}), "cached entry keeps its own result");
  }

  void testSetTraversal() {
    auto const o = build(
      "[Term]\nid: R\n\n"
      "[Term]\nid: X\nis_a: R\n\n"
      "[Term]\nid: Y\nis_a: R\n\n"
      "[Term]\nid: X1\nis_a: X\n\n"
      "[Term]\nid: Y1\nis_a: Y\n"
    );
    expect((o.childrenOfAll(o.children("R")) == IdSet{"X1", "Y1"}), "grandchildren");
    expect((o.parentsOfAll(IdSet{"X1", "Y1"}) == IdSet{"X", "Y"}), "parents of a set");
    expect((o.ancestorsOfAll(IdSet{"X1", "Y"}) == IdSet{"X", "R"}), "ancestors of a set");
    expect((o.descendantsOfAll(IdSet{"X", "Y"}) == IdSet{"X1", "Y1"}), "descendants of a set");
    expect(o.childrenOfAll(IdSet{}).empty(), "empty set");
  }

  void testProgrammatic() {
    auto raw = core::RawEntitySet{};
    raw.typedefs.push_back(core::Typedef{.id = "part_of", .inverseOf = "has_part"});
    raw.typedefs.push_back(core::Typedef{.id = "has_part", .inverseOf = "part_of"});
    auto wheel = core::Term{.id = "Wheel"};
    wheel.relate("part_of", "Car");
    raw.terms.push_back(core::Term{.id = "Car"});
    raw.terms.push_back(std::move(wheel));
    auto const o = graph::GraphBuilder().build(std::move(raw));
    expect((o.related("Car", "has_part") == IdSet{"Wheel"}), "built without text");
    expect(o.diagnostics().empty(), "nothing to report");
  }

  void testEquality() {
    auto const a = build(literature);
    auto const b = build(literature);
    expect(a == b, "same text, same ontology");
    auto const c = build(literature + "\n[Term]\nid: Macbeth\nis_a: Drama\n");
    expect(a != c, "extra term");
    auto const renamed = build(literature + "\n[Term]\nid: Drama\nname: play\n");
    expect(a == renamed, "names are not observed");
  }

  void testConcurrentReaders() {
    auto const o = build(literature);
    auto const expected = IdSet{"Drama", "LiteratureForm"};
    auto ok = std::vector<int>(8, 0);
    auto threads = std::vector<std::thread>();
    for (auto i = 0uz; i < ok.size(); i++)
      threads.emplace_back([&, i] {
        auto good = true;
        for (auto const& t: o) good = good && !o.ancestors(t.id).contains(t.id);
        ok[i] = good && o.ancestors("Hamlet") == expected;
      });
    for (auto& t: threads) t.join();
    for (auto const v: ok) expect(v == 1, "concurrent traversal");
  }

}

auto main() -> int {
  testLiterature();
  testLookup();
  testCycle();
  testInverseRepair();
  testUnresolved();
  testDuplicateStanzas();
  testDepth();
  testSetTraversal();
  testProgrammatic();
  testEquality();
  testConcurrentReaders();
  return testing::summary("testgraph");
}
