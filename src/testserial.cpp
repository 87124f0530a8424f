#include <string>
#include <nlohmann/json.hpp>
#include <core/ontology.hpp>
#include <graph/builder.hpp>
#include <graph/merge.hpp>
#include <parsing/format.hpp>
#include <parsing/stream.hpp>
#include <serial/json_export.hpp>
#include <serial/obo_writer.hpp>
#include "testing.hpp"

using std::string;
using nlohmann::json;
using namespace ontograph;
using core::Ontology;
using testing::expect, testing::expectStrEq;

namespace {

  auto build(string text) -> Ontology {
    auto format = parsing::OboFormat();
    auto lines = parsing::StringLineStream(std::move(text));
    return graph::load(format, lines);
  }

  auto write(Ontology const& o) -> string {
    return serial::OboWriter().write(o);
  }

  auto const sample = string(
    "format-version: 1.2\n"
    "remark: hello\n"
    "default-namespace: test\n"
    "\n"
    "[Typedef]\n"
    "id: part_of\n"
    "name: part of\n"
    "inverse_of: has_part\n"
    "\n"
    "[Typedef]\n"
    "id: has_part\n"
    "name: has part\n"
    "\n"
    "[Term]\n"
    "id: A\n"
    "name: alpha\n"
    "synonym: \"a\" EXACT []\n"
    "def: \"First letter.\" []\n"
    "\n"
    "[Term]\n"
    "id: B\n"
    "is_obsolete: true\n"
    "name: beta\n"
    "namespace: other\n"
    "relationship: part_of Z\n"
    "relationship: part_of A\n"
    "is_a: A ! stale comment\n"
  );

  void testCanonicalText() {
    auto const expected = string(
      "format-version: 1.2\n"
      "default-namespace: test\n"
      "remark: hello\n"
      "\n"
      "[Typedef]\n"
      "id: part_of\n"
      "name: part of\n"
      "inverse_of: has_part ! has part\n"
      "\n"
      "[Typedef]\n"
      "id: has_part\n"
      "name: has part\n"
      "inverse_of: part_of ! part of\n"
      "\n"
      "[Term]\n"
      "id: A\n"
      "name: alpha\n"
      "def: \"First letter.\" []\n"
      "synonym: \"a\" EXACT []\n"
      "\n"
      "[Term]\n"
      "id: B\n"
      "name: beta\n"
      "namespace: other\n"
      "is_a: A ! alpha\n"
      "relationship: part_of Z\n"
      "relationship: part_of A ! alpha\n"
      "is_obsolete: true\n"
    );
    auto const o = build(sample);
    expectStrEq(write(o), expected, "canonical output");
    expectStrEq(parsing::OboFormat().serialize(o), expected, "format adapter writes the same text");
  }

  void testRoundTrip() {
    auto const o = build(sample);
    auto const text = write(o);
    auto const back = build(text);
    expect(back == o, "observationally equal after a round trip");
    expectStrEq(write(back), text, "writing is stable");
    expect((back.unresolved() == o.unresolved()), "unresolved edges survive");
    expect(back.at("B").obsolete && back.at("B").ns == "other", "attributes survive");
    expect(back.at("A").other == o.at("A").other, "other tags survive");
  }

  void testMirroredEdgesNotWritten() {
    auto const o = build(
      "[Typedef]\nid: written_by\ninverse_of: has_written\n\n"
      "[Typedef]\nid: has_written\ninverse_of: written_by\n\n"
      "[Term]\nid: Hamlet\nrelationship: written_by Shakespeare\n\n"
      "[Term]\nid: Shakespeare\n"
    );
    auto const text = write(o);
    expect(text.find("has_written Hamlet") == string::npos, "mirrored edge is derived, not written");
    auto const back = build(text);
    expect(back.related("Shakespeare", "has_written").contains("Hamlet"), "mirrored edge rebuilt");
  }

  void testEscaping() {
    auto const o = build("[Term]\nid: W\nname: Wow \\! a bang\ndef: \"Yes ! really\" []\ncomment: hi ! there\n");
    expectStrEq(o.at("W").name, "Wow ! a bang", "escaped bang read");
    auto const text = write(o);
    expect(text.find("name: Wow \\! a bang\n") != string::npos, "bang escaped on output");
    auto const back = build(text);
    expectStrEq(back.at("W").name, "Wow ! a bang", "name survives");
    expect(back.at("W").def == o.at("W").def, "def survives");
    expect(back.at("W").other == o.at("W").other, "comment tag value survives");
  }

  void testMergedRoundTrip() {
    auto const a = build(sample);
    auto const b = build("[Term]\nid: C\nis_a: B\n\n[Term]\nid: Z\nname: zed\n");
    auto const m = graph::merge(a, b);
    auto const back = build(write(m));
    expect(back == m, "merged ontology round trip");
    expect(back.unresolved().empty(), "Z is now declared");
  }

  void testJson() {
    auto const o = build(sample);
    auto const j = serial::toJson(o);
    expect(j.is_object() && j.size() == 2, "one entry per term");

    auto const& a = j.at("A");
    expect(a.at("id") == "A" && a.at("name") == "alpha", "id and name");
    expect(a.at("namespace") == "test", "namespace");
    expect(a.at("def") == "\"First letter.\" []", "def");
    expect(a.at("obsolete") == false, "not obsolete");
    expect(a.at("is_a") == json::array(), "no parents");
    expect(a.at("relationships") == json::object(), "no relationships");
    expect(a.at("other").at("synonym") == json::array({"\"a\" EXACT []"}), "other tags grouped");

    auto const& b = j.at("B");
    expect(!b.contains("def"), "absent def left out");
    expect(b.at("obsolete") == true, "obsolete");
    expect(b.at("namespace") == "other", "own namespace");
    expect(b.at("is_a") == json::array({"A"}), "parents");
    expect(b.at("relationships").at("part_of") == json::array({"Z", "A"}), "targets in input order");

    auto const text = serial::dumpJson(o);
    expect(text.find("\n  \"A\": {") != string::npos, "two-space indent");
    expect(json::parse(text) == j, "dump parses back");
  }

}

auto main() -> int {
  testCanonicalText();
  testRoundTrip();
  testMirroredEdgesNotWritten();
  testEscaping();
  testMergedRoundTrip();
  testJson();
  return testing::summary("testserial");
}
