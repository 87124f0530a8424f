#include <sstream>
#include <string>
#include <vector>
#include <core/entity.hpp>
#include <core/errors.hpp>
#include <parsing/lexer.hpp>
#include <parsing/parser.hpp>
#include <parsing/stream.hpp>
#include "testing.hpp"

using std::string;
using namespace ontograph;
using namespace ontograph::parsing;
using core::Diagnostic;
using testing::expect, testing::expectStrEq;

namespace {

  auto parse(string text, ParserParams params = {}) -> core::RawEntitySet {
    auto lines = StringLineStream(std::move(text));
    return StanzaParser(lines, std::move(params)).parse();
  }

  auto count(core::RawEntitySet const& raw, Diagnostic::Kind kind) -> size_t {
    auto res = 0uz;
    for (auto const& d: raw.diagnostics)
      if (d.kind == kind) res++;
    return res;
  }

  void testLineStreams() {
    auto s = StringLineStream("a\r\nb\n\nc");
    expect(s.advance() == "a", "carriage return dropped");
    expect(s.advance() == "b", "second line");
    expect(s.advance() == "", "empty line");
    expect(s.advance() == "c", "last line without newline");
    expect(s.position() == 4, "four lines read");
    expect(!s.advance(), "end of input");

    auto in = std::istringstream("x\r\ny\n");
    auto t = InputLineStream(in);
    expect(t.advance() == "x", "stream line");
    expect(t.advance() == "y", "stream line");
    expect(!t.advance() && t.position() == 2, "stream end");
  }

  void testLexer() {
    using enum Token::Kind;
    expect(lexLine("   ", 1).kind == blank, "blank line");
    expect(lexLine("! just a comment", 2).kind == comment, "comment line");

    auto const h = lexLine("[Term]", 3);
    expect(h.kind == header && h.tag == "Term" && h.line == 3, "stanza header");
    expect(lexLine("[]", 4).kind == malformed, "empty header");
    expect(lexLine("[Term", 4).kind == malformed, "unclosed header");

    auto const t = lexLine("is_a: GO:0000002 ! parent term", 5);
    expect(t.kind == tagValue, "tag/value line");
    expectStrEq(t.tag, "is_a", "tag");
    expectStrEq(t.value, "GO:0000002", "value without comment");
    expectStrEq(t.comment, "parent term", "trailing comment");

    expectStrEq(lexLine("id:GO:0000001", 6).value, "GO:0000001", "value split at the first colon");
    expectStrEq(lexLine("name: wow!", 7).value, "wow!", "bang inside a word is text");
    expectStrEq(lexLine("name: a \\! b", 8).value, "a ! b", "escaped bang");
    expectStrEq(lexLine("def: \"x ! y\" []", 9).value, "\"x ! y\" []", "bang inside quotes");
    auto const inches = lexLine("name: 5\" disk ! floppy", 9);
    expectStrEq(inches.value, "5\" disk", "lone quote in a plain value");
    expectStrEq(inches.comment, "floppy", "comment after a lone quote");
    expect(lexLine("no colon here", 10).kind == malformed, "missing colon");
    expect(lexLine("two words: x", 11).kind == malformed, "tag with blanks");
    expect(lexLine(": x", 12).kind == malformed, "empty tag");
  }

  void testLexerHelpers() {
    auto const [first, rest] = splitWord("  part_of   GO:1 GO:2 ");
    expectStrEq(string(first), "part_of", "first word");
    expectStrEq(string(rest), "GO:1 GO:2", "remainder");
    expectStrEq(string(stripQualifiers("GO:1 {source=\"x\"}")), "GO:1", "qualifier block removed");
    expectStrEq(string(stripQualifiers("{odd}")), "{odd}", "a bare brace block is kept");
    expectStrEq(escapeValue("a!b ! c"), "a\\!b \\! c", "every bang escaped");
  }

  void testHeader() {
    auto const raw = parse(
      "format-version: 1.2\n"
      "data-version: 2024-01-01\n"
      "default-namespace: literature\n"
      "import: base.obo\n"
      "remark: first\n"
      "remark: second\n"
    );
    auto const& meta = raw.metadata;
    expect(meta.formatVersion == "1.2", "format version");
    expect(meta.defaultNamespace == "literature", "default namespace");
    expect((meta.imports == std::vector<string>{"base.obo"}), "imports");
    expect((meta.remarks == std::vector<string>{"first", "second"}), "remarks in order");
    expect(meta.other.size() == 1 && meta.other[0].first == "data-version", "other header entries kept");
    expect(count(raw, Diagnostic::Kind::unknownTag) == 1, "uninterpreted header tag reported");
  }

  void testStanzas() {
    auto const raw = parse(
      "default-namespace: literature\n"
      "[Typedef]\n"
      "id: written_by\n"
      "name: written by\n"
      "inverse_of: has_written ! forward reference\n"
      "\n"
      "[Term]\n"
      "id: Hamlet ! the play\n"
      "name: Hamlet\n"
      "def: \"A tragedy.\" [ISBN:0]\n"
      "synonym: \"The Tragedy of Hamlet\" EXACT []\n"
      "is_a: Drama {is_inferred=\"false\"} ! drama\n"
      "relationship: written_by Shakespeare ! William Shakespeare\n"
      "\n"
      "[Term]\n"
      "id: Ophelia\n"
      "namespace: characters\n"
      "relationship: appears_in: Hamlet\n"
      "is_obsolete: true\n"
    );
    expect(raw.typedefs.size() == 1, "one typedef");
    auto const& td = raw.typedefs[0];
    expect(td.id == "written_by" && td.name == "written by", "typedef attributes");
    expect(td.inverseOf == "has_written", "inverse kept as a raw id");
    expect(td.line == 2, "typedef line");

    expect(raw.terms.size() == 2, "two terms");
    auto const& hamlet = raw.terms[0];
    expectStrEq(hamlet.id, "Hamlet", "id without comment");
    expect(hamlet.def == "\"A tragedy.\" [ISBN:0]", "raw def");
    expectStrEq(hamlet.ns, "literature", "default namespace threaded");
    expect((hamlet.isA == core::IdSet{"Drama"}), "qualifiers dropped from is_a");
    expect((hamlet.relationships.at("written_by") == core::IdSet{"Shakespeare"}), "forward reference stored");
    expect(hamlet.other.size() == 1 && hamlet.other[0].first == "synonym", "synonym kept as other tag");
    expect(hamlet.line == 7, "term line");
    expect(!hamlet.obsolete, "not obsolete");

    auto const& ophelia = raw.terms[1];
    expectStrEq(ophelia.ns, "characters", "explicit namespace");
    expect(ophelia.relationships.contains("appears_in"), "trailing colon on relation tolerated");
    expect(ophelia.obsolete, "obsolete flag");
  }

  void testNamespaceParams() {
    auto const fallback = parse("[Term]\nid: A\n", ParserParams{"fallback"});
    expectStrEq(fallback.terms[0].ns, "fallback", "namespace from parameters");
    expect(fallback.metadata.defaultNamespace == "fallback", "parameters recorded as default");

    auto const declared = parse("default-namespace: declared\n[Term]\nid: A\n", ParserParams{"fallback"});
    expectStrEq(declared.terms[0].ns, "declared", "header wins over parameters");

    auto const none = parse("[Term]\nid: A\n");
    expect(none.terms[0].ns.empty() && !none.metadata.defaultNamespace, "no namespace at all");
  }

  void testDiagnostics() {
    auto const raw = parse(
      "format-version: 1.2\n" // 1
      "this line is wrong\n"  // 2
      "\n"                    // 3
      "[Term]\n"              // 4
      "id: A\n"               // 5
      "name: first\n"         // 6
      "name: second\n"        // 7
      "def:\n"                // 8
      "relationship: part_of\n" // 9
      "is_obsolete: maybe\n"  // 10
      "\n"                    // 11
      "[Instance]\n"          // 12
      "id: I\n"               // 13
      "instance_of: A\n"      // 14
      "\n"                    // 15
      "[Term]\n"              // 16
      "id: B\n"               // 17
    );
    expect(raw.terms.size() == 2, "both terms parsed");
    expectStrEq(raw.terms[0].name, "first", "first name kept");
    expect(raw.terms[0].relationships.empty(), "relationship without target skipped");
    expect(!raw.terms[0].obsolete, "bad obsolete value ignored");

    expect(count(raw, Diagnostic::Kind::malformedLine) == 3, "malformed lines");
    expect(count(raw, Diagnostic::Kind::duplicateTag) == 1, "duplicate name");
    expect(count(raw, Diagnostic::Kind::emptyValue) == 1, "empty def");
    expect(count(raw, Diagnostic::Kind::unknownStanza) == 1, "instance stanza skipped");
    expect(count(raw, Diagnostic::Kind::unknownTag) == 0, "skipped stanza tags are not reported");
    expect(raw.diagnostics.front().line == 2, "diagnostic line number");
    expect(raw.diagnostics[1].line == 7, "duplicate reported at the repeat");
  }

  void testMissingId() {
    auto const text = string(
      "format-version: 1.2\n" // 1
      "\n"                    // 2
      "[Term]\n"              // 3
      "id: A\n"               // 4
      "\n"                    // 5
      "[Term]\n"              // 6
      "name: nameless\n"      // 7
    );
    auto const e = testing::expectThrows<core::ParseError>([&] { parse(text); }, "stanza without id");
    expect(e && e->line == 6, "error points at the stanza header");

    auto const f = testing::expectThrows<core::ParseError>([] { parse("[Typedef]\nname: x\n"); }, "typedef without id");
    expect(f && f->line == 1, "typedef stanza line");
  }

}

auto main() -> int {
  testLineStreams();
  testLexer();
  testLexerHelpers();
  testHeader();
  testStanzas();
  testNamespaceParams();
  testDiagnostics();
  testMissingId();
  return testing::summary("testparsing");
}
