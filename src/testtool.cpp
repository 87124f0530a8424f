#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <tool/driver.hpp>
#include "testing.hpp"

using std::string;
using namespace ontograph;
using testing::expect;

namespace {

  namespace fs = std::filesystem;

  auto const dir = fs::temp_directory_path() / "ontograph-testtool";

  auto write(string const& name, string const& text) -> string {
    auto const path = dir / name;
    auto file = std::ofstream(path);
    file << text;
    return path.string();
  }

  struct Result {
    int status;
    string out, log;
  };

  auto run(std::vector<string> args) -> Result {
    args.insert(args.begin(), "ontotool");
    auto out = std::ostringstream(), log = std::ostringstream();
    auto const status = tool::run(args, out, log);
    return Result{status, out.str(), log.str()};
  }

  auto count(string const& s, string const& what) -> size_t {
    auto res = 0uz;
    for (auto pos = s.find(what); pos != string::npos; pos = s.find(what, pos + 1)) res++;
    return res;
  }

  void testUsage() {
    auto const none = run({});
    expect(none.status == 1 && none.log.contains("usage:"), "no files");
    auto const bad = run({"--bogus", "x.obo"});
    expect(bad.status == 1 && bad.log.contains("unknown option --bogus"), "unknown option");
    auto const dangling = run({"--namespace"});
    expect(dangling.status == 1 && dangling.log.contains("--namespace expects an argument"), "missing argument");
    auto const missing = run({(dir / "absent.obo").string()});
    expect(missing.status == 1 && missing.log.contains("error: cannot open"), "missing file");
  }

  void testImports() {
    auto const a = write("a.obo", "import: b.obo\ndefault-namespace: test\n\n[Term]\nid: A\nis_a: B\n");
    write("b.obo", "import: file:a.obo\n\n[Term]\nid: B\nsynonym: \"bee\" EXACT []\n");

    auto const linked = run({"--imports", "--strict", a});
    expect(linked.status == 0, "import resolves the reference");
    expect(linked.out.contains("id: A") && linked.out.contains("id: B"), "both files in the output");
    expect(count(linked.log, "b.obo:5: unknown-tag: ") == 1, "imported file loaded once despite the cycle");

    auto const alone = run({a});
    expect(alone.status == 0 && !alone.out.contains("id: B"), "imports not followed by default");
    expect(alone.log.contains("a.obo:4: unresolved-reference: "), "dangling is_a reported");
  }

  void testStrict() {
    auto const plain = write("plain.obo", "[Term]\nid: A\nis_a: B\n");
    auto const leaf = write("leaf.obo", "[Term]\nid: B\n");
    auto const alone = run({"--strict", plain});
    expect(alone.status == 1 && alone.log.contains("error: 1 unresolved reference(s)"), "strict fails on its own");
    expect(alone.out.empty(), "nothing written on failure");
    auto const merged = run({"--strict", plain, leaf});
    expect(merged.status == 0, "strict checked after merging every input");
  }

  void testFailures() {
    auto const nameless = write("nameless.obo", "[Term]\nname: nameless\n");
    auto const parsed = run({nameless});
    expect(parsed.status == 1, "parse error exit status");
    expect(parsed.log.contains("nameless.obo: line 1: [Term] stanza has no id"), "parse error names the file");

    auto const cyclic = write("cyclic.obo", "[Term]\nid: A\nis_a: B\n\n[Term]\nid: B\nis_a: A\n");
    auto const cycle = run({cyclic});
    expect(cycle.status == 1 && cycle.log.contains("error: is_a cycle detected"), "cycle exit status");
  }

  void testJson() {
    auto const leaf = write("named.obo", "[Term]\nid: B\nname: bee\n");
    auto const res = run({"--json", "--namespace", "insects", leaf});
    expect(res.status == 0, "json exit status");
    auto const j = nlohmann::json::parse(res.out, nullptr, false);
    expect(!j.is_discarded() && j.contains("B"), "json keyed by id");
    expect(!j.is_discarded() && j["B"]["name"] == "bee" && j["B"]["namespace"] == "insects", "json term fields");
  }

}

auto main() -> int {
  fs::create_directories(dir);
  testUsage();
  testImports();
  testStrict();
  testFailures();
  testJson();
  fs::remove_all(dir);
  return testing::summary("testtool");
}
