#include "driver.hpp"
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <unordered_set>
#include <core/errors.hpp>
#include <core/ontology.hpp>
#include <graph/builder.hpp>
#include <graph/merge.hpp>
#include <parsing/format.hpp>
#include <parsing/stream.hpp>
#include <serial/json_export.hpp>

namespace ontograph::tool {
#include "macros_open.hpp"

  using std::string;
  using std::endl;

  namespace {

    // Command-line options.
    struct Options {
      bool json = false;
      bool imports = false;
      bool strict = false;
      parsing::ParserParams parser;
      std::vector<string> files;
    };

    auto usage(std::ostream& log) -> void {
      log << "usage: ontotool [--json] [--imports] [--strict] [--namespace NS] FILE..." << endl;
    }

    auto parseArgs(std::vector<string> const& args, std::ostream& log) -> std::optional<Options> {
      auto res = Options();
      for (auto i = 1uz; i < args.size(); i++) {
        auto const& arg = args[i];
        if (arg == "--json") res.json = true;
        else if (arg == "--imports") res.imports = true;
        else if (arg == "--strict") res.strict = true;
        else if (arg == "--namespace") {
          if (++i == args.size()) {
            log << "--namespace expects an argument" << endl;
            return std::nullopt;
          }
          res.parser.defaultNamespace = args[i];
        } else if (arg.starts_with("--")) {
          log << "unknown option " << arg << endl;
          return std::nullopt;
        } else res.files.push_back(arg);
      }
      if (res.files.empty()) return std::nullopt;
      return res;
    }

    auto printDiagnostics(std::ostream& log, string const& source, std::vector<core::Diagnostic> const& diagnostics)
      -> void {
      for (auto const& [kind, message, line]: diagnostics) {
        log << source;
        if (line > 0) log << ":" << line;
        log << ": " << core::kindName(kind) << ": " << message << endl;
      }
    }

    // Loads `path` and, if enabled, the local files it imports (depth first, each file at most once).
    class Loader {
    public:
      Loader(Options const& options, std::ostream& log):
          _options(options),
          _format(options.parser),
          _log(log) {}

      auto load(std::filesystem::path const& path) -> core::Ontology {
        _visited.insert(std::filesystem::weakly_canonical(path).string());
        auto in = std::ifstream(path);
        if (!in) throw std::runtime_error("cannot open " + path.string());
        auto lines = parsing::InputLineStream(in);
        auto res = _parse(path, lines);
        printDiagnostics(_log, path.string(), res.diagnostics());
        if (!_options.imports) return res;

        for (auto const& import: res.metadata().imports) {
          auto target = path.parent_path() / _localPath(import);
          if (!std::filesystem::is_regular_file(target)) continue; // Not a local file.
          if (_visited.contains(std::filesystem::weakly_canonical(target).string())) continue;
          auto imported = load(target);
          res = _merge(res, imported);
        }
        return res;
      }

      auto merge(core::Ontology const& primary, core::Ontology const& secondary) -> core::Ontology {
        return _merge(primary, secondary);
      }

      auto format() -> parsing::FormatAdapter& { return _format; }

    private:
      Options const& _options;
      parsing::OboFormat _format;
      std::ostream& _log;
      std::unordered_set<string> _visited;

      auto _parse(std::filesystem::path const& path, parsing::IStream<string>& lines) -> core::Ontology {
        try {
          return graph::load(_format, lines);
        } catch (core::ParseError const& e) {
          _log << path.string() << ": " << e.what() << endl;
          throw;
        }
      }

      static auto _localPath(string const& import) -> string {
        return import.starts_with("file:") ? import.substr(5) : import;
      }

      // Only the conflicts are new here; everything else was already reported per file.
      auto _merge(core::Ontology const& primary, core::Ontology const& secondary) -> core::Ontology {
        auto res = graph::merge(primary, secondary);
        for (auto const& d: res.diagnostics())
          if (d.kind == core::Diagnostic::Kind::nameConflict) printDiagnostics(_log, "merge", {d});
        return res;
      }
    };

  }

  auto run(std::vector<string> const& args, std::ostream& out, std::ostream& log) -> int {
    auto const options = parseArgs(args, log);
    if (!options) {
      usage(log);
      return 1;
    }

    try {
      auto loader = Loader(*options, log);
      auto res = loader.load(options->files.front());
      for (auto i = 1uz; i < options->files.size(); i++) {
        auto next = loader.load(options->files[i]);
        res = loader.merge(res, next);
      }
      if (options->strict && !res.unresolved().empty()) throw core::UnresolvedReferenceError(res.unresolved());
      out << (options->json ? serial::dumpJson(res) + "\n" : loader.format().serialize(res));
    } catch (core::ParseError const&) {
      return 1; // Already reported with the file name.
    } catch (std::runtime_error const& e) {
      log << "error: " << e.what() << endl;
      return 1;
    }
    return 0;
  }

#include "macros_close.hpp"
}
