#include "obo_writer.hpp"
#include <parsing/lexer.hpp>

namespace ontograph::serial {
#include "macros_open.hpp"

  using parsing::escapeValue;

  auto OboWriter::write(core::Ontology const& ontology) -> std::string {
    _out.str(std::string());
    _header(ontology.metadata());
    for (auto const& td: ontology.typedefs()) _typedef(ontology, td);
    for (auto const& term: ontology) _term(ontology, term);
    return _out.str();
  }

  auto OboWriter::_tag(std::string const& tag, std::string const& value) -> void {
    _out << tag << ": " << escapeValue(value) << "\n";
  }

  // Edge line with the target's current name as comment (none if the target is unknown).
  auto OboWriter::_edge(std::string const& tag, std::string const& value, std::string const* name) -> void {
    _out << tag << ": " << escapeValue(value);
    if (name && !name->empty()) _out << " ! " << *name;
    _out << "\n";
  }

  auto OboWriter::_header(core::Metadata const& meta) -> void {
    if (meta.formatVersion) _tag("format-version", *meta.formatVersion);
    if (meta.defaultNamespace) _tag("default-namespace", *meta.defaultNamespace);
    for (auto const& [tag, value]: meta.other) _tag(tag, value);
    for (auto const& import: meta.imports) _tag("import", import);
    for (auto const& remark: meta.remarks) _tag("remark", remark);
  }

  auto OboWriter::_typedef(core::Ontology const& ontology, core::Typedef const& td) -> void {
    _separate();
    _out << "[Typedef]\n";
    _tag("id", td.id);
    if (!td.name.empty()) _tag("name", td.name);
    if (td.def) _tag("def", *td.def);
    if (td.inverseOf) {
      auto const inverse = ontology.findTypedef(*td.inverseOf);
      _edge("inverse_of", *td.inverseOf, inverse ? &inverse->name : nullptr);
    }
    for (auto const& [tag, value]: td.other) _tag(tag, value);
  }

  auto OboWriter::_term(core::Ontology const& ontology, core::Term const& term) -> void {
    auto nameOf = [&](core::Id const& id) -> std::string const* {
      auto const target = ontology.find(id);
      return target ? &target->name : nullptr;
    };
    _separate();
    _out << "[Term]\n";
    _tag("id", term.id);
    if (!term.name.empty()) _tag("name", term.name);
    if (!term.ns.empty() && term.ns != ontology.defaultNamespace()) _tag("namespace", term.ns);
    if (term.def) _tag("def", *term.def);
    for (auto const& [tag, value]: term.other) _tag(tag, value);
    for (auto const& parent: term.isA) _edge("is_a", parent, nameOf(parent));
    for (auto const& [relation, targets]: term.relationships)
      for (auto const& target: targets) _edge("relationship", relation + " " + target, nameOf(target));
    if (term.obsolete) _tag("is_obsolete", "true");
  }

#include "macros_close.hpp"
}
