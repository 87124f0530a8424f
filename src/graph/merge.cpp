#include "merge.hpp"
#include <algorithm>
#include <unordered_map>

namespace ontograph::graph {
#include "macros_open.hpp"

  using core::Diagnostic;
  using core::Id;
  using core::Ontology;
  using core::RawEntitySet;
  using core::Term;
  using core::Typedef;

  namespace {

    template <typename T>
    auto appendMissing(std::vector<T>& to, std::vector<T> const& from) -> void {
      for (auto const& entry: from)
        if (std::find(to.begin(), to.end(), entry) == to.end()) to.push_back(entry);
    }

    auto mergeTypedef(Typedef& into, Typedef const& from) -> void {
      if (into.inverseOf && from.inverseOf && *into.inverseOf != *from.inverseOf)
        throw core::MergeConflictError(into.id, into.inverseOf, from.inverseOf);
      if (!into.inverseOf) into.inverseOf = from.inverseOf;
      if (into.name.empty()) into.name = from.name;
      if (!into.def) into.def = from.def;
      appendMissing(into.other, from.other);
    }

    auto mergeTerm(Term& into, Term const& from, std::vector<Diagnostic>& diagnostics) -> void {
      if (into.name.empty()) into.name = from.name;
      else if (!from.name.empty() && from.name != into.name)
        diagnostics.push_back(Diagnostic{
          Diagnostic::Kind::nameConflict,
          "term " + into.id + " is named '" + into.name + "' and '" + from.name + "', keeping '" + into.name + "'"
        });
      if (!into.def) into.def = from.def;
      if (into.ns.empty()) into.ns = from.ns;
      into.obsolete = into.obsolete || from.obsolete;
      into.isA.insert(from.isA);
      for (auto const& [relation, targets]: from.relationships) into.relationships[relation].insert(targets);
      appendMissing(into.other, from.other);
    }

    // Merges `from` into `into`, keeping `into`'s order and appending the new ids.
    template <typename T, typename F>
    auto unionById(std::vector<T>& into, std::vector<T> const& from, F&& f) -> void {
      auto index = std::unordered_map<Id, size_t>();
      for (auto i = 0uz; i < into.size(); i++) index.emplace(into[i].id, i);
      for (auto const& x: from) {
        if (auto const it = index.find(x.id); it != index.end()) f(into[it->second], x);
        else {
          index.emplace(x.id, into.size());
          into.push_back(x);
        }
      }
    }

  }

  auto toRaw(Ontology const& ontology) -> RawEntitySet {
    return RawEntitySet{ontology.metadata(), ontology.typedefs(), ontology.terms(), {}};
  }

  auto merge(Ontology const& primary, Ontology const& secondary, BuildParams params) -> Ontology {
    auto raw = toRaw(primary);
    auto const& meta = secondary.metadata();
    if (!raw.metadata.formatVersion) raw.metadata.formatVersion = meta.formatVersion;
    if (!raw.metadata.defaultNamespace) raw.metadata.defaultNamespace = meta.defaultNamespace;
    appendMissing(raw.metadata.remarks, meta.remarks);
    appendMissing(raw.metadata.imports, meta.imports);
    appendMissing(raw.metadata.other, meta.other);

    unionById(raw.typedefs, secondary.typedefs(), mergeTypedef);
    unionById(raw.terms, secondary.terms(), [&](Term& into, Term const& from) {
      mergeTerm(into, from, raw.diagnostics);
    });
    // Primary typedefs come first, so an inverse already paired there is reported as the primary one.
    try {
      return GraphBuilder(params).build(std::move(raw));
    } catch (core::InverseConflictError const& e) {
      throw core::MergeConflictError(e.typedefId, e.first, e.second);
    }
  }

  auto include(Ontology const& ontology, std::vector<Term> terms, BuildParams params) -> Ontology {
    auto raw = RawEntitySet{};
    raw.typedefs = ontology.typedefs();
    raw.terms = std::move(terms);
    for (auto& term: raw.terms)
      if (term.ns.empty()) term.ns = ontology.defaultNamespace();
    // References into `ontology` are unresolved until the merge, so this build is never strict.
    return merge(ontology, GraphBuilder().build(std::move(raw)), params);
  }

#include "macros_close.hpp"
}
