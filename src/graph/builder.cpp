#include "builder.hpp"
#include <algorithm>
#include <unordered_set>

namespace ontograph::graph {
#include "macros_open.hpp"

  using core::Diagnostic;
  using core::Id;
  using core::Ontology;
  using core::Term;
  using core::Typedef;
  using core::UnresolvedReference;

  namespace {

    auto appendMissing(core::Tags& to, core::Tags const& from) -> void {
      for (auto const& entry: from)
        if (std::find(to.begin(), to.end(), entry) == to.end()) to.push_back(entry);
    }

    // Folds a repeated stanza into the first one: edges unioned, first non-empty attribute kept.
    auto unify(Term& into, Term const& from) -> void {
      if (into.name.empty()) into.name = from.name;
      if (!into.def) into.def = from.def;
      into.isA.insert(from.isA);
      for (auto const& [relation, targets]: from.relationships) into.relationships[relation].insert(targets);
      into.obsolete = into.obsolete || from.obsolete;
      appendMissing(into.other, from.other);
    }

    auto unify(Typedef& into, Typedef const& from) -> void {
      if (into.name.empty()) into.name = from.name;
      if (!into.def) into.def = from.def;
      if (!into.inverseOf) into.inverseOf = from.inverseOf;
      else if (from.inverseOf && *from.inverseOf != *into.inverseOf)
        throw core::InverseConflictError(into.id, *into.inverseOf, *from.inverseOf);
      appendMissing(into.other, from.other);
    }

  }

  auto GraphBuilder::_report(Ontology& res, UnresolvedReference ref, size_t line) -> void {
    res._diagnostics.push_back(Diagnostic{Diagnostic::Kind::unresolvedReference, ref.toString(), line});
    res._unresolved.push_back(std::move(ref));
  }

  auto GraphBuilder::build(core::RawEntitySet raw) const -> Ontology {
    auto res = Ontology();
    res._metadata = std::move(raw.metadata);
    res._defaultNamespace = res._metadata.defaultNamespace.value_or("");
    res._diagnostics = std::move(raw.diagnostics);

    _registerTypedefs(res, std::move(raw.typedefs));
    _registerTerms(res, std::move(raw.terms));
    _pairInverses(res);
    _resolve(res);
    if (_params.strictReferences && !res._unresolved.empty()) throw core::UnresolvedReferenceError(res._unresolved);
    _checkAcyclic(res);
    return res;
  }

  auto GraphBuilder::_registerTerms(Ontology& res, std::vector<Term> terms) -> void {
    for (auto& term: terms) {
      if (auto const it = res._termIndex.find(term.id); it != res._termIndex.end()) {
        res._diagnostics.push_back(
          Diagnostic{Diagnostic::Kind::duplicateStanza, "term " + term.id + " is declared again, stanzas unified", term.line}
        );
        unify(res._terms[it->second], term);
        continue;
      }
      res._termIndex.emplace(term.id, res._terms.size());
      res._terms.push_back(std::move(term));
    }
  }

  auto GraphBuilder::_registerTypedefs(Ontology& res, std::vector<Typedef> typedefs) -> void {
    for (auto& td: typedefs) {
      if (auto const it = res._typedefIndex.find(td.id); it != res._typedefIndex.end()) {
        res._diagnostics.push_back(
          Diagnostic{Diagnostic::Kind::duplicateStanza, "typedef " + td.id + " is declared again, stanzas unified", td.line}
        );
        unify(res._typedefs[it->second], td);
        continue;
      }
      res._typedefIndex.emplace(td.id, res._typedefs.size());
      res._typedefs.push_back(std::move(td));
    }
  }

  // If A declares inverse B, B must declare inverse A.
  auto GraphBuilder::_pairInverses(Ontology& res) -> void {
    for (auto& a: res._typedefs) {
      if (!a.inverseOf) continue;
      auto const& bid = *a.inverseOf;
      auto const it = res._typedefIndex.find(bid);
      if (it == res._typedefIndex.end()) {
        _report(res, UnresolvedReference{a.id, "inverse_of", bid, true}, a.line);
        continue;
      }
      auto& b = res._typedefs[it->second];
      if (!b.inverseOf) {
        b.inverseOf = a.id;
        res._diagnostics.push_back(Diagnostic{
          Diagnostic::Kind::inverseRepaired, "typedef " + b.id + " given inverse_of " + a.id + " to match " + a.id, b.line
        });
      } else if (*b.inverseOf != a.id) {
        throw core::InverseConflictError(b.id, *b.inverseOf, a.id);
      }
    }
  }

  // Fills the derived index. Mirrored edges are added for typedefs whose (declared) inverse is registered.
  auto GraphBuilder::_resolve(Ontology& res) -> void {
    for (auto const& term: res._terms) {
      res._parents[term.id];
      res._children[term.id];
      res._relations[term.id];
    }
    auto reported = std::unordered_set<Id>();
    for (auto const& term: res._terms) {
      for (auto const& parent: term.isA) {
        if (!res.contains(parent)) {
          _report(res, UnresolvedReference{term.id, std::string(core::isARelation), parent}, term.line);
          continue;
        }
        res._parents[term.id].insert(parent);
        res._children[parent].insert(term.id);
      }
      for (auto const& [relation, targets]: term.relationships) {
        auto const td = res.findTypedef(relation);
        if (!td && reported.insert(relation).second)
          _report(res, UnresolvedReference{term.id, "relationship", relation, true}, term.line);
        auto const inverse = (td && td->inverseOf && res.findTypedef(*td->inverseOf)) ? td->inverseOf : std::nullopt;
        for (auto const& target: targets) {
          if (!res.contains(target)) {
            _report(res, UnresolvedReference{term.id, relation, target}, term.line);
            continue;
          }
          res._relations[term.id][relation].insert(target);
          if (inverse) res._relations[target][*inverse].insert(term.id);
        }
      }
    }
  }

  // Iterative depth-first search; a parent that is still on the stack closes a cycle.
  auto GraphBuilder::_checkAcyclic(Ontology const& res) -> void {
    enum class Mark : std::uint8_t { none, active, done };
    auto const n = res._terms.size();
    auto marks = std::vector<Mark>(n, Mark::none);
    auto stk = std::vector<std::pair<size_t, size_t>>(); // (term index, next parent position)

    for (auto root = 0uz; root < n; root++) {
      if (marks[root] != Mark::none) continue;
      marks[root] = Mark::active;
      stk.emplace_back(root, 0);
      while (!stk.empty()) {
        auto const x = stk.back().first;
        auto const& ps = res._parents.at(res._terms[x].id).items();
        if (stk.back().second == ps.size()) {
          marks[x] = Mark::done;
          stk.pop_back();
          continue;
        }
        auto const y = res._termIndex.at(ps[stk.back().second++]);
        if (marks[y] == Mark::active) {
          auto cycle = std::vector<Id>();
          auto i = stk.size();
          while (stk[i - 1].first != y) i--;
          assert(i > 0);
          for (i--; i < stk.size(); i++) cycle.push_back(res._terms[stk[i].first].id);
          throw core::CycleDetectedError(std::move(cycle));
        }
        if (marks[y] == Mark::none) {
          marks[y] = Mark::active;
          stk.emplace_back(y, 0);
        }
      }
    }
  }

  auto load(parsing::FormatAdapter& format, parsing::IStream<std::string>& lines, BuildParams params)
    -> core::Ontology {
    return GraphBuilder(params).build(format.parse(lines));
  }

#include "macros_close.hpp"
}
