#ifndef ONTOGRAPH_CORE_ONTOLOGY_HPP
#define ONTOGRAPH_CORE_ONTOLOGY_HPP

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <common.hpp>
#include "entity.hpp"
#include "errors.hpp"
#include "id_set.hpp"

namespace ontograph::graph {
  class GraphBuilder;
}

namespace ontograph::core {
#include "macros_open.hpp"

  // A validated ontology: terms, typedefs, header metadata, and the derived graph index.
  // Immutable once built (only `graph::GraphBuilder` constructs one), so any number of threads
  // may read it concurrently. Traversal closures are computed on first use and cached.
  // Invariants: term ids are unique; resolved `is_a` edges form a DAG; every edge whose typedef
  // has an inverse is mirrored in the derived index; every unresolved id is listed in `unresolved()`.
  class Ontology {
  public:
    // Limits recursive traversal to `level` steps (unbounded if empty).
    // With `intermediate == false`, only terms exactly `level` steps away are returned.
    struct Depth {
      std::optional<size_t> level;
      bool intermediate = true;
    };

    Ontology(Ontology&&) noexcept;
    Ontology(Ontology const&) = delete;
    auto operator=(Ontology&&) noexcept -> Ontology&;
    auto operator=(Ontology const&) -> Ontology& = delete;
    ~Ontology();

    // Lookup.
    auto size() const -> size_t { return _terms.size(); }
    auto contains(Id const& id) const -> bool { return _termIndex.contains(id); }
    auto find(Id const& id) const -> Term const*;
    auto at(Id const& id) const -> Term const&;
    auto operator[](Id const& id) const -> Term const& { return at(id); }
    auto begin() const { return _terms.begin(); }
    auto end() const { return _terms.end(); }
    auto terms() const -> std::vector<Term> const& { return _terms; }

    auto typedefs() const -> std::vector<Typedef> const& { return _typedefs; }
    auto findTypedef(Id const& id) const -> Typedef const*;
    auto typedefAt(Id const& id) const -> Typedef const&;

    auto metadata() const -> Metadata const& { return _metadata; }
    auto defaultNamespace() const -> std::string const& { return _defaultNamespace; }
    auto unresolved() const -> std::vector<UnresolvedReference> const& { return _unresolved; }
    auto diagnostics() const -> std::vector<Diagnostic> const& { return _diagnostics; }

    // Hierarchy views over resolved `is_a` edges. All throw `NotFoundError` if `id` is not a term.
    auto parents(Id const& id) const -> IdSet const&;
    auto children(Id const& id) const -> IdSet const&;
    auto ancestors(Id const& id) const -> IdSet const&;
    auto descendants(Id const& id) const -> IdSet const&;
    // Depth-limited results are cached per (id, level, intermediate) like the unbounded ones.
    auto ancestors(Id const& id, Depth depth) const -> IdSet const&;
    auto descendants(Id const& id, Depth depth) const -> IdSet const&;

    // Flattening variants: union of the view over every member of `ids`.
    auto parentsOfAll(IdSet const& ids) const -> IdSet;
    auto childrenOfAll(IdSet const& ids) const -> IdSet;
    auto ancestorsOfAll(IdSet const& ids) const -> IdSet;
    auto descendantsOfAll(IdSet const& ids) const -> IdSet;

    // Relationship views, mirrored inverse edges included.
    auto related(Id const& id, Id const& relation) const -> IdSet const&;
    auto relations(Id const& id) const -> std::map<Id, IdSet> const&;

    // Observational equality: same term and typedef ids, `is_a` sets, relationship sets and inverse pairs.
    auto operator==(Ontology const& r) const -> bool;

  private:
    friend class graph::GraphBuilder;

    struct Cache;

    Ontology();

    auto _expect(Id const& id) const -> void {
      if (!contains(id)) throw NotFoundError(id);
    }
    auto _closure(Id const& id, std::unordered_map<Id, IdSet> const& step) const -> IdSet;
    auto _limited(Id const& id, std::unordered_map<Id, IdSet> const& step, Depth depth) const -> IdSet;

    Metadata _metadata;
    std::string _defaultNamespace;
    std::vector<Term> _terms;
    std::unordered_map<Id, size_t> _termIndex;
    std::vector<Typedef> _typedefs;
    std::unordered_map<Id, size_t> _typedefIndex;
    std::vector<UnresolvedReference> _unresolved;
    std::vector<Diagnostic> _diagnostics;

    // Derived index, filled by the builder. Every term has an entry in each map.
    std::unordered_map<Id, IdSet> _parents;
    std::unordered_map<Id, IdSet> _children;
    std::unordered_map<Id, std::map<Id, IdSet>> _relations;

    std::unique_ptr<Cache> _cache;
  };

#include "macros_close.hpp"
}

#endif // ONTOGRAPH_CORE_ONTOLOGY_HPP
