#include "ontology.hpp"
#include "ontology_cache.hpp"

namespace ontograph::core {
#include "macros_open.hpp"

  namespace {
    IdSet const emptySet{};
    std::map<Id, IdSet> const emptyRelations{};
  }

  auto Ontology::parents(Id const& id) const -> IdSet const& {
    _expect(id);
    return _parents.at(id);
  }

  auto Ontology::children(Id const& id) const -> IdSet const& {
    _expect(id);
    return _children.at(id);
  }

  // Transitive closure of `step`, excluding `id` itself (which cannot be reached again in a DAG).
  auto Ontology::_closure(Id const& id, std::unordered_map<Id, IdSet> const& step) const -> IdSet {
    auto res = IdSet();
    auto stk = std::vector<Id>{id};
    while (!stk.empty()) {
      auto const x = std::move(stk.back());
      stk.pop_back();
      for (auto const& y: step.at(x))
        if (res.insert(y)) stk.push_back(y);
    }
    return res;
  }

  // Level-by-level expansion. A term reachable through paths of several lengths counts at each of them.
  auto Ontology::_limited(Id const& id, std::unordered_map<Id, IdSet> const& step, Depth depth) const -> IdSet {
    assert(depth.level.has_value());
    auto res = IdSet();
    auto frontier = IdSet{id};
    auto const level = *depth.level;
    for (auto i = 1uz; i <= level && !frontier.empty(); i++) {
      auto next = IdSet();
      for (auto const& x: frontier) next.insert(step.at(x));
      if (depth.intermediate || i == level) res.insert(next);
      frontier = std::move(next);
    }
    return res;
  }

  auto Ontology::ancestors(Id const& id) const -> IdSet const& {
    _expect(id);
    auto const lock = std::lock_guard(_cache->mutex);
    if (auto const it = _cache->ancestors.find(id); it != _cache->ancestors.end()) return it->second;
    return _cache->ancestors.emplace(id, _closure(id, _parents)).first->second;
  }

  auto Ontology::descendants(Id const& id) const -> IdSet const& {
    _expect(id);
    auto const lock = std::lock_guard(_cache->mutex);
    if (auto const it = _cache->descendants.find(id); it != _cache->descendants.end()) return it->second;
    return _cache->descendants.emplace(id, _closure(id, _children)).first->second;
  }

  auto Ontology::ancestors(Id const& id, Depth depth) const -> IdSet const& {
    if (!depth.level) return ancestors(id);
    _expect(id);
    auto const key = Cache::LimitedKey(id, *depth.level, depth.intermediate);
    auto const lock = std::lock_guard(_cache->mutex);
    if (auto const it = _cache->limitedAncestors.find(key); it != _cache->limitedAncestors.end()) return it->second;
    return _cache->limitedAncestors.emplace(key, _limited(id, _parents, depth)).first->second;
  }

  auto Ontology::descendants(Id const& id, Depth depth) const -> IdSet const& {
    if (!depth.level) return descendants(id);
    _expect(id);
    auto const key = Cache::LimitedKey(id, *depth.level, depth.intermediate);
    auto const lock = std::lock_guard(_cache->mutex);
    if (auto const it = _cache->limitedDescendants.find(key); it != _cache->limitedDescendants.end()) return it->second;
    return _cache->limitedDescendants.emplace(key, _limited(id, _children, depth)).first->second;
  }

  auto Ontology::parentsOfAll(IdSet const& ids) const -> IdSet {
    auto res = IdSet();
    for (auto const& id: ids) res.insert(parents(id));
    return res;
  }

  auto Ontology::childrenOfAll(IdSet const& ids) const -> IdSet {
    auto res = IdSet();
    for (auto const& id: ids) res.insert(children(id));
    return res;
  }

  auto Ontology::ancestorsOfAll(IdSet const& ids) const -> IdSet {
    auto res = IdSet();
    for (auto const& id: ids) res.insert(ancestors(id));
    return res;
  }

  auto Ontology::descendantsOfAll(IdSet const& ids) const -> IdSet {
    auto res = IdSet();
    for (auto const& id: ids) res.insert(descendants(id));
    return res;
  }

  auto Ontology::related(Id const& id, Id const& relation) const -> IdSet const& {
    auto const& rels = relations(id);
    if (auto const it = rels.find(relation); it != rels.end()) return it->second;
    return emptySet;
  }

  auto Ontology::relations(Id const& id) const -> std::map<Id, IdSet> const& {
    _expect(id);
    if (auto const it = _relations.find(id); it != _relations.end()) return it->second;
    return emptyRelations;
  }

#include "macros_close.hpp"
}
