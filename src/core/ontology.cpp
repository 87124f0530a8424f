#include "ontology.hpp"
#include "ontology_cache.hpp"

namespace ontograph::core {
#include "macros_open.hpp"

  Ontology::Ontology():
      _cache(std::make_unique<Cache>()) {}

  Ontology::Ontology(Ontology&&) noexcept = default;
  auto Ontology::operator=(Ontology&&) noexcept -> Ontology& = default;
  Ontology::~Ontology() = default;

  auto Ontology::find(Id const& id) const -> Term const* {
    auto const it = _termIndex.find(id);
    if (it == _termIndex.end()) return nullptr;
    return &_terms[it->second];
  }

  auto Ontology::at(Id const& id) const -> Term const& {
    if (auto const p = find(id)) return *p;
    throw NotFoundError(id);
  }

  auto Ontology::findTypedef(Id const& id) const -> Typedef const* {
    auto const it = _typedefIndex.find(id);
    if (it == _typedefIndex.end()) return nullptr;
    return &_typedefs[it->second];
  }

  auto Ontology::typedefAt(Id const& id) const -> Typedef const& {
    if (auto const p = findTypedef(id)) return *p;
    throw NotFoundError(id);
  }

  auto Ontology::operator==(Ontology const& r) const -> bool {
    if (_terms.size() != r._terms.size() || _typedefs.size() != r._typedefs.size()) return false;
    for (auto const& term: _terms) {
      auto const other = r.find(term.id);
      if (!other || term.isA != other->isA || term.relationships != other->relationships) return false;
    }
    for (auto const& td: _typedefs) {
      auto const other = r.findTypedef(td.id);
      if (!other || td.inverseOf != other->inverseOf) return false;
    }
    return true;
  }

#include "macros_close.hpp"
}
