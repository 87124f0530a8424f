#ifndef ONTOGRAPH_CORE_ID_SET_HPP
#define ONTOGRAPH_CORE_ID_SET_HPP

#include <initializer_list>
#include <string>
#include <unordered_set>
#include <vector>
#include <common.hpp>

namespace ontograph::core {
#include "macros_open.hpp"

  // Accession strings (e.g. `GO:0008150`). Opaque, compared byte-wise.
  using Id = std::string;

  // Set of ids that remembers insertion order (for deterministic output).
  // Equality ignores order.
  class IdSet {
  public:
    IdSet() = default;
    IdSet(std::initializer_list<Id> ids) {
      for (auto const& id: ids) insert(id);
    }

    // Returns true if `id` was not present before.
    auto insert(Id const& id) -> bool {
      if (!_index.insert(id).second) return false;
      _items.push_back(id);
      return true;
    }
    auto insert(IdSet const& r) -> void {
      for (auto const& id: r._items) insert(id);
    }
    auto contains(Id const& id) const -> bool { return _index.contains(id); }
    auto size() const -> size_t { return _items.size(); }
    auto empty() const -> bool { return _items.empty(); }

    auto begin() const -> std::vector<Id>::const_iterator { return _items.begin(); }
    auto end() const -> std::vector<Id>::const_iterator { return _items.end(); }
    auto items() const -> std::vector<Id> const& { return _items; }

    auto operator==(IdSet const& r) const -> bool { return _index == r._index; }

  private:
    std::vector<Id> _items;
    std::unordered_set<Id> _index;
  };

#include "macros_close.hpp"
}

#endif // ONTOGRAPH_CORE_ID_SET_HPP
