#ifndef ONTOGRAPH_CORE_ONTOLOGY_CACHE_HPP
#define ONTOGRAPH_CORE_ONTOLOGY_CACHE_HPP

#include <map>
#include <mutex>
#include <tuple>
#include <unordered_map>
#include "ontology.hpp"

namespace ontograph::core {
#include "macros_open.hpp"

  // Populate-once closures, guarded by `mutex`.
  // Entries are never erased, so references handed out stay valid.
  struct Ontology::Cache {
    // Depth-limited results are keyed by (id, level, intermediate).
    using LimitedKey = std::tuple<Id, size_t, bool>;

    std::mutex mutex;
    std::unordered_map<Id, IdSet> ancestors;
    std::unordered_map<Id, IdSet> descendants;
    std::map<LimitedKey, IdSet> limitedAncestors;
    std::map<LimitedKey, IdSet> limitedDescendants;
  };

#include "macros_close.hpp"
}

#endif // ONTOGRAPH_CORE_ONTOLOGY_CACHE_HPP
