#ifndef ONTOGRAPH_GRAPH_MERGE_HPP
#define ONTOGRAPH_GRAPH_MERGE_HPP

#include <vector>
#include <core/entity.hpp>
#include <core/ontology.hpp>
#include "builder.hpp"

namespace ontograph::graph {
#include "macros_open.hpp"

  // Returns the union of two ontologies as a new one. Both inputs are left untouched.
  // Left-biased: on a shared term, `primary`'s name, def, namespace and obsolete flag win (a differing
  // name is reported as a `nameConflict` diagnostic) and edge sets are unioned. Typedefs sharing an id
  // must agree on `inverse_of` (or one side must leave it out), otherwise `MergeConflictError` is thrown.
  // The union is rebuilt from scratch, so a cycle it introduces throws `CycleDetectedError` and no
  // partial result exists.
  auto merge(core::Ontology const& primary, core::Ontology const& secondary, BuildParams params = {})
    -> core::Ontology;

  // Adds freshly constructed terms to a copy of `ontology`. Relationship types are those of `ontology`.
  auto include(core::Ontology const& ontology, std::vector<core::Term> terms, BuildParams params = {})
    -> core::Ontology;

  // Copies the declared content of an ontology back into an entity set (diagnostics excluded).
  auto toRaw(core::Ontology const& ontology) -> core::RawEntitySet;

#include "macros_close.hpp"
}

#endif // ONTOGRAPH_GRAPH_MERGE_HPP
