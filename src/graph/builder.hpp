#ifndef ONTOGRAPH_GRAPH_BUILDER_HPP
#define ONTOGRAPH_GRAPH_BUILDER_HPP

#include <string>
#include <core/entity.hpp>
#include <core/ontology.hpp>
#include <parsing/format.hpp>
#include <parsing/stream.hpp>

namespace ontograph::graph {
#include "macros_open.hpp"

  // Builder configuration.
  struct BuildParams {
    bool strictReferences = false; // Throw `UnresolvedReferenceError` instead of reporting.
  };

  // Graph builder / validator: the only way to obtain a `core::Ontology`.
  //
  // 0. Unifies stanzas sharing an id (edge sets unioned).
  // 1. Repairs one-sided `inverse_of` declarations; throws `InverseConflictError` on mismatch.
  // 2. Resolves `is_a` and relationship targets; misses go to `Ontology::unresolved()`.
  // 3. Rejects `is_a` cycles with `CycleDetectedError`.
  // 4. Materialises mirrored inverse edges into the derived index.
  class GraphBuilder {
  public:
    explicit GraphBuilder(BuildParams params = {}):
        _params(params) {}

    auto build(core::RawEntitySet raw) const -> core::Ontology;

  private:
    BuildParams _params;

    static auto _report(core::Ontology& res, core::UnresolvedReference ref, size_t line) -> void;
    static auto _registerTerms(core::Ontology& res, std::vector<core::Term> terms) -> void;
    static auto _registerTypedefs(core::Ontology& res, std::vector<core::Typedef> typedefs) -> void;
    static auto _pairInverses(core::Ontology& res) -> void;
    static auto _resolve(core::Ontology& res) -> void;
    static auto _checkAcyclic(core::Ontology const& res) -> void;
  };

  // Parses with `format` and builds in one step.
  auto load(parsing::FormatAdapter& format, parsing::IStream<std::string>& lines, BuildParams params = {})
    -> core::Ontology;

#include "macros_close.hpp"
}

#endif // ONTOGRAPH_GRAPH_BUILDER_HPP
