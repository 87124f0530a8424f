#ifndef ONTOGRAPH_CORE_ERRORS_HPP
#define ONTOGRAPH_CORE_ERRORS_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <common.hpp>
#include "entity.hpp"

namespace ontograph::core {
#include "macros_open.hpp"

  // Base of all structural failures. Soft issues are reported as `Diagnostic`s instead.
  struct OntologyError: std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  // Malformed stanza (e.g. no `id` tag). Nothing is returned from the parse.
  struct ParseError: OntologyError {
    size_t line;
    ParseError(std::string const& s, size_t line):
      OntologyError("line " + std::to_string(line) + ": " + s),
      line(line) {}
  };

  // The resolved `is_a` edges contain a cycle.
  // `cycle` lists the participating ids in edge order (child before parent).
  struct CycleDetectedError: OntologyError {
    std::vector<Id> cycle;
    explicit CycleDetectedError(std::vector<Id> ids):
      OntologyError(describe(ids)),
      cycle(std::move(ids)) {}

  private:
    static auto describe(std::vector<Id> const& ids) -> std::string {
      auto res = std::string("is_a cycle detected:");
      for (auto const& id: ids) res += " " + id + " ->";
      if (!ids.empty()) res += " " + ids.front();
      return res;
    }
  };

  // A typedef declares two different inverses within one entity set.
  struct InverseConflictError: OntologyError {
    Id typedefId, first, second;
    InverseConflictError(Id typedefId, Id first, Id second):
      OntologyError("typedef " + typedefId + " is declared inverse of both " + first + " and " + second),
      typedefId(std::move(typedefId)),
      first(std::move(first)),
      second(std::move(second)) {}
  };

  // Both sides of a merge declare a typedef with different inverses.
  struct MergeConflictError: OntologyError {
    Id typedefId;
    std::optional<Id> primaryInverse, secondaryInverse;
    MergeConflictError(Id typedefId, std::optional<Id> primaryInverse, std::optional<Id> secondaryInverse):
      OntologyError(
        "cannot merge typedef " + typedefId + ": inverse_of " + primaryInverse.value_or("(none)") + " vs " +
        secondaryInverse.value_or("(none)")
      ),
      typedefId(std::move(typedefId)),
      primaryInverse(std::move(primaryInverse)),
      secondaryInverse(std::move(secondaryInverse)) {}
  };

  // Lookup of an id that is not a member of the ontology.
  struct NotFoundError: OntologyError {
    Id id;
    explicit NotFoundError(Id const& id):
      OntologyError("no such id: " + id),
      id(id) {}
  };

  // Raised instead of reporting unresolved references when a build is strict.
  struct UnresolvedReferenceError: OntologyError {
    std::vector<UnresolvedReference> references;
    explicit UnresolvedReferenceError(std::vector<UnresolvedReference> refs):
      OntologyError(
        std::to_string(refs.size()) + " unresolved reference(s)" + (refs.empty() ? "" : ", first: " + refs.front().toString())
      ),
      references(std::move(refs)) {}
  };

#include "macros_close.hpp"
}

#endif // ONTOGRAPH_CORE_ERRORS_HPP
