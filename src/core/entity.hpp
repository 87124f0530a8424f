#ifndef ONTOGRAPH_CORE_ENTITY_HPP
#define ONTOGRAPH_CORE_ENTITY_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <common.hpp>
#include "id_set.hpp"

namespace ontograph::core {
#include "macros_open.hpp"

  // Tag/value pairs kept verbatim but not interpreted (synonym, xref, comment...), in input order.
  using Tags = std::vector<std::pair<std::string, std::string>>;

  // The built-in hierarchy relation.
  constexpr std::string_view isARelation = "is_a";

  // Declaration of a relationship type.
  struct Typedef {
    Id id;
    std::string name;
    std::optional<std::string> def;
    std::optional<Id> inverseOf;
    Tags other;
    size_t line = 0; // Line of the stanza header (0 if not parsed from text).
  };

  // An ontology term. Edges are stored as raw ids; resolution happens in `graph::GraphBuilder`.
  struct Term {
    Id id;
    std::string name;
    std::optional<std::string> def; // Raw value, quotes and xref list included.
    std::string ns;                 // Namespace.
    IdSet isA;                      // Parent ids.
    std::map<Id, IdSet> relationships; // Typedef id -> target ids.
    bool obsolete = false;
    Tags other;
    size_t line = 0;

    auto relate(Id const& relation, Id const& target) -> bool {
      return relationships[relation].insert(target);
    }
  };

  // Header entries of a stanza file.
  struct Metadata {
    std::optional<std::string> formatVersion;
    std::optional<std::string> defaultNamespace;
    std::vector<std::string> remarks;
    std::vector<std::string> imports;
    Tags other;
  };

  // A non-fatal issue found while parsing, building or merging.
  struct Diagnostic {
    enum class Kind : uint32_t {
      malformedLine,
      emptyValue,
      unknownTag,
      unknownStanza,
      duplicateTag,
      duplicateStanza,
      inverseRepaired,
      unresolvedReference,
      nameConflict
    };
    Kind kind;
    std::string message;
    size_t line = 0; // 0 if there is no source line.
  };

  auto kindName(Diagnostic::Kind kind) -> std::string_view;

  // An id cited by an edge but not declared in the ontology.
  // `relation` is "is_a", "inverse_of" or the typedef id of a relationship.
  // `missingTypedef` tells whether `target` should have been a typedef rather than a term.
  struct UnresolvedReference {
    Id source;
    Id relation;
    Id target;
    bool missingTypedef = false;

    auto operator==(UnresolvedReference const&) const -> bool = default;
    auto toString() const -> std::string;
  };

  // Unvalidated output of a format adapter. Ids may refer forward or nowhere.
  struct RawEntitySet {
    Metadata metadata;
    std::vector<Typedef> typedefs;
    std::vector<Term> terms;
    std::vector<Diagnostic> diagnostics;
  };

#include "macros_close.hpp"
}

#endif // ONTOGRAPH_CORE_ENTITY_HPP
