#include "entity.hpp"

namespace ontograph::core {
#include "macros_open.hpp"

  auto kindName(Diagnostic::Kind kind) -> std::string_view {
    using enum Diagnostic::Kind;
    switch (kind) {
      case malformedLine: return "malformed-line";
      case emptyValue: return "empty-value";
      case unknownTag: return "unknown-tag";
      case unknownStanza: return "unknown-stanza";
      case duplicateTag: return "duplicate-tag";
      case duplicateStanza: return "duplicate-stanza";
      case inverseRepaired: return "inverse-repaired";
      case unresolvedReference: return "unresolved-reference";
      case nameConflict: return "name-conflict";
    }
    unreachable;
  }

  auto UnresolvedReference::toString() const -> std::string {
    auto const what = missingTypedef ? "undeclared typedef " : "undeclared term ";
    return source + " " + relation + " -> " + what + target;
  }

#include "macros_close.hpp"
}
