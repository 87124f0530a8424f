#ifndef ONTOGRAPH_PARSING_PARSER_HPP
#define ONTOGRAPH_PARSING_PARSER_HPP

#include <optional>
#include <string>
#include <unordered_set>
#include <core/entity.hpp>
#include "lexer.hpp"
#include "stream.hpp"

namespace ontograph::parsing {
#include "macros_open.hpp"

  // Parser configuration.
  struct ParserParams {
    std::string defaultNamespace; // Used when the header declares none.
  };

  // Stanza parser: turns a line stream into a `RawEntitySet`.
  // Lines are consumed in one pass by a state machine; ids are stored as raw strings, so references
  // may point forward (or nowhere). Unrecognised lines become diagnostics; a stanza without `id` throws
  // `core::ParseError` and nothing is returned.
  class StanzaParser {
  public:
    enum class State : uint32_t { header, inTypedefStanza, inTermStanza, inUnknownStanza };

    // Given references must be valid over the `StanzaParser`'s lifetime.
    StanzaParser(IStream<std::string>& stream, ParserParams params):
        _stream(stream),
        _params(std::move(params)) {}

    auto parse() -> core::RawEntitySet;

  private:
    IStream<std::string>& _stream;
    ParserParams const _params;
    core::RawEntitySet _result;

    State _state = State::header;
    std::optional<core::Term> _term;
    std::optional<core::Typedef> _typedef;
    size_t _stanzaLine = 0;
    std::unordered_set<std::string> _seen; // Single-valued tags already set in the current stanza.

    auto _diagnose(core::Diagnostic::Kind kind, std::string message, size_t line) -> void {
      _result.diagnostics.push_back(core::Diagnostic{kind, std::move(message), line});
    }
    auto _once(Token const& token) -> bool;
    auto _unknown(Token const& token, core::Tags& other) -> void;

    auto _begin(Token const& token) -> void;
    auto _finish() -> void;
    auto _headerTag(Token const& token) -> void;
    auto _termTag(Token const& token) -> void;
    auto _typedefTag(Token const& token) -> void;
  };

#include "macros_close.hpp"
}

#endif // ONTOGRAPH_PARSING_PARSER_HPP
