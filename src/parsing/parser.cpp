#include "parser.hpp"
#include <core/errors.hpp>

namespace ontograph::parsing {
#include "macros_open.hpp"

  using core::Diagnostic;
  using enum Diagnostic::Kind;

  namespace {

    auto stanzaName(StanzaParser::State state) -> std::string {
      switch (state) {
        case StanzaParser::State::header: return "header";
        case StanzaParser::State::inTypedefStanza: return "[Typedef]";
        case StanzaParser::State::inTermStanza: return "[Term]";
        case StanzaParser::State::inUnknownStanza: return "unknown stanza";
      }
      unreachable;
    }

    // First word of an id-valued tag, qualifiers dropped.
    auto idValue(std::string const& value) -> std::string {
      return std::string(splitWord(stripQualifiers(value)).first);
    }

  }

  auto StanzaParser::parse() -> core::RawEntitySet {
    while (auto const line = _stream.advance()) {
      auto const token = lexLine(*line, _stream.position());
      switch (token.kind) {
        case Token::Kind::blank:
        case Token::Kind::comment:
          break;
        case Token::Kind::malformed:
          _diagnose(malformedLine, "expected 'tag: value' or '[Stanza]', got '" + token.value + "'", token.line);
          break;
        case Token::Kind::header:
          _finish();
          _begin(token);
          break;
        case Token::Kind::tagValue:
          if (token.value.empty()) {
            _diagnose(emptyValue, "tag '" + token.tag + "' has no value", token.line);
            break;
          }
          switch (_state) {
            case State::header: _headerTag(token); break;
            case State::inTermStanza: _termTag(token); break;
            case State::inTypedefStanza: _typedefTag(token); break;
            case State::inUnknownStanza: break;
          }
          break;
      }
    }
    _finish();

    // Thread the default namespace through to every term that did not declare one.
    auto& meta = _result.metadata;
    if (!meta.defaultNamespace && !_params.defaultNamespace.empty()) meta.defaultNamespace = _params.defaultNamespace;
    auto const ns = meta.defaultNamespace.value_or("");
    for (auto& term: _result.terms)
      if (term.ns.empty()) term.ns = ns;
    return std::move(_result);
  }

  // Returns false (and reports) if a single-valued tag repeats within the current stanza.
  auto StanzaParser::_once(Token const& token) -> bool {
    if (_seen.insert(token.tag).second) return true;
    _diagnose(duplicateTag, "repeated '" + token.tag + "' in " + stanzaName(_state) + ", first value kept", token.line);
    return false;
  }

  auto StanzaParser::_unknown(Token const& token, core::Tags& other) -> void {
    _diagnose(unknownTag, "tag '" + token.tag + "' is not interpreted in " + stanzaName(_state), token.line);
    other.emplace_back(token.tag, token.value);
  }

  auto StanzaParser::_begin(Token const& token) -> void {
    _seen.clear();
    _stanzaLine = token.line;
    if (token.tag == "Term") {
      _state = State::inTermStanza;
      _term.emplace().line = token.line;
    } else if (token.tag == "Typedef") {
      _state = State::inTypedefStanza;
      _typedef.emplace().line = token.line;
    } else {
      _state = State::inUnknownStanza;
      _diagnose(unknownStanza, "skipping [" + token.tag + "] stanza", token.line);
    }
  }

  auto StanzaParser::_finish() -> void {
    if (_term) {
      if (_term->id.empty()) throw core::ParseError("[Term] stanza has no id", _stanzaLine);
      _result.terms.push_back(std::move(*_term));
      _term.reset();
    }
    if (_typedef) {
      if (_typedef->id.empty()) throw core::ParseError("[Typedef] stanza has no id", _stanzaLine);
      _result.typedefs.push_back(std::move(*_typedef));
      _typedef.reset();
    }
  }

  auto StanzaParser::_headerTag(Token const& token) -> void {
    auto& meta = _result.metadata;
    auto const& tag = token.tag;
    if (tag == "format-version") {
      if (_once(token)) meta.formatVersion = token.value;
    } else if (tag == "default-namespace" || tag == "namespace") {
      if (_seen.contains("default-namespace") || _seen.contains("namespace")) {
        _diagnose(duplicateTag, "repeated default namespace in header, first value kept", token.line);
        return;
      }
      _seen.insert(tag);
      meta.defaultNamespace = token.value;
    } else if (tag == "remark") {
      meta.remarks.push_back(token.value);
    } else if (tag == "import") {
      meta.imports.push_back(token.value);
    } else {
      _unknown(token, meta.other);
    }
  }

  auto StanzaParser::_termTag(Token const& token) -> void {
    auto& term = *_term;
    auto const& tag = token.tag;
    if (tag == "id") {
      if (_once(token)) term.id = idValue(token.value);
    } else if (tag == "name") {
      if (_once(token)) term.name = token.value;
    } else if (tag == "def") {
      if (_once(token)) term.def = token.value;
    } else if (tag == "namespace") {
      if (_once(token)) term.ns = token.value;
    } else if (tag == "is_a") {
      term.isA.insert(idValue(token.value));
    } else if (tag == "relationship") {
      auto [relation, rest] = splitWord(token.value);
      if (relation.size() > 1 && relation.back() == ':') relation.remove_suffix(1);
      auto const target = splitWord(stripQualifiers(rest)).first;
      if (target.empty()) {
        _diagnose(malformedLine, "relationship '" + std::string(relation) + "' has no target", token.line);
        return;
      }
      term.relate(std::string(relation), std::string(target));
    } else if (tag == "is_obsolete") {
      if (!_once(token)) return;
      if (token.value == "true") term.obsolete = true;
      else if (token.value != "false")
        _diagnose(malformedLine, "is_obsolete expects 'true' or 'false', got '" + token.value + "'", token.line);
    } else {
      _unknown(token, term.other);
    }
  }

  auto StanzaParser::_typedefTag(Token const& token) -> void {
    auto& td = *_typedef;
    auto const& tag = token.tag;
    if (tag == "id") {
      if (_once(token)) td.id = idValue(token.value);
    } else if (tag == "name") {
      if (_once(token)) td.name = token.value;
    } else if (tag == "def") {
      if (_once(token)) td.def = token.value;
    } else if (tag == "inverse_of") {
      if (_once(token)) td.inverseOf = idValue(token.value);
    } else {
      _unknown(token, td.other);
    }
  }

#include "macros_close.hpp"
}
