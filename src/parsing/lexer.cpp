#include "lexer.hpp"

namespace ontograph::parsing {
#include "macros_open.hpp"

  namespace {

    auto isBlank(char c) -> bool {
      return c == ' ' || c == '\t';
    }

    // Index of the `!` that starts the trailing comment, or `npos`.
    // A `!` counts if it is not escaped and starts the value or follows a blank. Values that open with
    // a double quote (`def`, `synonym`) also protect the quoted part; elsewhere `"` is plain text.
    auto commentStart(std::string_view s) -> size_t {
      auto const quotable = trim(s).starts_with('"');
      auto quoted = false;
      for (auto i = 0uz; i < s.size(); i++) {
        auto const c = s[i];
        if (c == '\\') {
          i++;
          continue;
        }
        if (c == '"' && quotable) quoted = !quoted;
        else if (c == '!' && !quoted && (i == 0 || isBlank(s[i - 1]))) return i;
      }
      return std::string_view::npos;
    }

    auto unescapeValue(std::string_view s) -> std::string {
      auto res = std::string();
      for (auto i = 0uz; i < s.size(); i++) {
        if (s[i] == '\\' && i + 1 < s.size() && s[i + 1] == '!') continue;
        res += s[i];
      }
      return res;
    }

  }

  auto lexLine(std::string_view line, size_t number) -> Token {
    using enum Token::Kind;
    auto const s = trim(line);
    if (s.empty()) return Token{blank, {}, {}, {}, number};
    if (s.front() == '!') return Token{comment, {}, {}, std::string(trim(s.substr(1))), number};

    if (s.front() == '[') {
      if (s.back() != ']' || s.size() < 3) return Token{malformed, {}, std::string(s), {}, number};
      return Token{header, std::string(trim(s.substr(1, s.size() - 2))), {}, {}, number};
    }

    auto const colon = s.find(':');
    if (colon == std::string_view::npos) return Token{malformed, {}, std::string(s), {}, number};
    auto const tag = trim(s.substr(0, colon));
    if (tag.empty() || tag.find_first_of(" \t") != std::string_view::npos)
      return Token{malformed, {}, std::string(s), {}, number};

    auto rest = s.substr(colon + 1);
    auto text = std::string();
    if (auto const i = commentStart(rest); i != std::string_view::npos) {
      text = std::string(trim(rest.substr(i + 1)));
      rest = rest.substr(0, i);
    }
    return Token{tagValue, std::string(tag), unescapeValue(trim(rest)), std::move(text), number};
  }

  auto splitWord(std::string_view s) -> std::pair<std::string_view, std::string_view> {
    s = trim(s);
    auto const i = s.find_first_of(" \t");
    if (i == std::string_view::npos) return {s, {}};
    return {s.substr(0, i), trim(s.substr(i))};
  }

  auto stripQualifiers(std::string_view s) -> std::string_view {
    s = trim(s);
    if (s.empty() || s.back() != '}') return s;
    auto const open = s.rfind('{');
    if (open == std::string_view::npos || open == 0 || !isBlank(s[open - 1])) return s;
    return trim(s.substr(0, open));
  }

  auto escapeValue(std::string_view s) -> std::string {
    auto res = std::string();
    for (auto const c: s) {
      if (c == '!') res += '\\';
      res += c;
    }
    return res;
  }

#include "macros_close.hpp"
}
