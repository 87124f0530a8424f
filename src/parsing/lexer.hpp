#ifndef ONTOGRAPH_PARSING_LEXER_HPP
#define ONTOGRAPH_PARSING_LEXER_HPP

#include <string>
#include <string_view>
#include <utility>
#include <common.hpp>

namespace ontograph::parsing {
#include "macros_open.hpp"

  // One classified line of stanza text.
  struct Token {
    enum class Kind : uint32_t {
      blank,    // Empty or whitespace only.
      comment,  // Starts with `!`.
      header,   // `[Name]`; `tag` holds the name.
      tagValue, // `tag: value ! comment`.
      malformed
    };
    Kind kind;
    std::string tag;
    std::string value;   // Trimmed, comment removed, `\!` unescaped.
    std::string comment; // Trailing comment text (informational only).
    size_t line;         // 1-based line number.
  };

  // Classifies a line. `number` is its 1-based line number.
  auto lexLine(std::string_view line, size_t number) -> Token;

  // Splits `s` at the first run of blanks: (first word, trimmed remainder).
  auto splitWord(std::string_view s) -> std::pair<std::string_view, std::string_view>;

  // Removes a trailing `{...}` qualifier block (and the blanks before it).
  auto stripQualifiers(std::string_view s) -> std::string_view;

  // Escapes every `!` as `\!`, so that it is not read back as a comment start.
  auto escapeValue(std::string_view s) -> std::string;

#include "macros_close.hpp"
}

#endif // ONTOGRAPH_PARSING_LEXER_HPP
