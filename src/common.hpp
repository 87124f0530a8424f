#ifndef ONTOGRAPH_COMMON_HPP
#define ONTOGRAPH_COMMON_HPP

#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#undef assert

namespace ontograph {

  using std::int32_t;
  using std::int64_t;
  using std::size_t;
  using std::uint32_t;
  using std::uint64_t;

  // "Unreachable" mark.
  [[noreturn]] inline auto unreachable(char const* file, int line, char const* func) -> void {
    std::cerr << "\"Unreachable\" code was reached: " << file << ":" << line << ", at function " << func << std::endl;
    std::terminate();
  }

  // Assertion that remains present under non-debug configurations.
  inline auto assert(bool expr, char const* name, char const* file, int line, char const* func) -> void {
    if (!expr) {
      std::cerr << "Assertion failed: " << name << std::endl;
      unreachable(file, line, func);
    }
  }

  // Trims leading and trailing blanks (spaces, tabs, carriage returns).
  inline auto trim(std::string_view s) -> std::string_view {
    auto const begin = s.find_first_not_of(" \t\r");
    if (begin == std::string_view::npos) return {};
    auto const end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
  }

}

#endif // ONTOGRAPH_COMMON_HPP
