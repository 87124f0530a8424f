#ifndef ONTOGRAPH_TESTING_HPP
#define ONTOGRAPH_TESTING_HPP

#include <iostream>
#include <optional>
#include <string>
#include <common.hpp>

// Minimal harness shared by the `test*.cpp` executables.
namespace ontograph::testing {

  inline auto failures = 0uz;

  inline auto expect(bool cond, std::string const& msg) -> void {
    if (!cond) {
      failures++;
      std::cerr << "FAIL: " << msg << std::endl;
    }
  }

  template <typename T>
  auto expectEq(T const& a, T const& b, std::string const& msg) -> void {
    expect(a == b, msg);
  }

  inline auto expectStrEq(std::string const& a, std::string const& b, std::string const& msg) -> void {
    expect(a == b, msg + " (got '" + a + "' expected '" + b + "')");
  }

  // Runs `f` and returns the exception of type `E` it throws, or records a failure.
  template <typename E, typename F>
  auto expectThrows(F&& f, std::string const& msg) -> std::optional<E> {
    try {
      f();
    } catch (E const& e) {
      return e;
    }
    expect(false, msg + " (nothing thrown)");
    return std::nullopt;
  }

  // Prints a summary; the result is the process exit status.
  inline auto summary(std::string const& name) -> int {
    if (failures == 0) {
      std::cout << name << ": all tests passed" << std::endl;
      return 0;
    }
    std::cout << name << ": " << failures << " failure(s)" << std::endl;
    return 1;
  }

}

#endif // ONTOGRAPH_TESTING_HPP
