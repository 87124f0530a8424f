#include <iostream>
#include <string>
#include <vector>
#include <tool/driver.hpp>

using namespace ontograph;

auto main(int argc, char* argv[]) -> int {
  return tool::run(std::vector<std::string>(argv, argv + argc), std::cout, std::cerr);
}
