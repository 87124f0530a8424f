#ifndef ONTOGRAPH_TOOL_DRIVER_HPP
#define ONTOGRAPH_TOOL_DRIVER_HPP

#include <ostream>
#include <string>
#include <vector>
#include <common.hpp>

namespace ontograph::tool {
#include "macros_open.hpp"

  // Runs `ontotool` with `args` (program name first). The merged ontology goes to `out`; diagnostics,
  // usage and errors go to `log` as `file:line: kind: message`. Returns the process exit status.
  auto run(std::vector<std::string> const& args, std::ostream& out, std::ostream& log) -> int;

#include "macros_close.hpp"
}

#endif // ONTOGRAPH_TOOL_DRIVER_HPP
