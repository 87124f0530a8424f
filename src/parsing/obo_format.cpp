#include "format.hpp"
#include <serial/obo_writer.hpp>

namespace ontograph::parsing {
#include "macros_open.hpp"

  auto OboFormat::parse(IStream<std::string>& lines) -> core::RawEntitySet {
    return StanzaParser(lines, _params).parse();
  }

  auto OboFormat::serialize(core::Ontology const& ontology) -> std::string {
    return serial::OboWriter().write(ontology);
  }

#include "macros_close.hpp"
}
