#ifndef ONTOGRAPH_SERIAL_OBO_WRITER_HPP
#define ONTOGRAPH_SERIAL_OBO_WRITER_HPP

#include <sstream>
#include <string>
#include <core/ontology.hpp>

namespace ontograph::serial {
#include "macros_open.hpp"

  // Canonical stanza text writer.
  // Output order: header, typedefs in registry order, terms in insertion order. Tags inside a stanza
  // follow a fixed order, so writing the same ontology twice gives identical text. Only declared edges
  // are written (mirrored inverse edges are rebuilt on load).
  class OboWriter {
  public:
    auto write(core::Ontology const& ontology) -> std::string;

  private:
    std::ostringstream _out;

    auto _separate() -> void {
      if (_out.tellp() > 0) _out << "\n";
    }
    auto _tag(std::string const& tag, std::string const& value) -> void;
    auto _edge(std::string const& tag, std::string const& value, std::string const* name) -> void;
    auto _header(core::Metadata const& meta) -> void;
    auto _typedef(core::Ontology const& ontology, core::Typedef const& td) -> void;
    auto _term(core::Ontology const& ontology, core::Term const& term) -> void;
  };

#include "macros_close.hpp"
}

#endif // ONTOGRAPH_SERIAL_OBO_WRITER_HPP
