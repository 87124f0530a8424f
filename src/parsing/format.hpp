#ifndef ONTOGRAPH_PARSING_FORMAT_HPP
#define ONTOGRAPH_PARSING_FORMAT_HPP

#include <string>
#include <core/entity.hpp>
#include <core/ontology.hpp>
#include "parser.hpp"
#include "stream.hpp"

namespace ontograph::parsing {
#include "macros_open.hpp"

  // A class is a "format adapter" if...
  class FormatAdapter {
    interface(FormatAdapter);
  public:
    // It allows reading a line stream into an unvalidated entity set:
    virtual auto parse(IStream<std::string>& lines) -> core::RawEntitySet required;
    // It allows writing a built ontology back as text:
    virtual auto serialize(core::Ontology const& ontology) -> std::string required;
  };

  // The stanza text format (`[Term]` / `[Typedef]` blocks of `tag: value` lines).
  class OboFormat: public FormatAdapter {
  public:
    explicit OboFormat(ParserParams params = {}):
        _params(std::move(params)) {}

    auto parse(IStream<std::string>& lines) -> core::RawEntitySet override;
    auto serialize(core::Ontology const& ontology) -> std::string override;

  private:
    ParserParams _params;
  };

#include "macros_close.hpp"
}

#endif // ONTOGRAPH_PARSING_FORMAT_HPP
