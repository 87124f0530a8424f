#ifndef ONTOGRAPH_SERIAL_JSON_EXPORT_HPP
#define ONTOGRAPH_SERIAL_JSON_EXPORT_HPP

#include <string>
#include <nlohmann/json.hpp>
#include <core/entity.hpp>
#include <core/ontology.hpp>

namespace ontograph::core {

  void to_json(nlohmann::json& j, IdSet const& o);
  void to_json(nlohmann::json& j, Term const& o);

}

namespace ontograph::serial {
#include "macros_open.hpp"

  // One-way structured export: an object keyed by term id (keys come out sorted).
  auto toJson(core::Ontology const& ontology) -> nlohmann::json;

  // `toJson` rendered with a 2-space indent.
  auto dumpJson(core::Ontology const& ontology) -> std::string;

#include "macros_close.hpp"
}

#endif // ONTOGRAPH_SERIAL_JSON_EXPORT_HPP
