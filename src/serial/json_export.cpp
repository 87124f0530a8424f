#include "json_export.hpp"

using nlohmann::json;

namespace ontograph::core {

  namespace {

    // Repeated tags are grouped: {"synonym": ["a", "b"], "xref": ["c"]}.
    auto groupTags(Tags const& tags) -> json {
      auto res = json::object();
      for (auto const& [tag, value]: tags) res[tag].push_back(value);
      return res;
    }

  }

  // clang-format off
#define TO(key, name) j[key] = o.name
#define OPT_TO(key, name) if (o.name) j[key] = *o.name

  void to_json(json& j, IdSet const& o) { j = o.items(); }
  void to_json(json& j, Term const& o) {
    j = json::object(); TO("id", id); TO("name", name); TO("namespace", ns); OPT_TO("def", def); TO("obsolete", obsolete);
    TO("is_a", isA); TO("relationships", relationships); j["other"] = groupTags(o.other);
  }

  // clang-format on
#undef TO
#undef OPT_TO

}

namespace ontograph::serial {
#include "macros_open.hpp"

  auto toJson(core::Ontology const& ontology) -> json {
    auto res = json::object();
    for (auto const& term: ontology) res[term.id] = term;
    return res;
  }

  auto dumpJson(core::Ontology const& ontology) -> std::string {
    return toJson(ontology).dump(2);
  }

#include "macros_close.hpp"
}
