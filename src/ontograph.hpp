#ifndef ONTOGRAPH_HPP
#define ONTOGRAPH_HPP

// Everything needed to load, query, merge and write ontologies:

#include "core/entity.hpp"         // Term, Typedef, Metadata, Diagnostic, RawEntitySet
#include "core/errors.hpp"         // OntologyError and subclasses
#include "core/ontology.hpp"       // Ontology (lookup and traversal)
#include "graph/builder.hpp"       // GraphBuilder, load
#include "graph/merge.hpp"         // merge, include
#include "parsing/format.hpp"      // FormatAdapter, OboFormat
#include "parsing/stream.hpp"      // StringLineStream, InputLineStream
#include "serial/json_export.hpp"  // toJson, dumpJson
#include "serial/obo_writer.hpp"   // OboWriter

#endif // ONTOGRAPH_HPP
