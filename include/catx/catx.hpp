#pragma once

// catx: game data extraction library
// A C++20 library for reading the layered NN.cat/NN.dat archives of X4-style games and
// resolving their XML macro, component and ware definitions into flat, exportable records.

#include "catalog.hpp"
#include "definition_graph.hpp"
#include "definition_parser.hpp"
#include "exporter.hpp"
#include "kinds.hpp"
#include "language.hpp"
#include "overlay.hpp"
#include "payload.hpp"
#include "record.hpp"
#include "resolver.hpp"
#include "session.hpp"
#include "types.hpp"

// The library provides three levels of abstraction:
//
// 1. Archives: Catalog / ArchiveLayer / Overlay
//    - Overlay::discover() opens every numbered layer of a game directory
//    - Higher ranks shadow lower ones; reads are lazy and checksum verified
//
// 2. Definitions: parseDefinitions() / DefinitionGraph / MacroResolver
//    - Parse documents into unresolved nodes, resolve inheritance and connections
//
// 3. Sessions: Session / Exporter / TextDatabase
//    - Load everything one or more object kinds need and export the records
//
// Example usage:
//
//   catx::Error error;
//   auto overlay = catx::Overlay::discover("path/to/game", {}, &error);
//   if (!overlay) {
//     std::cerr << error.message << std::endl;
//     return;
//   }
//
//   catx::Session session(*overlay);
//   if (session.load({"engine"}, &error)) {
//     for (const auto& result : session.resolve({"engine"})) {
//       for (const auto& record : result.records) {
//         std::cout << record.id << std::endl;
//       }
//     }
//   }

namespace catx {}
