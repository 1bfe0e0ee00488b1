#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace catx {

// Flattened property name -> raw value, as written in the document
using PropertyMap = std::map<std::string, std::string>;

// Which kind of element a definition node was parsed from
enum class NodeOrigin {
  Macro,     // <macro name class> in a <macros> document
  Component, // <component name class> in a <components> document
  Ware,      // <ware id> in a <wares> document
};

// Reference from a container to a contained macro, or a component mount point
struct ConnectionRef {
  std::string role;  // Connection name (<connection ref> on macros, <connection name> on components)
  std::string macro; // Connected macro identifier, empty for a bare mount point
  std::string tags;  // Space-separated mount tags (components only)
};

// One parsed macro, component or ware definition, unresolved
struct DefinitionNode {
  std::string id;
  std::string kind; // Macro class, e.g. "engine", "ship_m", "ware"
  NodeOrigin origin = NodeOrigin::Macro;
  std::optional<std::string> extends;   // Parent macro identifier
  std::optional<std::string> component; // Component identifier (macros only)
  PropertyMap properties;
  std::vector<ConnectionRef> connections;
  std::string sourcePath; // Logical path of the defining document
};

} // namespace catx
