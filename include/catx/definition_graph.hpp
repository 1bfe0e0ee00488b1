#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "definition.hpp"
#include "types.hpp"

namespace catx {

using NodeId = size_t;

// Session-wide arena of definition nodes from any number of documents
//
// Macros and wares share one identifier namespace, components have their own. Nodes are
// never resolved here, so documents can be added in any order.
class DefinitionGraph {
public:
  // Add the nodes of one document
  // An identifier that is already defined keeps its first definition (DuplicateDefinition)
  void add(std::vector<DefinitionNode> nodes);

  size_t size() const { return nodes_.size(); }
  const std::vector<DefinitionNode> &nodes() const { return nodes_; }
  const DefinitionNode &node(NodeId id) const { return nodes_.at(id); }

  std::optional<NodeId> findMacro(const std::string &id) const;
  std::optional<NodeId> findComponent(const std::string &id) const;

  // Nodes whose macro class is kind, in insertion order
  std::vector<NodeId> nodesOfKind(const std::string &kind) const;

  // Macro identifiers referenced by extends or connections but not defined
  std::set<std::string> missingMacros() const;

  // Component identifiers referenced by macros but not defined
  std::set<std::string> missingComponents() const;

  const std::vector<Diagnostic> &diagnostics() const { return diagnostics_; }

private:
  std::vector<DefinitionNode> nodes_;
  std::unordered_map<std::string, NodeId> macros_;
  std::unordered_map<std::string, NodeId> components_;
  std::unordered_map<std::string, std::vector<NodeId>> byKind_;
  std::vector<Diagnostic> diagnostics_;
};

} // namespace catx
