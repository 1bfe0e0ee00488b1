#include <format>

#include <catx/definition_graph.hpp>

namespace catx {

void DefinitionGraph::add(std::vector<DefinitionNode> nodes) {
  for (auto &node : nodes) {
    auto &index = node.origin == NodeOrigin::Component ? components_ : macros_;
    auto it = index.find(node.id);
    if (it != index.end()) {
      diagnostics_.push_back(Diagnostic{
          ErrorCode::DuplicateDefinition, node.id,
          std::format("{} is defined in {} and {}; keeping the first", node.id,
                      nodes_[it->second].sourcePath, node.sourcePath)});
      continue;
    }

    NodeId id = nodes_.size();
    index.emplace(node.id, id);
    if (node.origin != NodeOrigin::Component) {
      byKind_[node.kind].push_back(id);
    }
    nodes_.push_back(std::move(node));
  }
}

std::optional<NodeId> DefinitionGraph::findMacro(const std::string &id) const {
  auto it = macros_.find(id);
  if (it == macros_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<NodeId> DefinitionGraph::findComponent(const std::string &id) const {
  auto it = components_.find(id);
  if (it == components_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<NodeId> DefinitionGraph::nodesOfKind(const std::string &kind) const {
  auto it = byKind_.find(kind);
  if (it == byKind_.end()) {
    return {};
  }
  return it->second;
}

std::set<std::string> DefinitionGraph::missingMacros() const {
  std::set<std::string> missing;
  for (const auto &node : nodes_) {
    if (node.extends && !macros_.contains(*node.extends)) {
      missing.insert(*node.extends);
    }
    for (const auto &conn : node.connections) {
      if (!conn.macro.empty() && !macros_.contains(conn.macro)) {
        missing.insert(conn.macro);
      }
    }
  }
  return missing;
}

std::set<std::string> DefinitionGraph::missingComponents() const {
  std::set<std::string> missing;
  for (const auto &node : nodes_) {
    if (node.component && !components_.contains(*node.component)) {
      missing.insert(*node.component);
    }
  }
  return missing;
}

} // namespace catx
