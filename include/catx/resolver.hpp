#pragma once

#include <optional>
#include <string>
#include <vector>

#include "definition_graph.hpp"
#include "record.hpp"
#include "types.hpp"

namespace catx {

// Resolves "extends" inheritance and connection references of a definition graph into
// flat records
//
// Each node is resolved at most once per resolver and results, failures included, are
// memoized. Unless connections form a cycle the output does not depend on visitation order.
// The graph is only read, so several resolvers may work on one graph concurrently.
class MacroResolver {
public:
  explicit MacroResolver(const DefinitionGraph &graph);

  // Resolve every macro of an object kind ("engine", "ship", ...)
  // An unsupported kind yields an UnknownKind diagnostic and no records
  ResolveResult resolve(const std::string &kind);

  // Resolve one macro by identifier
  // Returns std::nullopt on failure (UnresolvedReference, InheritanceCycle)
  std::optional<ResolvedRecord> resolveNode(const std::string &id, Error *outError = nullptr);

private:
  // Attributes and connections after walking the extends chain
  struct Inherited {
    PropertyMap properties;
    std::vector<ConnectionRef> connections;
    std::optional<NodeId> component;
    std::vector<Diagnostic> diagnostics;
  };

  struct Resolved {
    ResolvedRecord record;
    AttributeMap summary; // What containers embed for this macro
  };

  enum class State { Unvisited, InProgress, Done, Failed };

  const Inherited *inherited(NodeId id, Error *outError);
  Inherited overlay(const Inherited &base, NodeId id);
  void failChain(const std::vector<NodeId> &chain, const Error &error);

  const Resolved *resolved(NodeId id, Error *outError);
  void resolveConnections(const Inherited &source, ResolvedRecord &record);

  const DefinitionGraph &graph_;

  std::vector<State> inheritState_;
  std::vector<std::optional<Inherited>> inherited_;
  std::vector<Error> inheritErrors_; // Root cause of a failed extends chain
  std::vector<State> recordState_;
  std::vector<std::optional<Resolved>> resolved_;
  std::vector<Error> errors_; // Failure of Failed records
};

} // namespace catx
