#include <algorithm>
#include <cstddef>
#include <format>
#include <unordered_set>

#include <catx/kinds.hpp>
#include <catx/resolver.hpp>

namespace catx {

namespace {

// Names listed in an inheritance cycle message
constexpr std::ptrdiff_t maxCycleNames = 8;

void appendUnique(std::vector<Diagnostic> &to, const std::vector<Diagnostic> &from) {
  for (const auto &diagnostic : from) {
    if (std::find(to.begin(), to.end(), diagnostic) == to.end()) {
      to.push_back(diagnostic);
    }
  }
}

} // namespace

MacroResolver::MacroResolver(const DefinitionGraph &graph)
    : graph_(graph), inheritState_(graph.size(), State::Unvisited), inherited_(graph.size()),
      inheritErrors_(graph.size()), recordState_(graph.size(), State::Unvisited),
      resolved_(graph.size()), errors_(graph.size()) {}

ResolveResult MacroResolver::resolve(const std::string &kind) {
  ResolveResult result;
  result.kind = kind;

  const KindSpec *spec = findKind(kind);
  if (!spec) {
    result.diagnostics.push_back(
        Diagnostic{ErrorCode::UnknownKind, kind, std::format("Unsupported object kind: {}", kind)});
    return result;
  }

  for (auto macroClass : spec->classes) {
    for (NodeId id : graph_.nodesOfKind(std::string(macroClass))) {
      Error error;
      const Resolved *entry = resolved(id, &error);
      if (!entry) {
        result.diagnostics.push_back(Diagnostic{error.code, graph_.node(id).id, error.message});
        continue;
      }
      result.records.push_back(entry->record);
    }
  }

  std::sort(result.records.begin(), result.records.end(),
            [](const ResolvedRecord &a, const ResolvedRecord &b) { return a.id < b.id; });
  for (const auto &record : result.records) {
    appendUnique(result.diagnostics, record.diagnostics);
  }
  return result;
}

std::optional<ResolvedRecord> MacroResolver::resolveNode(const std::string &id, Error *outError) {
  auto node = graph_.findMacro(id);
  if (!node) {
    setError(outError, ErrorCode::UnresolvedReference, std::format("Unknown macro {}", id));
    return std::nullopt;
  }

  const Resolved *entry = resolved(*node, outError);
  if (!entry) {
    return std::nullopt;
  }
  return entry->record;
}

const MacroResolver::Inherited *MacroResolver::inherited(NodeId start, Error *outError) {
  static const Inherited root{};

  // Walk up until a memoized ancestor, the root of the chain, or a node seen twice
  std::vector<NodeId> chain;
  std::unordered_set<NodeId> inProgress;
  const Inherited *base = &root;
  std::vector<Diagnostic> walkDiagnostics;

  NodeId current = start;
  while (true) {
    if (inheritState_[current] == State::Done) {
      base = &*inherited_[current];
      break;
    }
    if (inheritState_[current] == State::Failed) {
      // The chain keeps the root cause; only the reported error names the ancestor
      const Error &cause = inheritErrors_[current];
      failChain(chain, cause);
      if (current == start) {
        setError(outError, cause.code, cause.message);
      } else {
        setError(outError, cause.code,
                 std::format("{} inherits from {}: {}", graph_.node(start).id,
                             graph_.node(current).id, cause.message));
      }
      return nullptr;
    }
    if (!inProgress.insert(current).second) {
      auto loopStart = std::find(chain.begin(), chain.end(), current);
      auto length = chain.end() - loopStart;
      std::string names;
      for (auto it = loopStart; it != chain.end() && it - loopStart < maxCycleNames; ++it) {
        names += graph_.node(*it).id + " -> ";
      }
      if (length > maxCycleNames) {
        names += std::format("... ({} nodes)", length);
      } else {
        names += graph_.node(current).id;
      }

      // Shared by every node of the chain
      Error error{ErrorCode::InheritanceCycle, std::format("Inheritance cycle: {}", names)};
      failChain(chain, error);
      setError(outError, error.code, error.message);
      return nullptr;
    }
    chain.push_back(current);

    const auto &node = graph_.node(current);
    if (!node.extends) {
      break;
    }
    auto parent = graph_.findMacro(*node.extends);
    if (!parent) {
      walkDiagnostics.push_back(Diagnostic{
          ErrorCode::UnresolvedReference, node.id,
          std::format("{} extends unknown macro {}", node.id, *node.extends)});
      break;
    }
    current = *parent;
  }

  // Fold from the topmost ancestor down to start
  const Inherited *parent = base;
  for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
    inherited_[*it] = overlay(*parent, *it);
    if (*it == chain.back()) {
      appendUnique(inherited_[*it]->diagnostics, walkDiagnostics);
    }
    inheritState_[*it] = State::Done;
    parent = &*inherited_[*it];
  }

  return &*inherited_[start];
}

MacroResolver::Inherited MacroResolver::overlay(const Inherited &base, NodeId id) {
  const auto &node = graph_.node(id);
  Inherited result = base;

  // Component properties sit under the macro's own properties
  if (node.component) {
    auto component = graph_.findComponent(*node.component);
    if (component) {
      result.component = component;
      for (const auto &[key, value] : graph_.node(*component).properties) {
        result.properties[key] = value;
      }
    } else {
      result.component.reset();
      result.diagnostics.push_back(Diagnostic{
          ErrorCode::UnresolvedReference, node.id,
          std::format("{} references unknown component {}", node.id, *node.component)});
    }
  }

  for (const auto &[key, value] : node.properties) {
    result.properties[key] = value;
  }

  // A child's connection replaces the inherited ones with the same role
  if (!node.connections.empty()) {
    std::unordered_set<std::string> roles;
    for (const auto &conn : node.connections) {
      roles.insert(conn.role);
    }
    std::erase_if(result.connections,
                  [&](const ConnectionRef &conn) { return roles.contains(conn.role); });
    result.connections.insert(result.connections.end(), node.connections.begin(),
                              node.connections.end());
  }

  return result;
}

void MacroResolver::failChain(const std::vector<NodeId> &chain, const Error &error) {
  for (NodeId id : chain) {
    inheritState_[id] = State::Failed;
    inheritErrors_[id] = error;
  }
}

const MacroResolver::Resolved *MacroResolver::resolved(NodeId id, Error *outError) {
  switch (recordState_[id]) {
  case State::Done:
    return &*resolved_[id];
  case State::Failed:
    setError(outError, errors_[id].code, errors_[id].message);
    return nullptr;
  case State::InProgress:
    setError(outError, ErrorCode::ConnectionCycle,
             std::format("Connection cycle through {}", graph_.node(id).id));
    return nullptr;
  case State::Unvisited:
    break;
  }

  recordState_[id] = State::InProgress;

  Error error;
  const Inherited *source = inherited(id, &error);
  if (!source) {
    recordState_[id] = State::Failed;
    errors_[id] = error;
    setError(outError, error.code, error.message);
    return nullptr;
  }

  const auto &node = graph_.node(id);
  Resolved entry;
  entry.record.id = node.id;
  entry.record.kind = node.kind;
  entry.record.diagnostics = source->diagnostics;

  // Raw properties pass through untouched
  for (const auto &[key, value] : source->properties) {
    entry.record.attributes[key] = value;
  }

  resolveConnections(*source, entry.record);

  const DefinitionNode *component =
      source->component ? &graph_.node(*source->component) : nullptr;
  DerivationInput input{node.id, node.kind, source->properties, component, entry.record.slots};
  AttributeMap derived;
  if (deriveAttributes(input, derived, entry.record.diagnostics)) {
    for (const auto &[key, value] : derived) {
      entry.record.attributes[key] = value;
    }
    entry.summary = std::move(derived);
  } else {
    entry.summary = entry.record.attributes;
  }

  resolved_[id] = std::move(entry);
  recordState_[id] = State::Done;
  return &*resolved_[id];
}

void MacroResolver::resolveConnections(const Inherited &source, ResolvedRecord &record) {
  for (const auto &conn : source.connections) {
    if (conn.macro.empty()) {
      continue;
    }

    ConnectionSlot slot{conn.role, record.id, conn.macro, std::nullopt};

    auto target = graph_.findMacro(conn.macro);
    if (!target) {
      record.diagnostics.push_back(Diagnostic{
          ErrorCode::UnresolvedReference, record.id,
          std::format("{} connection {} references unknown macro {}", record.id, conn.role,
                      conn.macro)});
      record.slots.push_back(std::move(slot));
      continue;
    }

    Error error;
    const Resolved *child = resolved(*target, &error);
    if (!child) {
      record.diagnostics.push_back(Diagnostic{
          error.code, record.id,
          std::format("{} connection {}: {}", record.id, conn.role, error.message)});
      record.slots.push_back(std::move(slot));
      continue;
    }

    slot.target = SlotSummary{child->record.kind, child->summary};
    record.slots.push_back(std::move(slot));

    // Nested connections (storage modules, docking bays inside dock areas, ...) are
    // flattened into the container
    record.slots.insert(record.slots.end(), child->record.slots.begin(),
                        child->record.slots.end());
    appendUnique(record.diagnostics, child->record.diagnostics);
  }
}

} // namespace catx
