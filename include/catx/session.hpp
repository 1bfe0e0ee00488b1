#pragma once

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "definition_graph.hpp"
#include "overlay.hpp"
#include "record.hpp"
#include "types.hpp"

namespace catx {

struct SessionOptions {
  // Upper bound on concurrently resolved kinds
  unsigned maxThreads = std::max(1u, std::thread::hardware_concurrency());
};

// Loads definition documents through an overlay and resolves them per kind
//
// Loading is single-threaded. resolve() only reads the graph and may be called repeatedly.
class Session {
public:
  explicit Session(const Overlay &overlay, SessionOptions options = {});

  // Read index/macros.xml and index/components.xml; absent indexes are skipped
  bool loadIndexes(Error *outError = nullptr);

  // Parse every document matching the kind's source globs
  // An unsupported kind records UnknownKind and succeeds
  bool loadKind(const std::string &kind, Error *outError = nullptr);

  // Parse one document by logical path; documents already loaded are skipped
  bool loadDocument(std::string_view path, Error *outError = nullptr);

  // Load the documents defining referenced but missing macros and components, until
  // nothing new can be loaded
  bool loadDependencies(Error *outError = nullptr);

  // loadIndexes(), loadKind() for every kind ("all" expands), loadDependencies()
  bool load(const std::vector<std::string> &kinds, Error *outError = nullptr);

  // Resolve every kind with its own resolver; results follow the requested order
  std::vector<ResolveResult> resolve(const std::vector<std::string> &kinds) const;

  const Overlay &overlay() const { return overlay_; }
  const DefinitionGraph &graph() const { return graph_; }

  // Loader diagnostics followed by the graph's
  std::vector<Diagnostic> diagnostics() const;

  // Logical paths of the documents parsed so far, in load order
  const std::vector<std::string> &loadedDocuments() const { return loaded_; }

private:
  bool loadIndex(std::string_view path, std::unordered_map<std::string, std::string> &index,
                 Error *outError);
  std::optional<std::string> indexedPath(const std::unordered_map<std::string, std::string> &index,
                                         const std::string &id) const;

  const Overlay &overlay_;
  SessionOptions options_;
  DefinitionGraph graph_;
  std::unordered_map<std::string, std::string> macroIndex_;
  std::unordered_map<std::string, std::string> componentIndex_;
  std::unordered_set<std::string> seen_; // Lookup paths loaded or known to be absent
  std::vector<std::string> loaded_;
  std::vector<Diagnostic> diagnostics_;
};

} // namespace catx
