#include <cctype>
#include <format>
#include <future>
#include <utility>

#include <catx/definition_parser.hpp>
#include <catx/kinds.hpp>
#include <catx/path.hpp>
#include <catx/resolver.hpp>
#include <catx/session.hpp>

namespace catx {

namespace {

constexpr std::string_view macroIndexPath = "index/macros.xml";
constexpr std::string_view componentIndexPath = "index/components.xml";

// Component index entries the shipped index gets wrong or leaves out
const std::pair<std::string_view, std::string_view> componentIndexFixes[] = {
    {"cockpit_invisible_escapepod", "assets/units/size_s/cockpit_invisible_escapepod.xml"},
};

std::string lowercase(std::string_view text) {
  std::string result(text);
  for (auto &c : result) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return result;
}

} // namespace

Session::Session(const Overlay &overlay, SessionOptions options)
    : overlay_(overlay), options_(options) {
  if (options_.maxThreads == 0) {
    options_.maxThreads = 1;
  }
}

bool Session::loadIndexes(Error *outError) {
  if (!loadIndex(macroIndexPath, macroIndex_, outError) ||
      !loadIndex(componentIndexPath, componentIndex_, outError)) {
    return false;
  }

  for (const auto &[name, path] : componentIndexFixes) {
    componentIndex_.insert_or_assign(std::string(name), std::string(path));
  }
  return true;
}

bool Session::loadIndex(std::string_view path,
                        std::unordered_map<std::string, std::string> &index, Error *outError) {
  auto handle = overlay_.resolve(path);
  if (!handle) {
    return true;
  }

  auto data = overlay_.view(*handle, outError);
  if (!data) {
    return false;
  }

  auto entries = parseIndex(*data, path, outError);
  if (!entries) {
    return false;
  }

  // Identifiers are matched case-insensitively against the index
  for (auto &[name, target] : *entries) {
    index.insert_or_assign(lowercase(name), std::move(target));
  }
  return true;
}

bool Session::loadKind(const std::string &kind, Error *outError) {
  const KindSpec *spec = findKind(kind);
  if (!spec) {
    diagnostics_.push_back(
        Diagnostic{ErrorCode::UnknownKind, kind, std::format("Unsupported object kind: {}", kind)});
    return true;
  }

  for (auto pattern : spec->sources) {
    for (const auto &path : overlay_.glob(pattern)) {
      if (!loadDocument(path, outError)) {
        return false;
      }
    }
  }
  return true;
}

bool Session::loadDocument(std::string_view path, Error *outError) {
  std::string lookupPath = normalizePath(path);
  if (seen_.contains(lookupPath)) {
    return true;
  }

  auto handle = overlay_.resolve(lookupPath);
  if (!handle) {
    setError(outError, ErrorCode::FileNotFound, std::format("File not found: {}", path));
    return false;
  }

  auto data = overlay_.view(*handle, outError);
  if (!data) {
    return false;
  }

  auto nodes = parseDefinitions(*data, overlay_.entry(*handle).path, outError);
  if (!nodes) {
    return false;
  }

  seen_.insert(lookupPath);
  loaded_.push_back(lookupPath);
  graph_.add(std::move(*nodes));
  return true;
}

std::optional<std::string>
Session::indexedPath(const std::unordered_map<std::string, std::string> &index,
                     const std::string &id) const {
  auto it = index.find(lowercase(id));
  if (it == index.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool Session::loadDependencies(Error *outError) {
  bool progress = true;
  while (progress) {
    progress = false;

    std::vector<std::string> pending;
    for (const auto &id : graph_.missingMacros()) {
      if (auto path = indexedPath(macroIndex_, id)) {
        pending.push_back(std::move(*path));
      }
    }
    for (const auto &id : graph_.missingComponents()) {
      if (auto path = indexedPath(componentIndex_, id)) {
        pending.push_back(std::move(*path));
      }
    }

    for (const auto &path : pending) {
      std::string lookupPath = normalizePath(path);
      if (seen_.contains(lookupPath)) {
        continue;
      }

      // A stale index entry leaves the reference for the resolver to report
      if (!overlay_.exists(lookupPath)) {
        seen_.insert(lookupPath);
        diagnostics_.push_back(Diagnostic{ErrorCode::FileNotFound, path,
                                          std::format("Indexed document {} is missing", path)});
        continue;
      }

      if (!loadDocument(lookupPath, outError)) {
        return false;
      }
      progress = true;
    }
  }
  return true;
}

bool Session::load(const std::vector<std::string> &kinds, Error *outError) {
  if (!loadIndexes(outError)) {
    return false;
  }
  for (const auto &kind : expandKinds(kinds)) {
    if (!loadKind(kind, outError)) {
      return false;
    }
  }
  return loadDependencies(outError);
}

std::vector<ResolveResult> Session::resolve(const std::vector<std::string> &kinds) const {
  std::vector<std::string> expanded = expandKinds(kinds);
  std::vector<ResolveResult> results;
  results.reserve(expanded.size());

  // Each task owns its resolver, so memo state is never shared between threads
  for (size_t first = 0; first < expanded.size(); first += options_.maxThreads) {
    size_t last = std::min(expanded.size(), first + options_.maxThreads);

    std::vector<std::future<ResolveResult>> tasks;
    for (size_t i = first; i < last; ++i) {
      tasks.push_back(std::async(std::launch::async, [this, kind = expanded[i]] {
        MacroResolver resolver(graph_);
        return resolver.resolve(kind);
      }));
    }
    for (auto &task : tasks) {
      results.push_back(task.get());
    }
  }
  return results;
}

std::vector<Diagnostic> Session::diagnostics() const {
  std::vector<Diagnostic> result = diagnostics_;
  const auto &graphDiagnostics = graph_.diagnostics();
  result.insert(result.end(), graphDiagnostics.begin(), graphDiagnostics.end());
  return result;
}

} // namespace catx
