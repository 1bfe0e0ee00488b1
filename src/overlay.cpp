#include <algorithm>
#include <cstring>
#include <format>
#include <fstream>
#include <mutex>
#include <set>
#include <utility>

#include <catx/checksum.hpp>
#include <catx/overlay.hpp>
#include <catx/path.hpp>

namespace catx {

std::optional<ArchiveLayer> ArchiveLayer::open(const std::filesystem::path &catalogPath,
                                               const std::filesystem::path &payloadPath,
                                               int rank, Error *outError) {
  auto payload = PayloadMap::open(payloadPath, outError);
  if (!payload) {
    return std::nullopt;
  }

  auto catalog = Catalog::open(catalogPath, payload->size(), rank, outError);
  if (!catalog) {
    return std::nullopt;
  }

  ArchiveLayer layer;
  layer.rank_ = rank;
  layer.catalogPath_ = catalogPath;
  layer.catalog_ = std::move(*catalog);
  layer.payload_ = std::move(*payload);
  return layer;
}

struct Overlay::VerifyState {
  std::mutex mutex;
  std::set<std::pair<size_t, size_t>> verified;
};

Overlay::Overlay() : verify_(std::make_unique<VerifyState>()) {}

Overlay::~Overlay() = default;

Overlay::Overlay(Overlay &&) noexcept = default;

Overlay &Overlay::operator=(Overlay &&) noexcept = default;

std::optional<Overlay> Overlay::discover(const std::filesystem::path &root,
                                         const OverlayOptions &options, Error *outError) {
  int maxLayers = std::clamp(options.maxLayers, 0, 99);
  std::vector<ArchiveLayer> layers;

  for (int rank = 1; rank <= maxLayers; ++rank) {
    auto catalogPath = root / std::format("{:02d}.cat", rank);
    auto payloadPath = root / std::format("{:02d}.dat", rank);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(catalogPath, ec) ||
        !std::filesystem::is_regular_file(payloadPath, ec)) {
      break;
    }

    auto layer = ArchiveLayer::open(catalogPath, payloadPath, rank, outError);
    if (!layer) {
      return std::nullopt;
    }
    layers.push_back(std::move(*layer));
  }

  if (layers.empty()) {
    setError(outError, ErrorCode::NoLayersFound,
             std::format("No archive layers found in {} (expected 01.cat and 01.dat)",
                         root.string()));
    return std::nullopt;
  }

  return fromLayers(std::move(layers), options, outError);
}

std::optional<Overlay> Overlay::fromLayers(std::vector<ArchiveLayer> layers,
                                           const OverlayOptions &options, Error *outError) {
  if (layers.empty()) {
    setError(outError, ErrorCode::NoLayersFound, "No archive layers given");
    return std::nullopt;
  }

  std::sort(layers.begin(), layers.end(),
            [](const ArchiveLayer &a, const ArchiveLayer &b) { return a.rank() < b.rank(); });

  for (size_t i = 1; i < layers.size(); ++i) {
    if (layers[i].rank() == layers[i - 1].rank()) {
      setError(outError, ErrorCode::MalformedIndex,
               std::format("Duplicate layer rank {}: {} and {}", layers[i].rank(),
                           layers[i - 1].catalogPath().string(),
                           layers[i].catalogPath().string()));
      return std::nullopt;
    }
  }

  Overlay overlay;
  overlay.layers_ = std::move(layers);
  overlay.options_ = options;
  overlay.buildView();
  return overlay;
}

void Overlay::buildView() {
  byPath_.clear();
  directories_.clear();

  // Ascending rank: a later layer replaces the mapping of an earlier one
  for (size_t i = 0; i < layers_.size(); ++i) {
    const auto &entries = layers_[i].catalog().entries();
    for (size_t j = 0; j < entries.size(); ++j) {
      byPath_[entries[j].lookupPath] = FileHandle{i, j};
    }
  }

  for (const auto &[path, handle] : byPath_) {
    directories_[std::string(parentDirectory(path))].push_back(path);
  }
  for (auto &[directory, paths] : directories_) {
    std::sort(paths.begin(), paths.end());
  }
}

std::optional<FileHandle> Overlay::resolve(std::string_view path) const {
  auto it = byPath_.find(normalizePath(path));
  if (it == byPath_.end()) {
    return std::nullopt;
  }
  return it->second;
}

const IndexEntry &Overlay::entry(FileHandle handle) const {
  return layers_.at(handle.layer).catalog().entries().at(handle.entry);
}

const ArchiveLayer &Overlay::layer(FileHandle handle) const {
  return layers_.at(handle.layer);
}

std::optional<std::span<const uint8_t>> Overlay::view(FileHandle handle, Error *outError) const {
  const auto &layer = layers_.at(handle.layer);
  const auto &entry = layer.catalog().entries().at(handle.entry);

  Error sliceError;
  auto slice = layer.payloadMap().slice(entry.offset, entry.size, &sliceError);
  if (!slice) {
    setError(outError, sliceError.code,
             std::format("Entry {}: {}", entry.path, sliceError.message));
    return std::nullopt;
  }
  auto bytes = *slice;

  if (!options_.verifyChecksums || !entry.checksum) {
    return bytes;
  }

  auto key = std::make_pair(handle.layer, handle.entry);
  {
    std::lock_guard<std::mutex> lock(verify_->mutex);
    if (verify_->verified.contains(key)) {
      return bytes;
    }
  }

  auto digest = md5Hex(bytes);
  if (!digest) {
    setError(outError, ErrorCode::IoError,
             std::format("Failed to compute checksum of {}", entry.path));
    return std::nullopt;
  }
  if (*digest != *entry.checksum) {
    setError(outError, ErrorCode::CorruptPayload,
             std::format("Checksum mismatch for {} in {} (expected {}, got {})", entry.path,
                         layer.payloadPath().string(), *entry.checksum, *digest));
    return std::nullopt;
  }

  std::lock_guard<std::mutex> lock(verify_->mutex);
  verify_->verified.insert(key);
  return bytes;
}

std::optional<std::vector<uint8_t>> Overlay::read(FileHandle handle, Error *outError) const {
  auto bytes = view(handle, outError);
  if (!bytes) {
    return std::nullopt;
  }

  std::vector<uint8_t> result(bytes->size());
  if (!bytes->empty()) {
    std::memcpy(result.data(), bytes->data(), bytes->size());
  }
  return result;
}

std::optional<std::vector<uint8_t>> Overlay::readFile(std::string_view path,
                                                      Error *outError) const {
  auto handle = resolve(path);
  if (!handle) {
    setError(outError, ErrorCode::FileNotFound,
             std::format("File not found in any layer: {}", path));
    return std::nullopt;
  }
  return read(*handle, outError);
}

bool Overlay::extract(FileHandle handle, const std::filesystem::path &destPath,
                      Error *outError) const {
  auto bytes = view(handle, outError);
  if (!bytes) {
    return false;
  }

  // Create parent directories if needed
  std::error_code ec;
  std::filesystem::create_directories(destPath.parent_path(), ec);

  std::ofstream out(destPath, std::ios::binary);
  if (!out) {
    setError(outError, ErrorCode::IoError,
             std::format("Failed to create output file: {}", destPath.string()));
    return false;
  }

  out.write(reinterpret_cast<const char *>(bytes->data()),
            static_cast<std::streamsize>(bytes->size()));
  if (!out) {
    setError(outError, ErrorCode::IoError,
             std::format("Failed to write to output file: {}", destPath.string()));
    return false;
  }

  return true;
}

std::vector<std::string> Overlay::list(std::string_view directory) const {
  auto it = directories_.find(normalizePath(directory));
  if (it == directories_.end()) {
    return {};
  }
  return it->second;
}

std::vector<std::string> Overlay::glob(std::string_view pattern) const {
  std::string normalized = normalizePath(pattern);
  std::string_view namePattern = fileName(normalized);

  std::vector<std::string> result;
  for (const auto &path : list(parentDirectory(normalized))) {
    if (matchGlob(namePattern, fileName(path))) {
      result.push_back(path);
    }
  }
  return result;
}

std::vector<std::string> Overlay::files() const {
  std::vector<std::string> result;
  result.reserve(byPath_.size());
  for (const auto &[path, handle] : byPath_) {
    result.push_back(path);
  }
  std::sort(result.begin(), result.end());
  return result;
}

} // namespace catx
