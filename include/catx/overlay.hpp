#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "catalog.hpp"
#include "payload.hpp"
#include "types.hpp"

namespace catx {

struct OverlayOptions {
  int maxLayers = 99;          // Highest rank tried by discover(), at most 99
  bool verifyChecksums = true; // Check payload bytes against catalog checksums on read
};

// One ranked catalog/payload pair (NN.cat + NN.dat)
class ArchiveLayer {
public:
  ArchiveLayer() = default;

  // Delete copy, enable move
  ArchiveLayer(const ArchiveLayer &) = delete;
  ArchiveLayer &operator=(const ArchiveLayer &) = delete;
  ArchiveLayer(ArchiveLayer &&) noexcept = default;
  ArchiveLayer &operator=(ArchiveLayer &&) noexcept = default;

  // Parse the catalog and map the payload; no payload bytes are read
  static std::optional<ArchiveLayer> open(const std::filesystem::path &catalogPath,
                                          const std::filesystem::path &payloadPath, int rank,
                                          Error *outError = nullptr);

  int rank() const { return rank_; }
  const Catalog &catalog() const { return catalog_; }
  const std::filesystem::path &catalogPath() const { return catalogPath_; }
  const std::filesystem::path &payloadPath() const { return payload_.path(); }
  const PayloadMap &payloadMap() const { return payload_; }

  // Mapped payload bytes (empty for a zero-length payload)
  std::span<const uint8_t> payload() const { return payload_.bytes(); }

private:
  int rank_ = 0;
  std::filesystem::path catalogPath_;
  Catalog catalog_;
  PayloadMap payload_;
};

// Priority-merged view of all layers as one logical file tree
//
// For every path, the entry of the highest-ranked layer that lists it wins. Lower-ranked
// copies are shadowed and never read.
class Overlay {
public:
  Overlay();
  ~Overlay();

  // Delete copy, enable move
  Overlay(const Overlay &) = delete;
  Overlay &operator=(const Overlay &) = delete;
  Overlay(Overlay &&) noexcept;
  Overlay &operator=(Overlay &&) noexcept;

  // Probe root for 01.cat/01.dat, 02.cat/02.dat, ... and stop at the first missing pair
  // Returns std::nullopt on failure (NoLayersFound if rank 1 is missing)
  static std::optional<Overlay> discover(const std::filesystem::path &root,
                                         const OverlayOptions &options = {},
                                         Error *outError = nullptr);

  // Build an overlay from already opened layers, given in any order
  static std::optional<Overlay> fromLayers(std::vector<ArchiveLayer> layers,
                                           const OverlayOptions &options = {},
                                           Error *outError = nullptr);

  // Layers in ascending rank
  const std::vector<ArchiveLayer> &layers() const { return layers_; }

  // Number of distinct logical paths
  size_t fileCount() const { return byPath_.size(); }

  // Highest-ranked entry for path, case-insensitive
  std::optional<FileHandle> resolve(std::string_view path) const;

  // Check if any layer lists path
  bool exists(std::string_view path) const { return resolve(path).has_value(); }

  const IndexEntry &entry(FileHandle handle) const;
  const ArchiveLayer &layer(FileHandle handle) const;

  // Zero-copy view of the winning entry's bytes, verified against its checksum
  // Returns std::nullopt on failure (CorruptPayload)
  std::optional<std::span<const uint8_t>> view(FileHandle handle,
                                               Error *outError = nullptr) const;

  // Copy of the winning entry's bytes
  std::optional<std::vector<uint8_t>> read(FileHandle handle, Error *outError = nullptr) const;

  // resolve() + read(); FileNotFound if no layer lists path
  std::optional<std::vector<uint8_t>> readFile(std::string_view path,
                                               Error *outError = nullptr) const;

  // Extract the winning entry to disk
  bool extract(FileHandle handle, const std::filesystem::path &destPath,
               Error *outError = nullptr) const;

  // Files directly inside a logical directory, sorted lookup paths
  std::vector<std::string> list(std::string_view directory) const;

  // Files matching pattern; the directory part is literal, the file name may use '*' and '?'
  std::vector<std::string> glob(std::string_view pattern) const;

  // All logical paths, sorted
  std::vector<std::string> files() const;

private:
  struct VerifyState;

  void buildView();

  std::vector<ArchiveLayer> layers_;
  std::unordered_map<std::string, FileHandle> byPath_;          // lookup path -> winner
  std::map<std::string, std::vector<std::string>> directories_; // directory -> file paths
  OverlayOptions options_;
  std::unique_ptr<VerifyState> verify_;
};

} // namespace catx
