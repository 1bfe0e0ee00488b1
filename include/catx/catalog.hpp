#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace catx {

// Directory table of one archive layer (an NN.cat file)
//
// Each line reads "<path> <size> <timestamp> [<md5>]". Entries are stored back to back in the
// paired payload file, so an entry's offset is the sum of the sizes listed before it.
class Catalog {
public:
  Catalog() = default;

  // Parse catalog text
  // payloadSize is the size of the paired payload file; entries must fit inside it
  // Returns std::nullopt on failure (ErrorCode::MalformedIndex)
  static std::optional<Catalog> parse(std::string_view text, uint64_t payloadSize, int rank,
                                      Error *outError = nullptr,
                                      std::string_view sourceName = "<memory>");

  // Read and parse a catalog file from disk
  static std::optional<Catalog> open(const std::filesystem::path &path, uint64_t payloadSize,
                                     int rank, Error *outError = nullptr);

  // Get list of all entries, in table order
  const std::vector<IndexEntry> &entries() const { return entries_; }

  // Get total number of entries
  size_t entryCount() const { return entries_.size(); }

  // Case-insensitive entry lookup
  // Returns nullptr if the path is not in this catalog
  const IndexEntry *findEntry(std::string_view path) const;

  // Slot of an already normalized lookup path in entries()
  std::optional<size_t> findSlot(const std::string &lookupPath) const;

  // Number of payload bytes covered by the entries
  uint64_t extent() const { return extent_; }

  int rank() const { return rank_; }

private:
  std::vector<IndexEntry> entries_;
  std::unordered_map<std::string, size_t> lookup_; // lowercase path -> index
  uint64_t extent_ = 0;
  int rank_ = 0;
};

} // namespace catx
