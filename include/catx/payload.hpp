#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>

#include "types.hpp"

namespace catx {

// Read-only memory map of one layer payload (NN.dat)
//
// Entries are read as slices at catalog offsets; pages are faulted in only when a slice is
// touched. A zero-length payload is valid and maps nothing.
class PayloadMap {
public:
  PayloadMap() = default;
  ~PayloadMap();

  PayloadMap(const PayloadMap &) = delete;
  PayloadMap &operator=(const PayloadMap &) = delete;
  PayloadMap(PayloadMap &&other) noexcept;
  PayloadMap &operator=(PayloadMap &&other) noexcept;

  // Map path for reading
  // Returns std::nullopt on failure (IoError)
  static std::optional<PayloadMap> open(const std::filesystem::path &path,
                                        Error *outError = nullptr);

  // Bytes [offset, offset + size) of the payload
  // Returns std::nullopt if the range runs past the end (CorruptPayload)
  std::optional<std::span<const uint8_t>> slice(uint64_t offset, uint64_t size,
                                                Error *outError = nullptr) const;

  std::span<const uint8_t> bytes() const { return {data_, size_}; }
  uint64_t size() const { return size_; }
  const std::filesystem::path &path() const { return path_; }

private:
  void release() noexcept;

  std::filesystem::path path_;
  const uint8_t *data_ = nullptr;
  size_t size_ = 0;
#ifdef _WIN32
  void *file_ = nullptr;
  void *mapping_ = nullptr;
#endif
};

} // namespace catx
