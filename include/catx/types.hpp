#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace catx {

// Failure and diagnostic categories
enum class ErrorCode {
  None,
  NoLayersFound,       // Rank 1 of the archive set is missing
  MalformedIndex,      // Catalog table truncated or inconsistent
  CorruptPayload,      // Payload bytes fail the catalog checksum
  MalformedDefinition, // Definition document is not well-formed
  InheritanceCycle,    // "extends" chain loops back on itself
  UnresolvedReference, // Referenced macro or component does not exist (non-fatal)
  UnknownKind,         // Requested object kind is not supported (non-fatal)
  FileNotFound,
  IoError,
  InvalidValue,        // Raw value could not be coerced (non-fatal)
  ConnectionCycle,     // Connection graph loops back on itself (non-fatal)
  DuplicateDefinition, // Identifier defined by more than one document (non-fatal)
  UnsupportedFormat,
};

// Human readable name of an error code
std::string_view errorCodeName(ErrorCode code) noexcept;

// Error reported by fallible operations through their outError parameter
struct Error {
  ErrorCode code = ErrorCode::None;
  std::string message;

  explicit operator bool() const { return code != ErrorCode::None; }
};

// Non-fatal condition accumulated alongside successful output
struct Diagnostic {
  ErrorCode code = ErrorCode::None;
  std::string subject; // Macro id, path or kind the diagnostic is about
  std::string message;

  bool operator==(const Diagnostic &other) const = default;
};

// Fill outError if the caller asked for it
inline void setError(Error *outError, ErrorCode code, std::string message) {
  if (outError) {
    outError->code = code;
    outError->message = std::move(message);
  }
}

// File entry in a catalog (.cat) table
struct IndexEntry {
  std::string path;                    // Original case, normalized to forward slashes
  std::string lookupPath;              // For case-insensitive lookup
  uint64_t offset = 0;                 // Offset within the payload (.dat) file
  uint64_t size = 0;                   // File size in bytes
  uint64_t timestamp = 0;              // Modification time, seconds since epoch
  std::optional<std::string> checksum; // Lowercase MD5 hex digest, absent when not recorded
  int rank = 0;                        // Rank of the owning layer
};

// Position of the winning entry inside an overlay
struct FileHandle {
  size_t layer = 0; // Slot in Overlay::layers()
  size_t entry = 0; // Slot in the layer's catalog entries

  bool operator==(const FileHandle &other) const = default;
};

} // namespace catx
