#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "types.hpp"

namespace catx {

// Attribute value after coercion; raw passthrough values stay strings
using Value = std::variant<std::string, int64_t, double>;

// Attribute name -> value, ordered by name
using AttributeMap = std::map<std::string, Value>;

// Render a value the way exporters print it
std::string formatValue(const Value &value);

// Summary of a connected macro embedded in its container's record
struct SlotSummary {
  std::string kind;
  AttributeMap attributes;

  bool operator==(const SlotSummary &other) const = default;
};

// One resolved connection of a record
struct ConnectionSlot {
  std::string role;                  // Connection name on the owning macro
  std::string owner;                 // Macro declaring the connection
  std::string macro;                 // Connected macro identifier
  std::optional<SlotSummary> target; // Empty if the macro could not be resolved

  bool operator==(const ConnectionSlot &other) const = default;
};

// Flattened, exportable attribute set for one object
struct ResolvedRecord {
  std::string id;
  std::string kind;
  AttributeMap attributes;
  std::vector<ConnectionSlot> slots;
  std::vector<Diagnostic> diagnostics;

  // Lookup helpers; std::nullopt if absent or of another type
  const Value *find(const std::string &name) const;
  std::optional<double> number(const std::string &name) const;
  std::optional<std::string> text(const std::string &name) const;

  bool operator==(const ResolvedRecord &other) const = default;
};

// Output of resolving one object kind
struct ResolveResult {
  std::string kind;
  std::vector<ResolvedRecord> records; // Sorted by id
  std::vector<Diagnostic> diagnostics; // Kind-level and per-record diagnostics
};

} // namespace catx
