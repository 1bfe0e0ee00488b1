#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "definition.hpp"
#include "types.hpp"

namespace catx {

// Parse one definition document (<macros>, <components> or <wares>) into unresolved nodes
// Cross-document references are not checked
// Returns std::nullopt on failure (MalformedDefinition)
std::optional<std::vector<DefinitionNode>> parseDefinitions(std::span<const uint8_t> data,
                                                            std::string_view sourcePath,
                                                            Error *outError = nullptr);

// Parse an index document (<index><entry name value/></index>) into
// identifier -> logical document path (".xml" appended, forward slashes)
std::optional<std::unordered_map<std::string, std::string>>
parseIndex(std::span<const uint8_t> data, std::string_view sourcePath, Error *outError = nullptr);

} // namespace catx
