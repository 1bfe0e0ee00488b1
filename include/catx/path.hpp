#pragma once

#include <string>
#include <string_view>

namespace catx {

// Normalize slashes only (backslashes to forward slashes, empty segments dropped),
// preserving case
std::string normalizeSlashes(std::string_view path);

// Normalize path to lowercase with forward slashes for lookup
std::string normalizePath(std::string_view path);

// Directory part of a normalized path ("a/b/c.xml" -> "a/b", "c.xml" -> "")
std::string_view parentDirectory(std::string_view path);

// File name part of a normalized path ("a/b/c.xml" -> "c.xml")
std::string_view fileName(std::string_view path);

// Match a single path segment against a pattern with '*' and '?' wildcards
bool matchGlob(std::string_view pattern, std::string_view name);

} // namespace catx
