#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace catx {

// MD5 digest of data as 32 lowercase hex digits
// Returns std::nullopt if the digest backend fails
std::optional<std::string> md5Hex(std::span<const uint8_t> data);

// True if text is exactly 32 hex digits
bool isMd5Hex(std::string_view text);

} // namespace catx
