#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace Common {

/// Lowercase hex SHA-256 of data (64 chars); empty string if the digest fails
[[nodiscard]] auto sha256Hex(std::string_view data) -> std::string;

/// Lowercase hex encoding of raw bytes
[[nodiscard]] auto toHex(const unsigned char* bytes, size_t len) -> std::string;

} // namespace Common
