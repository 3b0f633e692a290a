#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace aim {

/// Standard (RFC 4648) base64 with '=' padding.
std::string base64Encode(const std::vector<uint8_t>& bytes);

/// Decode standard base64. Whitespace is skipped.
/// Throws std::invalid_argument on malformed input.
std::vector<uint8_t> base64Decode(const std::string& text);

} // namespace aim
