#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace fence {

// URL-safe alphabet without padding, so tokens can sit in a query string.
std::string base64UrlEncode(const std::uint8_t* data, std::size_t len);

// Accepts both the URL-safe and the standard alphabet, padded or not.
bool base64Decode(const std::string& text, std::vector<std::uint8_t>& out);

} // namespace fence
