#include "fence/persistence/base64.h"

#include <openssl/evp.h>

namespace fence {

std::string base64UrlEncode(const std::uint8_t* data, std::size_t len) {
    if (len == 0) return std::string();
    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data, static_cast<int>(len));
    out.resize(written > 0 ? static_cast<std::size_t>(written) : 0);

    while (!out.empty() && out.back() == '=') out.pop_back();
    for (char& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return out;
}

bool base64Decode(const std::string& text, std::vector<std::uint8_t>& out) {
    out.clear();
    std::string normalized;
    normalized.reserve(text.size() + 3);
    for (char c : text) {
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
        else if (c == ' ' || c == '\n' || c == '\r' || c == '\t') return false;
        normalized.push_back(c);
    }

    std::size_t padding = 0;
    while (!normalized.empty() && normalized.back() == '=') {
        normalized.pop_back();
        padding++;
    }
    if (padding > 2 || normalized.empty()) return false;
    if (normalized.size() % 4 == 1) return false;

    padding = (4 - normalized.size() % 4) % 4;
    normalized.append(padding, '=');

    std::vector<std::uint8_t> decoded(normalized.size() / 4 * 3);
    const int n = EVP_DecodeBlock(decoded.data(),
        reinterpret_cast<const unsigned char*>(normalized.data()), static_cast<int>(normalized.size()));
    if (n < 0) return false;

    // EVP_DecodeBlock counts the bytes of the padded quantum as well.
    const std::size_t size = static_cast<std::size_t>(n);
    if (size < padding) return false;
    decoded.resize(size - padding);
    out = std::move(decoded);
    return true;
}

} // namespace fence
