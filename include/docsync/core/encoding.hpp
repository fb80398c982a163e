#pragma once

#include "docsync/core/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace docsync {

using Bytes = std::vector<std::uint8_t>;

/// 64-bit FNV-1a over the bytes, rendered as 16 lowercase hex characters.
std::string fnv1a_hex(const Bytes& data);

std::string hex_encode(const Bytes& data);
Result<Bytes> hex_decode(const std::string& hex);

/// Strict UTF-8 check (rejects overlongs, surrogates and code points above U+10FFFF).
bool is_valid_utf8(const Bytes& data);

/// Random RFC 4122 version 4 identifier in canonical 8-4-4-4-12 form.
std::string make_uuid_v4();

inline Bytes to_bytes(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

inline std::string to_text(const Bytes& data) {
    return std::string(data.begin(), data.end());
}

} // namespace docsync
