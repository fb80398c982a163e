#include "docsync/core/encoding.hpp"

#include <array>
#include <iomanip>
#include <random>
#include <sstream>

namespace docsync {
namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // namespace

std::string fnv1a_hex(const Bytes& data) {
    const std::uint64_t offset = 0xcbf29ce484222325ULL;
    const std::uint64_t prime  = 0x100000001b3ULL;
    std::uint64_t hash = offset;
    for (auto byte : data) {
        hash ^= static_cast<std::uint64_t>(byte);
        hash *= prime;
    }
    std::ostringstream oss;
    oss << std::hex << std::setw(sizeof(hash) * 2) << std::setfill('0') << hash;
    return oss.str();
}

std::string hex_encode(const Bytes& data) {
    std::ostringstream oss;
    for (auto byte : data) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return oss.str();
}

Result<Bytes> hex_decode(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return Err<Bytes>(ErrorCode::DecodeFailed, "Hex string must have even length");
    }
    Bytes bytes;
    bytes.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        const int high = hex_value(hex[i]);
        const int low = hex_value(hex[i + 1]);
        if (high < 0 || low < 0) {
            return Err<Bytes>(ErrorCode::DecodeFailed, "Invalid hex digit at offset " + std::to_string(i));
        }
        bytes.push_back(static_cast<std::uint8_t>((high << 4) | low));
    }
    return Ok(std::move(bytes));
}

bool is_valid_utf8(const Bytes& data) {
    std::size_t i = 0;
    const std::size_t n = data.size();
    while (i < n) {
        const std::uint8_t lead = data[i];
        if (lead < 0x80) {
            ++i;
            continue;
        }

        std::size_t length = 0;
        std::uint32_t code_point = 0;
        if ((lead & 0xE0) == 0xC0) {
            length = 2;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            code_point = lead & 0x07;
        } else {
            return false;
        }

        if (i + length > n) {
            return false;
        }
        for (std::size_t k = 1; k < length; ++k) {
            const std::uint8_t cont = data[i + k];
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (cont & 0x3F);
        }

        // Overlong encodings
        static constexpr std::array<std::uint32_t, 5> kMinimum{0, 0, 0x80, 0x800, 0x10000};
        if (code_point < kMinimum[length]) {
            return false;
        }
        if (code_point > 0x10FFFF || (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }
        i += length;
    }
    return true;
}

std::string make_uuid_v4() {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 255);

    std::array<std::uint8_t, 16> raw{};
    for (auto& byte : raw) {
        byte = static_cast<std::uint8_t>(dist(engine));
    }
    raw[6] = static_cast<std::uint8_t>((raw[6] & 0x0F) | 0x40);
    raw[8] = static_cast<std::uint8_t>((raw[8] & 0x3F) | 0x80);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < raw.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(raw[i]);
    }
    return oss.str();
}

} // namespace docsync
