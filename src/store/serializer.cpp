#include "docsync/store/serializer.hpp"

#include <cstring>

// Cross-platform network byte order conversion
#ifdef _WIN32
    #include <winsock2.h>
    #pragma comment(lib, "ws2_32.lib")
#else
    #include <arpa/inet.h>
#endif

namespace docsync::store {
namespace {

// Host <-> network order for 64-bit values; its own inverse.
std::uint64_t swap_uint64(std::uint64_t value) {
    if (htonl(1) == 1) {
        return value;
    }
    const std::uint32_t high = htonl(static_cast<std::uint32_t>(value >> 32));
    const std::uint32_t low = htonl(static_cast<std::uint32_t>(value & 0xFFFFFFFFULL));
    return (static_cast<std::uint64_t>(low) << 32) | high;
}

} // namespace

// ──────────────────────────────────────────────────────────
// BinaryWriter
// ──────────────────────────────────────────────────────────

void BinaryWriter::write_uint8(std::uint8_t value) {
    buffer_.push_back(value);
}

void BinaryWriter::write_uint32(std::uint32_t value) {
    const std::uint32_t network_value = htonl(value);
    const auto* bytes = reinterpret_cast<const std::uint8_t*>(&network_value);
    buffer_.insert(buffer_.end(), bytes, bytes + 4);
}

void BinaryWriter::write_uint64(std::uint64_t value) {
    const std::uint64_t network_value = swap_uint64(value);
    const auto* bytes = reinterpret_cast<const std::uint8_t*>(&network_value);
    buffer_.insert(buffer_.end(), bytes, bytes + 8);
}

void BinaryWriter::write_int64(std::int64_t value) {
    write_uint64(static_cast<std::uint64_t>(value));
}

void BinaryWriter::write_string(const std::string& value) {
    write_uint32(static_cast<std::uint32_t>(value.size()));
    buffer_.insert(buffer_.end(), value.begin(), value.end());
}

void BinaryWriter::write_blob(const Bytes& value) {
    write_uint32(static_cast<std::uint32_t>(value.size()));
    buffer_.insert(buffer_.end(), value.begin(), value.end());
}

// ──────────────────────────────────────────────────────────
// BinaryReader
// ──────────────────────────────────────────────────────────

Result<std::uint8_t> BinaryReader::read_uint8() {
    if (remaining() < 1) {
        return Err<std::uint8_t>(ErrorCode::DecodeFailed, "Buffer underflow reading uint8");
    }
    return Ok(buffer_[cursor_++]);
}

Result<std::uint32_t> BinaryReader::read_uint32() {
    if (remaining() < 4) {
        return Err<std::uint32_t>(ErrorCode::DecodeFailed, "Buffer underflow reading uint32");
    }
    std::uint32_t network_value = 0;
    std::memcpy(&network_value, &buffer_[cursor_], 4);
    cursor_ += 4;
    return Ok(static_cast<std::uint32_t>(ntohl(network_value)));
}

Result<std::uint64_t> BinaryReader::read_uint64() {
    if (remaining() < 8) {
        return Err<std::uint64_t>(ErrorCode::DecodeFailed, "Buffer underflow reading uint64");
    }
    std::uint64_t network_value = 0;
    std::memcpy(&network_value, &buffer_[cursor_], 8);
    cursor_ += 8;
    return Ok(swap_uint64(network_value));
}

Result<std::int64_t> BinaryReader::read_int64() {
    auto result = read_uint64();
    if (result.is_error()) {
        return Err<std::int64_t>(result.error());
    }
    return Ok(static_cast<std::int64_t>(result.value()));
}

Result<std::uint32_t> BinaryReader::read_length() {
    auto length = read_uint32();
    if (length.is_error()) {
        return length;
    }
    if (length.value() > remaining()) {
        return Err<std::uint32_t>(ErrorCode::DecodeFailed, "Buffer underflow reading string");
    }
    return length;
}

Result<std::string> BinaryReader::read_string() {
    auto length = read_length();
    if (length.is_error()) {
        return Err<std::string>(length.error());
    }
    const auto begin = buffer_.begin() + static_cast<std::ptrdiff_t>(cursor_);
    std::string value(begin, begin + length.value());
    cursor_ += length.value();
    return Ok(std::move(value));
}

Result<Bytes> BinaryReader::read_blob() {
    auto length = read_length();
    if (length.is_error()) {
        return Err<Bytes>(length.error());
    }
    const auto begin = buffer_.begin() + static_cast<std::ptrdiff_t>(cursor_);
    Bytes value(begin, begin + length.value());
    cursor_ += length.value();
    return Ok(std::move(value));
}

} // namespace docsync::store
