#pragma once

/**
 * @file serializer.hpp
 * @brief Length-prefixed binary encoding for entity payloads
 *
 * WHY THIS FILE EXISTS:
 * Entities travel through the content store as opaque bytes. Every payload
 * type encodes itself with the same primitives so the format stays uniform.
 *
 * FORMAT RULES:
 * - Integers are big-endian (network byte order)
 * - Strings and blobs: [length: 4 bytes] [bytes: N]
 * - Every payload starts with a one-byte format version
 *
 * EXAMPLE:
 * BinaryWriter out;
 * out.write_uint8(1);
 * out.write_string("folder-id");
 * auto bytes = out.take();
 *
 * BinaryReader in(bytes);
 * auto version = in.read_uint8();
 * auto id = in.read_string();
 */

#include "docsync/core/encoding.hpp"
#include "docsync/core/result.hpp"

#include <cstdint>
#include <string>

namespace docsync::store {

class BinaryWriter {
public:
    void write_uint8(std::uint8_t value);
    void write_uint32(std::uint32_t value);
    void write_uint64(std::uint64_t value);
    void write_int64(std::int64_t value);
    void write_string(const std::string& value);
    void write_blob(const Bytes& value);

    const Bytes& bytes() const noexcept { return buffer_; }
    Bytes take() { return std::move(buffer_); }

private:
    Bytes buffer_;
};

/**
 * @brief Cursor over a byte buffer
 *
 * Every read checks bounds and reports DecodeFailed on underflow. The
 * buffer must outlive the reader.
 */
class BinaryReader {
public:
    explicit BinaryReader(const Bytes& buffer) : buffer_(buffer) {}

    Result<std::uint8_t> read_uint8();
    Result<std::uint32_t> read_uint32();
    Result<std::uint64_t> read_uint64();
    Result<std::int64_t> read_int64();
    Result<std::string> read_string();
    Result<Bytes> read_blob();

    std::size_t remaining() const noexcept { return buffer_.size() - cursor_; }
    bool at_end() const noexcept { return cursor_ == buffer_.size(); }

private:
    Result<std::uint32_t> read_length();

    const Bytes& buffer_;
    std::size_t cursor_ = 0;
};

} // namespace docsync::store
