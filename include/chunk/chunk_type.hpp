#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <stdexcept>
#include <string>

#include "format/png_format.hpp"

namespace pngme {

class ChunkTypeError : public std::runtime_error {
public:
    enum class Kind : uint8_t {
        InvalidLength,    // length() holds the rejected byte count
        InvalidUtf8,
        InvalidCharacter, // character() holds the offending code point
    };

    static ChunkTypeError invalid_length(size_t length);
    static ChunkTypeError invalid_utf8();
    static ChunkTypeError invalid_character(char32_t c);

    Kind kind() const { return kind_; }
    size_t length() const { return length_; }
    char32_t character() const { return character_; }

private:
    ChunkTypeError(Kind kind, const std::string& what, size_t length, char32_t character);

    Kind kind_;
    size_t length_;
    char32_t character_;
};

// 4-byte chunk type code. Every instance holds four ASCII letters; the only
// ways to build one are the validating factories below.
//
// Property bits (bit 5, 0x20, of each byte):
//   byte 0: clear = critical,            set = ancillary
//   byte 1: clear = public,              set = private
//   byte 2: clear = reserved bit valid,  set = reserved bit violated
//   byte 3: set   = safe to copy,        clear = unsafe to copy
class ChunkType {
public:
    using Bytes = std::array<uint8_t, kChunkTypeBytes>;

    // Throws ChunkTypeError.
    static ChunkType from_bytes(const Bytes& bytes);
    static ChunkType from_string(const std::string& text);

    const Bytes& bytes() const { return bytes_; }

    bool is_critical() const;
    bool is_public() const;
    bool is_reserved_bit_valid() const;
    bool is_safe_to_copy() const;
    // Only the reserved bit decides validity; the other flags are informational.
    bool is_valid() const { return is_reserved_bit_valid(); }

    std::string to_string() const;

    bool operator==(const ChunkType& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const ChunkType& other) const { return bytes_ != other.bytes_; }

private:
    explicit ChunkType(const Bytes& bytes) : bytes_(bytes) {}
    static void validate(const uint8_t* data, size_t n);

    Bytes bytes_;
};

std::ostream& operator<<(std::ostream& os, const ChunkType& type);

} // namespace pngme
