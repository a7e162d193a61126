#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "chunk/chunk_type.hpp"

namespace pngme {

class ByteWriter;

class ChunkError : public std::runtime_error {
public:
    enum class Kind : uint8_t {
        TooShort,         // input ended before length/type/data/crc was complete
        InvalidChunkType, // type_error() holds the cause
        InvalidCrc,       // expected_crc() = stored, actual_crc() = recomputed
        TooLong,          // bytes left after the declared chunk end
    };

    static ChunkError too_short();
    static ChunkError invalid_chunk_type(const ChunkTypeError& cause);
    static ChunkError invalid_crc(uint32_t expected, uint32_t actual);
    static ChunkError too_long();

    Kind kind() const { return kind_; }
    uint32_t expected_crc() const { return expected_crc_; }
    uint32_t actual_crc() const { return actual_crc_; }
    const std::optional<ChunkTypeError>& type_error() const { return type_error_; }

private:
    ChunkError(Kind kind, const std::string& what);

    Kind kind_;
    uint32_t expected_crc_ = 0;
    uint32_t actual_crc_ = 0;
    std::optional<ChunkTypeError> type_error_;
};

// Length-prefixed, CRC-protected record. Immutable: length and crc are derived
// from chunk_type and data at construction and cannot drift from them.
class Chunk {
public:
    // Throws std::length_error if data does not fit a 32-bit length.
    Chunk(ChunkType chunk_type, std::vector<uint8_t> data);

    // Parse exactly one serialized chunk; trailing bytes are an error (TooLong).
    // Throws ChunkError.
    static Chunk from_bytes(const uint8_t* bytes, size_t size);
    static Chunk from_bytes(const std::vector<uint8_t>& bytes);

    uint32_t length() const { return length_; }
    const ChunkType& chunk_type() const { return chunk_type_; }
    const std::vector<uint8_t>& data() const { return data_; }
    uint32_t crc() const { return crc_; }

    // Data as UTF-8 text, ill-formed sequences replaced with U+FFFD.
    std::string data_as_string() const;

    // [length BE][type][data][crc BE], kChunkOverheadBytes + length() bytes.
    std::vector<uint8_t> as_bytes() const;
    void write_to(ByteWriter& w) const;

    // Multi-line diagnostic dump, not meant to be parsed back.
    std::string to_string() const;

    bool operator==(const Chunk& other) const;
    bool operator!=(const Chunk& other) const { return !(*this == other); }

private:
    Chunk(uint32_t length, ChunkType chunk_type, std::vector<uint8_t> data, uint32_t crc);

    static uint32_t calculate_crc(const ChunkType& chunk_type, const uint8_t* data, size_t n);

    uint32_t length_;
    ChunkType chunk_type_;
    std::vector<uint8_t> data_;
    uint32_t crc_;
};

std::ostream& operator<<(std::ostream& os, const Chunk& chunk);

} // namespace pngme
