#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "chunk/chunk.hpp"
#include "format/png_format.hpp"

namespace pngme {

class PngError : public std::runtime_error {
public:
    enum class Kind : uint8_t {
        InvalidSignature,
        InvalidChunk, // chunk_error() holds the cause, offset() where that chunk starts
    };

    static PngError invalid_signature();
    static PngError invalid_chunk(const ChunkError& cause, size_t offset);

    Kind kind() const { return kind_; }
    size_t offset() const { return offset_; }
    const std::optional<ChunkError>& chunk_error() const { return chunk_error_; }

private:
    PngError(Kind kind, const std::string& what);

    Kind kind_;
    size_t offset_ = 0;
    std::optional<ChunkError> chunk_error_;
};

// Signature followed by an ordered list of chunks. Order is insertion/parse order;
// lookups return the first match.
class Png {
public:
    static constexpr std::array<uint8_t, kPngSignatureBytes> STANDARD_HEADER = kPngSignature;

    Png() = default;
    explicit Png(std::vector<Chunk> chunks) : chunks_(std::move(chunks)) {}
    static Png from_chunks(std::vector<Chunk> chunks);

    // Throws PngError. Either the whole buffer parses or nothing is returned.
    static Png from_bytes(const uint8_t* bytes, size_t size);
    static Png from_bytes(const std::vector<uint8_t>& bytes);

    // Appends at the very end, after IEND if one is present.
    void append_chunk(Chunk chunk);

    // First chunk whose type renders as chunk_type, or nullptr.
    // The pointer is invalidated by append_chunk/remove_chunk.
    const Chunk* chunk_by_type(const std::string& chunk_type) const;

    // Removes and returns the first chunk whose type renders as chunk_type.
    // Leaves the container untouched when nothing matches.
    std::optional<Chunk> remove_chunk(const std::string& chunk_type);

    const std::array<uint8_t, kPngSignatureBytes>& header() const { return STANDARD_HEADER; }
    const std::vector<Chunk>& chunks() const { return chunks_; }

    std::vector<uint8_t> as_bytes() const;

    std::string to_string() const;

private:
    std::vector<Chunk>::const_iterator find_chunk(const std::string& chunk_type) const;

    std::vector<Chunk> chunks_;
};

std::ostream& operator<<(std::ostream& os, const Png& png);

// Whole-buffer helpers used by the file layer.
Png parse_png(const std::vector<uint8_t>& bytes);
std::vector<uint8_t> serialize_png(const Png& png);

} // namespace pngme
