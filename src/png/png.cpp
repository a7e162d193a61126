#include "png/png.hpp"

#include "format/byte_stream.hpp"

#include <algorithm>
#include <cstring>
#include <iterator>
#include <ostream>
#include <sstream>
#include <utility>

namespace pngme {

PngError::PngError(Kind kind, const std::string& what)
    : std::runtime_error(what), kind_(kind) {}

PngError PngError::invalid_signature() {
    return PngError(Kind::InvalidSignature, "png: invalid signature");
}

PngError PngError::invalid_chunk(const ChunkError& cause, size_t offset) {
    PngError e(Kind::InvalidChunk,
               "png: invalid chunk at offset " + std::to_string(offset) + " (" + cause.what() + ")");
    e.offset_ = offset;
    e.chunk_error_ = cause;
    return e;
}

Png Png::from_chunks(std::vector<Chunk> chunks) {
    return Png(std::move(chunks));
}

Png Png::from_bytes(const uint8_t* bytes, size_t size) {
    if (size < kPngSignatureBytes ||
        std::memcmp(bytes, kPngSignature.data(), kPngSignatureBytes) != 0) {
        throw PngError::invalid_signature();
    }

    ByteReader r(bytes, size);
    r.skip(kPngSignatureBytes);

    std::vector<Chunk> chunks;
    while (!r.eof()) {
        const size_t offset = r.position();
        // Each chunk declares its own length; hand Chunk::from_bytes exactly that
        // span, or whatever is left when the input is truncated.
        size_t span = r.remaining();
        if (span >= kChunkLengthBytes) {
            ByteReader peek(r.cursor(), kChunkLengthBytes);
            const uint64_t declared = static_cast<uint64_t>(peek.read_u32_be()) + kChunkOverheadBytes;
            if (declared < span) span = static_cast<size_t>(declared);
        }
        try {
            chunks.push_back(Chunk::from_bytes(r.cursor(), span));
        } catch (const ChunkError& e) {
            throw PngError::invalid_chunk(e, offset);
        }
        r.skip(span);
    }
    return Png(std::move(chunks));
}

Png Png::from_bytes(const std::vector<uint8_t>& bytes) {
    return from_bytes(bytes.data(), bytes.size());
}

void Png::append_chunk(Chunk chunk) {
    chunks_.push_back(std::move(chunk));
}

std::vector<Chunk>::const_iterator Png::find_chunk(const std::string& chunk_type) const {
    if (chunk_type.size() != kChunkTypeBytes) return chunks_.end();
    return std::find_if(chunks_.begin(), chunks_.end(), [&](const Chunk& c) {
        const ChunkType::Bytes& b = c.chunk_type().bytes();
        return std::equal(b.begin(), b.end(), chunk_type.begin(),
                          [](uint8_t x, char y) { return x == static_cast<uint8_t>(y); });
    });
}

const Chunk* Png::chunk_by_type(const std::string& chunk_type) const {
    auto it = find_chunk(chunk_type);
    if (it == chunks_.end()) return nullptr;
    return &*it;
}

std::optional<Chunk> Png::remove_chunk(const std::string& chunk_type) {
    auto it = find_chunk(chunk_type);
    if (it == chunks_.end()) return std::nullopt;
    // const_iterator -> iterator without a second search
    auto pos = chunks_.begin() + std::distance(chunks_.cbegin(), it);
    Chunk removed = std::move(*pos);
    chunks_.erase(pos);
    return removed;
}

std::vector<uint8_t> Png::as_bytes() const {
    size_t total = kPngSignatureBytes;
    for (const auto& c : chunks_) total += kChunkOverheadBytes + c.data().size();

    ByteWriter w;
    w.reserve(total);
    w.write_bytes(STANDARD_HEADER.data(), STANDARD_HEADER.size());
    for (const auto& c : chunks_) c.write_to(w);
    return w.take();
}

std::string Png::to_string() const {
    std::ostringstream os;
    os << "Png {\n"
       << "  chunks: " << chunks_.size() << "\n";
    for (const auto& c : chunks_) {
        os << "  " << c.chunk_type() << " (" << c.length() << " bytes, crc " << c.crc() << ")\n";
    }
    os << "}\n";
    return os.str();
}

std::ostream& operator<<(std::ostream& os, const Png& png) {
    return os << png.to_string();
}

Png parse_png(const std::vector<uint8_t>& bytes) {
    return Png::from_bytes(bytes);
}

std::vector<uint8_t> serialize_png(const Png& png) {
    return png.as_bytes();
}

} // namespace pngme
