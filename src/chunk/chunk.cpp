#include "chunk/chunk.hpp"

#include "format/byte_stream.hpp"
#include "format/crc32.hpp"
#include "format/png_format.hpp"
#include "util/utf8.hpp"

#include <limits>
#include <ostream>
#include <sstream>
#include <utility>

namespace pngme {

ChunkError::ChunkError(Kind kind, const std::string& what)
    : std::runtime_error(what), kind_(kind) {}

ChunkError ChunkError::too_short() {
    return ChunkError(Kind::TooShort, "chunk: chunk too short");
}

ChunkError ChunkError::invalid_chunk_type(const ChunkTypeError& cause) {
    ChunkError e(Kind::InvalidChunkType, std::string("chunk: invalid chunk type (") + cause.what() + ")");
    e.type_error_ = cause;
    return e;
}

ChunkError ChunkError::invalid_crc(uint32_t expected, uint32_t actual) {
    ChunkError e(Kind::InvalidCrc,
                 "chunk: invalid crc value. expected `" + std::to_string(expected) +
                     "` but got `" + std::to_string(actual) + "`");
    e.expected_crc_ = expected;
    e.actual_crc_ = actual;
    return e;
}

ChunkError ChunkError::too_long() {
    return ChunkError(Kind::TooLong, "chunk: chunk too long");
}

Chunk::Chunk(ChunkType chunk_type, std::vector<uint8_t> data)
    : length_(0), chunk_type_(chunk_type), data_(std::move(data)), crc_(0) {
    if (data_.size() > std::numeric_limits<uint32_t>::max()) {
        throw std::length_error("chunk: data exceeds 32-bit length field");
    }
    length_ = static_cast<uint32_t>(data_.size());
    crc_ = calculate_crc(chunk_type_, data_.data(), data_.size());
}

Chunk::Chunk(uint32_t length, ChunkType chunk_type, std::vector<uint8_t> data, uint32_t crc)
    : length_(length), chunk_type_(chunk_type), data_(std::move(data)), crc_(crc) {}

uint32_t Chunk::calculate_crc(const ChunkType& chunk_type, const uint8_t* data, size_t n) {
    Crc32 crc;
    crc.update(chunk_type.bytes().data(), chunk_type.bytes().size());
    crc.update(data, n);
    return crc.value();
}

Chunk Chunk::from_bytes(const uint8_t* bytes, size_t size) {
    ByteReader r(bytes, size);

    if (r.remaining() < kChunkLengthBytes) throw ChunkError::too_short();
    const uint32_t length = r.read_u32_be();

    if (r.remaining() < kChunkTypeBytes) throw ChunkError::too_short();
    ChunkType::Bytes type_bytes{};
    r.read_bytes(type_bytes.data(), type_bytes.size());
    std::optional<ChunkType> chunk_type;
    try {
        chunk_type = ChunkType::from_bytes(type_bytes);
    } catch (const ChunkTypeError& e) {
        throw ChunkError::invalid_chunk_type(e);
    }

    if (r.remaining() < length) throw ChunkError::too_short();
    std::vector<uint8_t> data = r.read_vector(length);

    if (r.remaining() < kChunkCrcBytes) throw ChunkError::too_short();
    const uint32_t stored_crc = r.read_u32_be();

    const uint32_t computed_crc = calculate_crc(*chunk_type, data.data(), data.size());
    if (computed_crc != stored_crc) throw ChunkError::invalid_crc(stored_crc, computed_crc);

    if (!r.eof()) throw ChunkError::too_long();

    return Chunk(length, *chunk_type, std::move(data), stored_crc);
}

Chunk Chunk::from_bytes(const std::vector<uint8_t>& bytes) {
    return from_bytes(bytes.data(), bytes.size());
}

std::string Chunk::data_as_string() const {
    return utf8_lossy(data_.data(), data_.size());
}

void Chunk::write_to(ByteWriter& w) const {
    w.write_u32_be(length_);
    w.write_bytes(chunk_type_.bytes().data(), chunk_type_.bytes().size());
    w.write_bytes(data_.data(), data_.size());
    w.write_u32_be(crc_);
}

std::vector<uint8_t> Chunk::as_bytes() const {
    ByteWriter w;
    w.reserve(kChunkOverheadBytes + data_.size());
    write_to(w);
    return w.take();
}

std::string Chunk::to_string() const {
    std::ostringstream os;
    os << "Chunk {\n"
       << "  length: " << length_ << "\n"
       << "  chunk_type: " << chunk_type_ << "\n"
       << "  data: [";
    for (size_t i = 0; i < data_.size(); ++i) {
        if (i != 0) os << ", ";
        os << static_cast<unsigned>(data_[i]);
    }
    os << "]\n"
       << "  crc: " << crc_ << "\n"
       << "}\n";
    return os.str();
}

bool Chunk::operator==(const Chunk& other) const {
    return length_ == other.length_ && chunk_type_ == other.chunk_type_ &&
           crc_ == other.crc_ && data_ == other.data_;
}

std::ostream& operator<<(std::ostream& os, const Chunk& chunk) {
    return os << chunk.to_string();
}

} // namespace pngme
