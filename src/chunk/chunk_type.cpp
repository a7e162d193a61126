#include "chunk/chunk_type.hpp"

#include "util/utf8.hpp"

#include <ostream>

namespace pngme {

namespace {
constexpr uint8_t kPropertyBit = 0x20;

static bool property_bit_set(uint8_t b) {
    return (b & kPropertyBit) != 0;
}

static bool is_ascii_alpha(char32_t c) {
    return (c >= U'A' && c <= U'Z') || (c >= U'a' && c <= U'z');
}
} // namespace

ChunkTypeError::ChunkTypeError(Kind kind, const std::string& what, size_t length, char32_t character)
    : std::runtime_error(what), kind_(kind), length_(length), character_(character) {}

ChunkTypeError ChunkTypeError::invalid_length(size_t length) {
    return ChunkTypeError(Kind::InvalidLength,
                          "chunk_type: invalid length `" + std::to_string(length) + "`, expected length `4`",
                          length, 0);
}

ChunkTypeError ChunkTypeError::invalid_utf8() {
    return ChunkTypeError(Kind::InvalidUtf8, "chunk_type: not valid utf8", 0, 0);
}

ChunkTypeError ChunkTypeError::invalid_character(char32_t c) {
    std::string rendered;
    append_utf8(rendered, c);
    return ChunkTypeError(Kind::InvalidCharacter,
                          "chunk_type: invalid character `" + rendered +
                              "`, only upper and lower case alphabets allowed",
                          0, c);
}

void ChunkType::validate(const uint8_t* data, size_t n) {
    if (n != kChunkTypeBytes) throw ChunkTypeError::invalid_length(n);

    // Decode first so a multi-byte letter-like character is reported whole.
    std::u32string text;
    if (!decode_utf8(data, n, text)) throw ChunkTypeError::invalid_utf8();
    for (char32_t c : text) {
        if (!is_ascii_alpha(c)) throw ChunkTypeError::invalid_character(c);
    }
}

ChunkType ChunkType::from_bytes(const Bytes& bytes) {
    validate(bytes.data(), bytes.size());
    return ChunkType(bytes);
}

ChunkType ChunkType::from_string(const std::string& text) {
    const uint8_t* p = reinterpret_cast<const uint8_t*>(text.data());
    validate(p, text.size());
    return ChunkType(Bytes{p[0], p[1], p[2], p[3]});
}

bool ChunkType::is_critical() const {
    return !property_bit_set(bytes_[0]);
}

bool ChunkType::is_public() const {
    return !property_bit_set(bytes_[1]);
}

bool ChunkType::is_reserved_bit_valid() const {
    return !property_bit_set(bytes_[2]);
}

bool ChunkType::is_safe_to_copy() const {
    return property_bit_set(bytes_[3]);
}

std::string ChunkType::to_string() const {
    return std::string(reinterpret_cast<const char*>(bytes_.data()), bytes_.size());
}

std::ostream& operator<<(std::ostream& os, const ChunkType& type) {
    return os << type.to_string();
}

} // namespace pngme
