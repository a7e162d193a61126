#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace pngme {

// .png file layout:
// [Signature][Chunk][Chunk]...
//
// Chunk layout (all integers big-endian):
// [length u32][type 4 bytes][data: length bytes][crc u32]
// crc = CRC-32/ISO-HDLC over type ++ data.
//
// As with any on-disk layout, never dump structs; serialize field-by-field.
inline constexpr size_t kPngSignatureBytes = 8;
inline constexpr std::array<uint8_t, kPngSignatureBytes> kPngSignature = {
    0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A,
};

inline constexpr size_t kChunkLengthBytes = 4;
inline constexpr size_t kChunkTypeBytes = 4;
inline constexpr size_t kChunkCrcBytes = 4;
// length + type + crc, i.e. serialized size of a chunk with empty data
inline constexpr size_t kChunkOverheadBytes = kChunkLengthBytes + kChunkTypeBytes + kChunkCrcBytes;

} // namespace pngme
