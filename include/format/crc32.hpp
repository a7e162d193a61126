#pragma once

#include <cstddef>
#include <cstdint>

namespace pngme {

// Incremental CRC-32/ISO-HDLC, the checksum PNG stores per chunk (zlib crc32).
class Crc32 {
public:
    Crc32();
    void update(const uint8_t* data, size_t n);
    uint32_t value() const { return crc_; }
private:
    uint32_t crc_;
};

} // namespace pngme
