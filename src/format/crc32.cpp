#include "format/crc32.hpp"

#include <zlib.h>

#include <algorithm>
#include <limits>

namespace pngme {

Crc32::Crc32() : crc_(static_cast<uint32_t>(::crc32(0L, Z_NULL, 0))) {}

void Crc32::update(const uint8_t* data, size_t n) {
    // zlib takes uInt lengths; feed large buffers in slices
    constexpr size_t kMaxSlice = std::numeric_limits<uInt>::max();
    uLong c = crc_;
    while (n > 0) {
        const size_t slice = std::min(n, kMaxSlice);
        c = ::crc32(c, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(slice));
        data += slice;
        n -= slice;
    }
    crc_ = static_cast<uint32_t>(c);
}

} // namespace pngme
