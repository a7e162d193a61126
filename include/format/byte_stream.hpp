#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <utility>
#include <vector>

namespace pngme {

class ByteWriter {
public:
    void reserve(size_t n) { buf_.reserve(n); }
    void write_u32_be(uint32_t v) {
        buf_.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
        buf_.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
        buf_.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
        buf_.push_back(static_cast<uint8_t>(v & 0xFF));
    }
    void write_bytes(const void* p, size_t n) {
        const uint8_t* b = static_cast<const uint8_t*>(p);
        buf_.insert(buf_.end(), b, b + n);
    }
    std::vector<uint8_t> take() { return std::move(buf_); }
private:
    std::vector<uint8_t> buf_;
};

// Non-owning cursor over a byte range. The range must outlive the reader.
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}
    explicit ByteReader(const std::vector<uint8_t>& data) : ByteReader(data.data(), data.size()) {}

    uint32_t read_u32_be() {
        need(4);
        const uint8_t* b = data_ + pos_;
        pos_ += 4;
        return (static_cast<uint32_t>(b[0]) << 24) |
               (static_cast<uint32_t>(b[1]) << 16) |
               (static_cast<uint32_t>(b[2]) << 8) |
               static_cast<uint32_t>(b[3]);
    }
    void read_bytes(void* out, size_t n) {
        need(n);
        if (n != 0) std::memcpy(out, data_ + pos_, n);
        pos_ += n;
    }
    std::vector<uint8_t> read_vector(size_t n) {
        need(n);
        std::vector<uint8_t> v(data_ + pos_, data_ + pos_ + n);
        pos_ += n;
        return v;
    }
    // Pointer to the unread bytes, valid for remaining() bytes.
    const uint8_t* cursor() const { return data_ + pos_; }
    void skip(size_t n) {
        need(n);
        pos_ += n;
    }
    bool eof() const { return pos_ >= size_; }
    size_t position() const { return pos_; }
    size_t remaining() const { return size_ - pos_; }
private:
    void need(size_t n) const {
        if (n > remaining()) throw std::runtime_error("byte_stream: premature EOF");
    }
    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
};

} // namespace pngme
