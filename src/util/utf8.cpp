#include "util/utf8.hpp"

namespace pngme {
namespace {

constexpr char32_t kReplacementChar = 0xFFFD;

// Scan one sequence at p. On success returns its length and sets cp.
// On failure returns 0 and sets bad to the length of the maximal ill-formed subpart (>= 1).
static size_t scan_sequence(const uint8_t* p, size_t n, char32_t& cp, size_t& bad) {
    const uint8_t b0 = p[0];
    if (b0 < 0x80) {
        cp = b0;
        return 1;
    }

    size_t need = 0;          // continuation bytes
    uint8_t lo = 0x80, hi = 0xBF; // allowed range of the first continuation byte
    if (b0 >= 0xC2 && b0 <= 0xDF) {
        need = 1;
        cp = b0 & 0x1F;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
        need = 2;
        cp = b0 & 0x0F;
        if (b0 == 0xE0) lo = 0xA0;
        if (b0 == 0xED) hi = 0x9F;
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
        need = 3;
        cp = b0 & 0x07;
        if (b0 == 0xF0) lo = 0x90;
        if (b0 == 0xF4) hi = 0x8F;
    } else {
        bad = 1;
        return 0;
    }

    for (size_t i = 1; i <= need; ++i) {
        if (i >= n) {
            bad = i;
            return 0;
        }
        const uint8_t b = p[i];
        const uint8_t min = (i == 1) ? lo : 0x80;
        const uint8_t max = (i == 1) ? hi : 0xBF;
        if (b < min || b > max) {
            bad = i;
            return 0;
        }
        cp = (cp << 6) | (b & 0x3F);
    }
    return need + 1;
}

} // namespace

bool decode_utf8(const uint8_t* data, size_t n, std::u32string& out) {
    size_t i = 0;
    while (i < n) {
        char32_t cp = 0;
        size_t bad = 0;
        const size_t len = scan_sequence(data + i, n - i, cp, bad);
        if (len == 0) return false;
        out.push_back(cp);
        i += len;
    }
    return true;
}

std::string utf8_lossy(const uint8_t* data, size_t n) {
    std::string out;
    out.reserve(n);
    size_t i = 0;
    while (i < n) {
        char32_t cp = 0;
        size_t bad = 0;
        const size_t len = scan_sequence(data + i, n - i, cp, bad);
        if (len == 0) {
            append_utf8(out, kReplacementChar);
            i += bad;
            continue;
        }
        out.append(reinterpret_cast<const char*>(data + i), len);
        i += len;
    }
    return out;
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

} // namespace pngme
