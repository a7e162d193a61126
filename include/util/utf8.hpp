#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace pngme {

// Strict UTF-8 decode. Returns false (out is left partially filled) on the first
// ill-formed sequence: overlongs, surrogates and code points above U+10FFFF included.
bool decode_utf8(const uint8_t* data, size_t n, std::u32string& out);

// Lossy UTF-8: each maximal ill-formed subpart becomes U+FFFD.
std::string utf8_lossy(const uint8_t* data, size_t n);

// Append the UTF-8 encoding of a scalar value.
void append_utf8(std::string& out, char32_t cp);

} // namespace pngme
