#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "png/png.hpp"

namespace pngme {

// Raw file access. Throw std::runtime_error naming the path on failure.
std::vector<uint8_t> read_file_bytes(const std::string& path);
void write_file_bytes(const std::string& path, const std::vector<uint8_t>& bytes);

// Throws unless path names an existing regular file.
void validate_png_path(const std::string& path);

// validate + read + parse. Errors are prefixed with what failed
// ("failed to read png file: ...", "failed to parse png file: ...").
Png load_png(const std::string& path);
void save_png(const Png& png, const std::string& path);

} // namespace pngme
