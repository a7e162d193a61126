#include "io/png_file.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace pngme {

namespace fs = std::filesystem;

std::vector<uint8_t> read_file_bytes(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.good()) throw std::runtime_error("Cannot open file: " + path);
    ifs.seekg(0, std::ios::end);
    std::streamsize n = ifs.tellg();
    if (n < 0) throw std::runtime_error("Cannot determine file size: " + path);
    ifs.seekg(0, std::ios::beg);
    std::vector<uint8_t> buf(static_cast<size_t>(n));
    ifs.read(reinterpret_cast<char*>(buf.data()), n);
    if (ifs.gcount() != n) throw std::runtime_error("Short read: " + path);
    return buf;
}

void write_file_bytes(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs.good()) throw std::runtime_error("Cannot write file: " + path);
    ofs.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    ofs.flush();
    if (!ofs.good()) throw std::runtime_error("Write failed: " + path);
}

void validate_png_path(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw std::runtime_error("Entered path is not a valid file.");
    }
}

Png load_png(const std::string& path) {
    validate_png_path(path);

    std::vector<uint8_t> bytes;
    try {
        bytes = read_file_bytes(path);
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to read png file: ") + e.what());
    }
#ifndef NDEBUG
    std::fprintf(stderr, "read %zu bytes from %s\n", bytes.size(), path.c_str());
#endif

    try {
        Png png = parse_png(bytes);
#ifndef NDEBUG
        std::fprintf(stderr, "parsed %zu chunks\n", png.chunks().size());
#endif
        return png;
    } catch (const PngError& e) {
        throw std::runtime_error(std::string("failed to parse png file: ") + e.what());
    }
}

void save_png(const Png& png, const std::string& path) {
    const std::vector<uint8_t> bytes = serialize_png(png);
    try {
        write_file_bytes(path, bytes);
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to write png file: ") + e.what());
    }
#ifndef NDEBUG
    std::fprintf(stderr, "wrote %zu bytes to %s\n", bytes.size(), path.c_str());
#endif
}

} // namespace pngme
