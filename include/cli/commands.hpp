#pragma once

#include <iosfwd>
#include <string>

namespace pngme {

struct EncodeArgs {
    std::string png_path;
    std::string chunk_type;
    std::string message;
    std::string output_png_path; // empty: overwrite png_path
};

struct DecodeArgs {
    std::string png_path;
    std::string chunk_type;
};

struct RemoveArgs {
    std::string png_path;
    std::string chunk_type;
};

struct PrintArgs {
    std::string png_path;
};

// Subcommands. Results go to out; failures throw std::runtime_error with context.
void run_encode(const EncodeArgs& args, std::ostream& out);
void run_decode(const DecodeArgs& args, std::ostream& out);
void run_remove(const RemoveArgs& args, std::ostream& out);
void run_print(const PrintArgs& args, std::ostream& out);

const char* usage();

// Parse argv, dispatch, report. Returns the process exit code:
// 0 success, 1 usage error, 2 runtime failure.
int run_cli(int argc, char** argv, std::ostream& out, std::ostream& err);

} // namespace pngme
