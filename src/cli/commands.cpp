#include "cli/commands.hpp"

#include "cli/cli_parser.hpp"
#include "io/png_file.hpp"
#include "png/png.hpp"

#include <exception>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace pngme {

namespace {
static ChunkType parse_chunk_type(const std::string& text) {
    try {
        return ChunkType::from_string(text);
    } catch (const ChunkTypeError& e) {
        throw std::runtime_error(std::string("invalid chunk type: ") + e.what());
    }
}
} // namespace

void run_encode(const EncodeArgs& args, std::ostream& out) {
    Png png = load_png(args.png_path);

    ChunkType chunk_type = parse_chunk_type(args.chunk_type);
    std::vector<uint8_t> data(args.message.begin(), args.message.end());
    png.append_chunk(Chunk(chunk_type, std::move(data)));

    const std::string& output = args.output_png_path.empty() ? args.png_path : args.output_png_path;
    save_png(png, output);
    out << "Wrote: " << output << "\n";
}

void run_decode(const DecodeArgs& args, std::ostream& out) {
    const Png png = load_png(args.png_path);

    const Chunk* chunk = png.chunk_by_type(args.chunk_type);
    if (!chunk) throw std::runtime_error("chunk not found");

    out << "Found chunk: \"" << chunk->data_as_string() << "\"\n";
}

void run_remove(const RemoveArgs& args, std::ostream& out) {
    Png png = load_png(args.png_path);

    std::optional<Chunk> removed = png.remove_chunk(args.chunk_type);
    if (!removed) throw std::runtime_error("chunk not found");

    out << "Removed chunk with message: \"" << removed->data_as_string() << "\"\n";
    save_png(png, args.png_path);
}

void run_print(const PrintArgs& args, std::ostream& out) {
    const Png png = load_png(args.png_path);

    for (const Chunk& chunk : png.chunks()) {
        out << "Chunk \"" << chunk.chunk_type() << "\": \"" << chunk.data_as_string() << "\"\n";
    }
}

const char* usage() {
    return "Usage:\n"
           "  pngme encode <png> <chunk_type> <message> [output_png]\n"
           "  pngme decode <png> <chunk_type>\n"
           "  pngme remove <png> <chunk_type>\n"
           "  pngme print <png>\n"
           "Use -- before a message that starts with \"--\".\n";
}

int run_cli(int argc, char** argv, std::ostream& out, std::ostream& err) {
    CliParser cli;
    cli.parse(argc, argv);
    const std::string cmd = cli.command();
    const size_t nargs = cli.positional_count();

    if (cli.has("help") || cmd.empty()) {
        out << usage();
        return cmd.empty() && !cli.has("help") ? 1 : 0;
    }

    try {
        if (cmd == "encode" && (nargs == 4 || nargs == 5)) {
            run_encode({cli.positional(1), cli.positional(2), cli.positional(3), cli.positional(4)}, out);
        } else if (cmd == "decode" && nargs == 3) {
            run_decode({cli.positional(1), cli.positional(2)}, out);
        } else if (cmd == "remove" && nargs == 3) {
            run_remove({cli.positional(1), cli.positional(2)}, out);
        } else if (cmd == "print" && nargs == 2) {
            run_print({cli.positional(1)}, out);
        } else {
            err << usage();
            return 1;
        }
        return 0;
    } catch (const std::exception& e) {
        err << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}

} // namespace pngme
