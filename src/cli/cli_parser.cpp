#include "cli/cli_parser.hpp"

namespace pngme {

void CliParser::parse(int argc, char** argv) {
    kv_.clear();
    positional_.clear();
    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i] ? argv[i] : "";
        if (!options_done && a == "--") {
            options_done = true;
            continue;
        }
        if (!options_done && a.rfind("--", 0) == 0) {
            std::string key = a.substr(2);
            std::string val = "true";
            if (i + 1 < argc) {
                std::string next = argv[i + 1] ? argv[i + 1] : "";
                if (next.rfind("--", 0) != 0) {
                    val = next;
                    ++i;
                }
            }
            kv_[key] = val;
        } else {
            positional_.push_back(a);
        }
    }
}

bool CliParser::has(const std::string& key) const {
    return kv_.find(key) != kv_.end();
}

std::string CliParser::get(const std::string& key, const std::string& def) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return def;
    return it->second;
}

std::string CliParser::positional(size_t index, const std::string& def) const {
    if (index >= positional_.size()) return def;
    return positional_[index];
}

} // namespace pngme
