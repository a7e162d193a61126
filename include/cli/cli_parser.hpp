#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace pngme {

// Very small CLI parser:
//   <positional> ...   (first one is the subcommand)
//   --key value
//   --flag (treated as "true")
//   --        everything after is positional, even if it starts with "--"
class CliParser {
public:
    void parse(int argc, char** argv);
    bool has(const std::string& key) const;
    std::string get(const std::string& key, const std::string& def = "") const;

    size_t positional_count() const { return positional_.size(); }
    std::string positional(size_t index, const std::string& def = "") const;
    // positional(0), or "" when there is none.
    std::string command() const { return positional(0); }
private:
    std::unordered_map<std::string, std::string> kv_;
    std::vector<std::string> positional_;
};

} // namespace pngme
