#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace hhrkit {

// Command-line parser for -key value style arguments.
// A key may repeat; "-" on its own is a value (stdin/stdout), not a key.
class CliParser {
public:
    CliParser(int argc, char* argv[]);

    bool has(const std::string& key) const;

    // Last value given for key, or default_val if absent.
    std::string get_string(const std::string& key,
                           const std::string& default_val = {}) const;

    // Every value given for key, in command-line order.
    std::vector<std::string> get_strings(const std::string& key) const;

    // Integer value for key. Returns default_val if absent or invalid.
    int get_int(const std::string& key, int default_val = 0) const;

    // Keys present on the command line that are not listed in known.
    std::vector<std::string> unknown_keys(const std::vector<std::string>& known) const;

    const std::string& program() const { return program_; }
    const std::vector<std::string>& positional() const { return positional_; }

private:
    std::string program_;
    std::unordered_map<std::string, std::vector<std::string>> opts_;
    std::vector<std::string> positional_;
};

} // namespace hhrkit
