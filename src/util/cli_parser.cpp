#include "util/cli_parser.hpp"

#include <algorithm>

namespace hhrkit {

static bool is_key(const char* arg) {
    return arg[0] == '-' && arg[1] != '\0';
}

CliParser::CliParser(int argc, char* argv[]) {
    if (argc > 0) {
        program_ = argv[0];
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (!is_key(argv[i])) {
            positional_.push_back(arg);
            continue;
        }

        // --key=value
        if (arg.size() >= 3 && arg[1] == '-') {
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                opts_[arg.substr(0, eq)].push_back(arg.substr(eq + 1));
                continue;
            }
        }

        if (i + 1 < argc && !is_key(argv[i + 1])) {
            opts_[arg].push_back(argv[i + 1]);
            i++;
        } else {
            opts_[arg].push_back("1");
        }
    }
}

bool CliParser::has(const std::string& key) const {
    return opts_.count(key) > 0;
}

std::string CliParser::get_string(const std::string& key,
                                  const std::string& default_val) const {
    auto it = opts_.find(key);
    if (it != opts_.end() && !it->second.empty()) return it->second.back();
    return default_val;
}

std::vector<std::string> CliParser::get_strings(const std::string& key) const {
    auto it = opts_.find(key);
    if (it != opts_.end()) return it->second;
    return {};
}

int CliParser::get_int(const std::string& key, int default_val) const {
    auto it = opts_.find(key);
    if (it == opts_.end() || it->second.empty()) return default_val;
    const std::string& s = it->second.back();
    size_t pos = 0;
    try {
        int v = std::stoi(s, &pos);
        return pos == s.size() ? v : default_val;
    } catch (const std::exception&) {
        return default_val;
    }
}

std::vector<std::string> CliParser::unknown_keys(const std::vector<std::string>& known) const {
    std::vector<std::string> unknown;
    for (const auto& kv : opts_) {
        if (std::find(known.begin(), known.end(), kv.first) == known.end()) {
            unknown.push_back(kv.first);
        }
    }
    std::sort(unknown.begin(), unknown.end());
    return unknown;
}

} // namespace hhrkit
