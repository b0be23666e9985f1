#include "util/cli_parser.hpp"

#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace panannot {

// "-3" or "-12" is a value, not an option.
static bool is_negative_number(const char* s) {
    if (s[0] != '-' || s[1] == '\0') return false;
    for (const char* p = s + 1; *p; p++) {
        if (!std::isdigit(static_cast<unsigned char>(*p))) return false;
    }
    return true;
}

CliParser::CliParser(int argc, char* argv[], const std::set<std::string>& flags) {
    if (argc > 0) {
        program_ = argv[0];
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.size() >= 2 && arg[0] == '-' && !is_negative_number(argv[i])) {
            // Handle --key=value syntax for double-dash args
            if (arg.size() >= 3 && arg[1] == '-') {
                auto eq = arg.find('=');
                if (eq != std::string::npos) {
                    add(arg.substr(0, eq), arg.substr(eq + 1));
                    continue;
                }
            }

            if (flags.count(arg)) {
                add(arg, "1");
                continue;
            }

            // Check if this is a flag (no value) or key-value pair
            if (i + 1 < argc &&
                (argv[i + 1][0] != '-' || is_negative_number(argv[i + 1]))) {
                add(arg, argv[i + 1]);
                i++;
            } else {
                add(arg, "1");
            }
        } else {
            positional_.push_back(arg);
        }
    }
}

void CliParser::add(const std::string& key, const std::string& value) {
    opts_[key].push_back(value);
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

bool CliParser::parse_int(const std::string& key, int& out,
                          std::string& error_msg) const {
    auto it = opts_.find(key);
    if (it == opts_.end() || it->second.empty()) {
        error_msg = key + " is required";
        return false;
    }
    const std::string& s = it->second.back();
    size_t consumed = 0;
    try {
        out = std::stoi(s, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != s.size()) {
        error_msg = "argument " + key + ": invalid int value: '" + s + "'";
        return false;
    }
    return true;
}

} // namespace panannot
