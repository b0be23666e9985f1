#pragma once

#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace panannot {

// Simple command-line argument parser for -key value style arguments.
// Keys listed in `flags` never consume the following argument.
class CliParser {
public:
    CliParser(int argc, char* argv[], const std::set<std::string>& flags = {});

    // Check if a flag/option is present.
    bool has(const std::string& key) const;

    // Get string value for a key. Returns default_val if not found.
    std::string get_string(const std::string& key,
                           const std::string& default_val = {}) const;

    // Strict integer lookup: fails (with error_msg) on a missing key or a
    // value that is not entirely an integer.
    bool parse_int(const std::string& key, int& out, std::string& error_msg) const;

    // Get the program name (argv[0]).
    const std::string& program() const { return program_; }

    // Get positional arguments (those not preceded by a -key).
    const std::vector<std::string>& positional() const { return positional_; }

private:
    std::string program_;
    std::unordered_map<std::string, std::vector<std::string>> opts_;
    std::vector<std::string> positional_;

    void add(const std::string& key, const std::string& value);
};

} // namespace panannot
