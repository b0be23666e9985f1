#pragma once

#include <string>

namespace panannot {

// SHA256 of a buffer (OpenSSL EVP), lowercase hex.
std::string sha256_string(const std::string& data);

bool file_exists(const std::string& path);
bool dir_exists(const std::string& path);

// Whole-file helpers. read_file_string returns "" if the file cannot be read.
std::string read_file_string(const std::string& path);
bool write_file_string(const std::string& path, const std::string& content);

// Remove a file or a directory tree. Missing paths are not an error.
void remove_recursive(const std::string& path);

// "dir/list_genomes.lst" -> "list_genomes"
std::string file_stem(const std::string& path);

} // namespace panannot
