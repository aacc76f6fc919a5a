#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace memocache {

// Unix epoch milliseconds
uint64_t epoch_millis();

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Split text into lines, accepting both \n and \r\n terminators.
std::vector<std::string> split_lines(const std::string& text);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via a temporary file and rename. Returns false on failure.
bool atomic_write_file(const std::string& path, const std::string& content);

// Read a whole file. Returns false if it cannot be opened.
bool read_file(const std::string& path, std::string& out);

// Lowercase hex MD5 digest of data.
std::string md5_hex(const std::string& data);

// True when MEMOCACHE_DEBUG is set in the environment (read once).
bool debug_enabled();

} // namespace memocache
