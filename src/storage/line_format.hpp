#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>

namespace memocache {

// One record per line: key '|' json-value '\n'.
constexpr char kLineDelimiter = '|';

// Throws std::invalid_argument if key contains the delimiter or a line break.
std::string encode_line(const std::string& key, const nlohmann::json& value);

// Split a line into key and raw JSON text. Returns false if the line has no
// delimiter.
bool split_line(const std::string& line, std::string& key, std::string& raw_value);

// Parse every record in text into store. Lines without a delimiter are
// skipped; lines whose value is not JSON are skipped with a warning tagged
// with `source`. Later lines win. Returns the number of records applied.
size_t load_lines(const std::string& text,
                  std::unordered_map<std::string, nlohmann::json>& store,
                  const std::string& source);

// Text with every record for key removed. Other lines are kept verbatim.
std::string without_key(const std::string& text, const std::string& key);

} // namespace memocache
