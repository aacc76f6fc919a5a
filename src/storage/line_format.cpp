#include "line_format.hpp"
#include "../util.hpp"
#include <iostream>
#include <stdexcept>

namespace memocache {

std::string encode_line(const std::string& key, const nlohmann::json& value) {
    if (key.find_first_of("|\r\n") != std::string::npos) {
        throw std::invalid_argument("file storage: key cannot contain '|' or line breaks");
    }
    return key + kLineDelimiter +
           value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

bool split_line(const std::string& line, std::string& key, std::string& raw_value) {
    auto pos = line.find(kLineDelimiter);
    if (pos == std::string::npos) return false;
    key = line.substr(0, pos);
    raw_value = line.substr(pos + 1);
    return true;
}

size_t load_lines(const std::string& text,
                  std::unordered_map<std::string, nlohmann::json>& store,
                  const std::string& source) {
    size_t applied = 0;
    size_t line_no = 0;
    for (const auto& line : split_lines(text)) {
        ++line_no;
        if (line.empty()) continue;

        std::string key;
        std::string raw;
        if (!split_line(line, key, raw)) continue;

        try {
            store[key] = nlohmann::json::parse(raw);
            ++applied;
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "[file-storage] Warning: skipping line " << line_no << " of "
                      << source << ": " << e.what() << "\n";
        }
    }
    return applied;
}

std::string without_key(const std::string& text, const std::string& key) {
    std::string out;
    out.reserve(text.size());
    for (const auto& line : split_lines(text)) {
        if (line.empty()) continue;
        std::string line_key;
        std::string raw;
        if (split_line(line, line_key, raw) && line_key == key) continue;
        out += line;
        out += '\n';
    }
    return out;
}

} // namespace memocache
