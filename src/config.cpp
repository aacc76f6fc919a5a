#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace memocache {

std::string default_config_path() {
    const char* env = std::getenv("MEMOCACHE_CONFIG");
    if (env && *env) return env;
    return expand_home("~/.memocache/config.json");
}

nlohmann::json Config::defaults_json() {
    return {
        {"storage", "memory"},
        {"storage_path", ""},
        {"options", Options::defaults_json()}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void write_config(const std::string& path, const nlohmann::json& j) {
    auto parent = std::filesystem::path(path).parent_path();
    std::error_code ec;
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    if (!atomic_write_file(path, j.dump(4) + "\n")) {
        std::cerr << "[config] Warning: failed to write config: " << path << "\n";
    }
}

Config Config::load() {
    return load(default_config_path());
}

Config Config::load(const std::string& path) {
    nlohmann::json j;

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                write_config(path, j);
                std::cerr << "[config] Migrated config with new defaults: " << path << "\n";
            }
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "[config] Malformed config " << path << " (" << e.what()
                      << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        write_config(path, j);
        std::cerr << "[config] Created default config: " << path << "\n";
    }

    return from_json(j);
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("storage") && j["storage"].is_string())
        cfg.storage = j["storage"].get<std::string>();
    if (j.contains("storage_path") && j["storage_path"].is_string())
        cfg.storage_path = j["storage_path"].get<std::string>();

    // Option validation errors propagate: a bad uid or ignore_args is a
    // configuration error, not something to paper over with defaults.
    if (j.contains("options") && j["options"].is_object())
        cfg.options = Options::from_json(j["options"]);

    return cfg;
}

std::string Config::resolved_storage_path() const {
    if (!storage_path.empty()) return expand_home(storage_path);
    if (storage == "sqlite") return expand_home("~/.memocache/store.db");
    return expand_home("~/.memocache/store.txt");
}

} // namespace memocache
