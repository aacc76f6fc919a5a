#pragma once
#include "options.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace memocache {

struct Config {
#ifdef MEMOCACHE_HAS_SQLITE_STORE
    static constexpr const char* kPersistentBackend = "sqlite";
#else
    static constexpr const char* kPersistentBackend = "file";
#endif

    std::string storage = "memory";   // registry name of the storage controller
    std::string storage_path;         // file-backed controllers; empty = default path
    Options options;                  // defaults applied to every memoized target

    // Load from $MEMOCACHE_CONFIG, else ~/.memocache/config.json.
    static Config load();

    // Load from an explicit path. Missing keys are filled from defaults and
    // written back; a missing file is created with defaults.
    static Config load(const std::string& path);

    // Parse an already-merged JSON document.
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // storage_path, or the per-backend default under ~/.memocache.
    std::string resolved_storage_path() const;
};

// Default config file location.
std::string default_config_path();

} // namespace memocache
