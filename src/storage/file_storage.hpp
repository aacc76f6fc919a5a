#pragma once
#include "map_storage.hpp"
#include <string>

namespace memocache {

// MapStorage mirrored to a line-oriented file with blocking I/O.
// Call init() once before use to load existing records.
//
// Every save appends a line and every remove rewrites the file, so keep it
// away from latency-sensitive paths.
class FileStorage : public MapStorage {
public:
    explicit FileStorage(std::string path);

    std::string controller_name() const override { return "FileStorage"; }

    // Load records from the file (a missing file is an empty store) and make
    // sure the file ends with a line terminator. Returns records loaded.
    size_t init();

    nlohmann::json save(const std::string& key, const nlohmann::json& value,
                        const Args& args) override;
    Cached remove(const std::string& key, const Args& args) override;
    void empty() override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace memocache
