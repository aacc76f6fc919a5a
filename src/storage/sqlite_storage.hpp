#pragma once
#include "../storage.hpp"
#include <string>

struct sqlite3; // forward declare

namespace memocache {

// Persistent controller backed by a single SQLite table. Values are stored
// as JSON text. Unlike the file controllers nothing is mirrored in memory.
class SqliteStorage : public StorageController {
public:
    explicit SqliteStorage(const std::string& path);
    ~SqliteStorage() override;

    std::string controller_name() const override { return "SqliteStorage"; }

    nlohmann::json save(const std::string& key, const nlohmann::json& value,
                        const Args& args) override;
    Cached retrieve(const std::string& key, const Args& args) override;
    Cached remove(const std::string& key, const Args& args) override;
    void empty() override;
    StoreContents contents() const override;

    const std::string& path() const { return path_; }

private:
    void init_schema();
    [[noreturn]] void fail(const std::string& what) const;

    sqlite3* db_ = nullptr;
    std::string path_;
};

} // namespace memocache
