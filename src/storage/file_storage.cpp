#include "file_storage.hpp"
#include "line_format.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

static memocache::StorageRegistrar reg_file("file",
    [](const memocache::Config& config) {
        auto storage = std::make_unique<memocache::FileStorage>(config.resolved_storage_path());
        storage->init();
        return storage;
    });

namespace memocache {

FileStorage::FileStorage(std::string path)
    : path_(std::move(path))
{
    if (path_.empty()) throw std::invalid_argument("FileStorage: path cannot be empty");
}

size_t FileStorage::init() {
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    std::string text;
    if (!read_file(path_, text)) return 0;

    size_t loaded = load_lines(text, store_, path_);

    if (!text.empty() && text.back() != '\n') {
        std::ofstream out(path_, std::ios::app | std::ios::binary);
        if (!out) throw std::runtime_error("FileStorage: cannot append to " + path_);
        out << '\n';
    }
    return loaded;
}

nlohmann::json FileStorage::save(const std::string& key, const nlohmann::json& value,
                                 const Args& args) {
    std::string line = encode_line(key, value);
    {
        std::ofstream out(path_, std::ios::app | std::ios::binary);
        if (!out) throw std::runtime_error("FileStorage: cannot append to " + path_);
        out << line;
        if (!out) throw std::runtime_error("FileStorage: write failed for " + path_);
    }
    return MapStorage::save(key, value, args);
}

Cached FileStorage::remove(const std::string& key, const Args& args) {
    std::string text;
    if (read_file(path_, text)) {
        if (!atomic_write_file(path_, without_key(text, key))) {
            throw std::runtime_error("FileStorage: cannot rewrite " + path_);
        }
    }
    return MapStorage::remove(key, args);
}

void FileStorage::empty() {
    {
        std::ofstream out(path_, std::ios::trunc | std::ios::binary);
        if (!out) throw std::runtime_error("FileStorage: cannot truncate " + path_);
    }
    MapStorage::empty();
}

} // namespace memocache
