#include "async_file_storage.hpp"
#include "line_format.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

static memocache::StorageRegistrar reg_file_async("file-async",
    [](const memocache::Config& config) {
        auto storage = std::make_unique<memocache::AsyncFileStorage>(
            config.resolved_storage_path());
        storage->init().get();
        return storage;
    });

namespace memocache {

AsyncFileStorage::AsyncFileStorage(std::string path)
    : path_(std::move(path))
{
    if (path_.empty()) throw std::invalid_argument("AsyncFileStorage: path cannot be empty");
    writer_ = std::thread([this] { run(); });
}

AsyncFileStorage::~AsyncFileStorage() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_one();
    if (writer_.joinable()) writer_.join();
}

// ── Writer thread ────────────────────────────────────────────────

template <typename T>
std::future<T> AsyncFileStorage::submit(std::function<T()> work, bool keep_failure) {
    auto task = std::make_shared<std::packaged_task<T()>>(
        [this, work = std::move(work), keep_failure]() -> T {
            try {
                return work();
            } catch (...) {
                if (keep_failure) record_failure(std::current_exception());
                throw;
            }
        });
    auto future = task->get_future();
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) throw std::runtime_error("AsyncFileStorage: writer is stopped");
        queue_.emplace_back([task] { (*task)(); });
    }
    queue_cv_.notify_one();
    return future;
}

void AsyncFileStorage::run() {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return;  // stopping and drained
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        job();
    }
}

void AsyncFileStorage::record_failure(std::exception_ptr error) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    if (!pending_error_) pending_error_ = std::move(error);
}

void AsyncFileStorage::rethrow_pending() {
    std::exception_ptr error;
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        std::swap(error, pending_error_);
    }
    if (error) std::rethrow_exception(error);
}

// ── File primitives (writer thread only) ─────────────────────────

void AsyncFileStorage::append_line(const std::string& line) {
    std::ofstream out(path_, std::ios::app | std::ios::binary);
    if (!out) throw std::runtime_error("AsyncFileStorage: cannot append to " + path_);
    out << line;
    if (!out) throw std::runtime_error("AsyncFileStorage: write failed for " + path_);
}

void AsyncFileStorage::rewrite_without(const std::string& key) {
    std::string text;
    if (!read_file(path_, text)) return;
    if (!atomic_write_file(path_, without_key(text, key))) {
        throw std::runtime_error("AsyncFileStorage: cannot rewrite " + path_);
    }
}

void AsyncFileStorage::truncate() {
    std::ofstream out(path_, std::ios::trunc | std::ios::binary);
    if (!out) throw std::runtime_error("AsyncFileStorage: cannot truncate " + path_);
}

// ── Async surface ────────────────────────────────────────────────

std::future<size_t> AsyncFileStorage::init() {
    return submit<size_t>([this]() -> size_t {
        auto parent = std::filesystem::path(path_).parent_path();
        if (!parent.empty()) std::filesystem::create_directories(parent);

        std::string text;
        if (!read_file(path_, text)) return 0;

        size_t loaded = 0;
        {
            std::lock_guard<std::mutex> lock(store_mutex_);
            loaded = load_lines(text, store_, path_);
        }
        if (!text.empty() && text.back() != '\n') append_line("\n");
        return loaded;
    }, false);
}

std::future<nlohmann::json> AsyncFileStorage::save_async(const std::string& key,
                                                         const nlohmann::json& value) {
    rethrow_pending();
    std::string line = encode_line(key, value);
    {
        std::lock_guard<std::mutex> lock(store_mutex_);
        store_[key] = value;
    }
    return submit<nlohmann::json>([this, line, value]() {
        append_line(line);
        return value;
    }, false);
}

std::future<Cached> AsyncFileStorage::remove_async(const std::string& key) {
    rethrow_pending();
    Cached removed;
    {
        std::lock_guard<std::mutex> lock(store_mutex_);
        auto it = store_.find(key);
        if (it != store_.end()) {
            removed = std::move(it->second);
            store_.erase(it);
        }
    }
    return submit<Cached>([this, key, removed]() {
        rewrite_without(key);
        return removed;
    }, false);
}

std::future<void> AsyncFileStorage::empty_async() {
    rethrow_pending();
    {
        std::lock_guard<std::mutex> lock(store_mutex_);
        store_.clear();
    }
    return submit<void>([this]() { truncate(); }, false);
}

std::future<void> AsyncFileStorage::flush() {
    return submit<void>([this]() { rethrow_pending(); }, false);
}

// ── Sync-shaped surface ──────────────────────────────────────────

nlohmann::json AsyncFileStorage::save(const std::string& key, const nlohmann::json& value,
                                      const Args&) {
    rethrow_pending();
    std::string line = encode_line(key, value);
    {
        std::lock_guard<std::mutex> lock(store_mutex_);
        store_[key] = value;
    }
    submit<void>([this, line]() { append_line(line); }, true);
    return value;
}

Cached AsyncFileStorage::retrieve(const std::string& key, const Args&) {
    rethrow_pending();
    std::lock_guard<std::mutex> lock(store_mutex_);
    auto it = store_.find(key);
    if (it == store_.end()) return not_cached;
    return it->second;
}

Cached AsyncFileStorage::remove(const std::string& key, const Args&) {
    rethrow_pending();
    Cached removed;
    {
        std::lock_guard<std::mutex> lock(store_mutex_);
        auto it = store_.find(key);
        if (it != store_.end()) {
            removed = std::move(it->second);
            store_.erase(it);
        }
    }
    submit<void>([this, key]() { rewrite_without(key); }, true);
    return removed;
}

void AsyncFileStorage::empty() {
    rethrow_pending();
    {
        std::lock_guard<std::mutex> lock(store_mutex_);
        store_.clear();
    }
    submit<void>([this]() { truncate(); }, true);
}

StoreContents AsyncFileStorage::contents() const {
    std::lock_guard<std::mutex> lock(store_mutex_);
    return StoreContents(store_.begin(), store_.end());
}

} // namespace memocache
