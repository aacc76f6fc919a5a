#pragma once
#include "map_storage.hpp"
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace memocache {

// MapStorage mirrored to a line-oriented file by a background writer.
// Writes are applied in submission order on a single thread. The in-memory
// map is updated immediately, so reads never wait on I/O.
//
// The *_async methods return a future that completes once the write is on
// disk. The inherited sync-shaped methods enqueue the write and return at
// once; a failed background write is kept and rethrown by the next
// operation or by flush(), whichever comes first.
class AsyncFileStorage : public MapStorage {
public:
    explicit AsyncFileStorage(std::string path);
    ~AsyncFileStorage() override;

    std::string controller_name() const override { return "AsyncFileStorage"; }

    // Load existing records on the writer thread. Wait on the result before
    // the first lookup. Yields the number of records loaded.
    std::future<size_t> init();

    std::future<nlohmann::json> save_async(const std::string& key,
                                           const nlohmann::json& value);
    std::future<Cached> remove_async(const std::string& key);
    std::future<void> empty_async();

    // Completes after every write submitted so far. Rethrows a pending
    // write failure.
    std::future<void> flush();

    nlohmann::json save(const std::string& key, const nlohmann::json& value,
                        const Args& args) override;
    Cached retrieve(const std::string& key, const Args& args) override;
    Cached remove(const std::string& key, const Args& args) override;
    void empty() override;
    StoreContents contents() const override;

    const std::string& path() const { return path_; }

private:
    // Queue work on the writer. When keep_failure is set, an exception
    // from work is also kept for rethrow by the next operation.
    template <typename T>
    std::future<T> submit(std::function<T()> work, bool keep_failure);

    void run();
    void record_failure(std::exception_ptr error);
    void rethrow_pending();

    void append_line(const std::string& line);
    void rewrite_without(const std::string& key);
    void truncate();

    std::string path_;

    mutable std::mutex store_mutex_;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::function<void()>> queue_;
    bool stopping_ = false;

    std::mutex error_mutex_;
    std::exception_ptr pending_error_;

    std::thread writer_;
};

} // namespace memocache
