#pragma once
#include "options.hpp"
#include "value.hpp"
#include <mutex>
#include <string>
#include <unordered_map>

namespace memocache {

// Turns resolved arguments into cache keys. Holds a bounded memo of
// serialized signature -> digest so bursts of identical calls hash once.
class KeyDeriver {
public:
    explicit KeyDeriver(size_t memo_limit = 4096) : memo_limit_(memo_limit) {}

    std::string derive(const Args& resolved, const Options& options);

    // Drop memoized digests (the uid is part of the hashed text, so this is
    // only needed to release memory).
    void reset();

    size_t memo_size() const;

private:
    std::string hashed(const std::string& text);

    size_t memo_limit_;
    std::unordered_map<std::string, std::string> memo_;
    mutable std::mutex mutex_;
};

// Normalized text hashed in default mode: {"prefix":uid,"signature":args}
// with object keys sorted.
std::string normalized_signature(const std::string& uid, const Args& resolved);

// '\0'-joined string forms, used verbatim as the key in primitive mode.
std::string primitive_key(const Args& resolved);

} // namespace memocache
