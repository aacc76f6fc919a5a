#pragma once
#include "../memoizor.hpp"
#include <exception>
#include <functional>
#include <variant>
#include <vector>

namespace memocache {

// Completion callback: error first, then the result values.
using Callback = std::function<void(std::exception_ptr error, const Args& results)>;

// One positional argument in callback style: a value or the completion.
using CallArg = std::variant<nlohmann::json, Callback>;
using CallArgs = std::vector<CallArg>;

// Value at position i, or nullptr if it holds a callback or is out of range.
const nlohmann::json* value_at(const CallArgs& args, size_t i);

// Callback at position i, or nullptr.
const Callback* callback_at(const CallArgs& args, size_t i);

// Memoizes a callback-style target. The completion is taken from
// options.callback_index (clamped to the argument count) or the last
// argument, and is called exactly once with (error, results...).
//
// Results are stored as [null, results...]. Errors raised before the target
// runs are delivered to the completion rather than thrown. If no completion
// can be found the call still runs but nobody is told when it ends.
class CallbackMemoizor : public Memoizor {
public:
    using Target = std::function<void(CallArgs)>;
    using KeyCallback = std::function<void(std::exception_ptr, const std::string&)>;
    using CachedCallback = std::function<void(std::exception_ptr, const Cached&)>;
    using DoneCallback = std::function<void(std::exception_ptr)>;

    // Throws std::invalid_argument if target is empty.
    CallbackMemoizor(Target target, std::shared_ptr<CacheEngine> engine);

    void operator()(CallArgs args) const;

    void key(const Args& args, KeyCallback done) const;

    // done receives the stored result list, or not_cached.
    void get(const Args& args, CachedCallback done) const;

    // A value that is not already a list is stored as [null, value].
    void save(const nlohmann::json& value, const Args& args, CachedCallback done) const;

    void remove(const Args& args, CachedCallback done) const;
    void empty(DoneCallback done) const;

private:
    Target target_;
};

} // namespace memocache
