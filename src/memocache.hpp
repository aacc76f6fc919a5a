#pragma once
#include "adapters/callback_memoizor.hpp"
#include "adapters/future_memoizor.hpp"
#include "adapters/sync_memoizor.hpp"
#include "config.hpp"
#include "engine.hpp"
#include "storage/map_storage.hpp"
#include <functional>
#include <memory>
#include <stdexcept>
#include <tuple>
#include <type_traits>
#include <utility>

namespace memocache {

// Engine over storage, defaulting to a fresh MapStorage.
inline std::shared_ptr<CacheEngine> make_engine(Options options,
                                                std::unique_ptr<StorageController> storage = nullptr) {
    if (!storage) storage = std::make_unique<MapStorage>();
    return std::make_shared<CacheEngine>(std::move(options), std::move(storage));
}

inline SyncMemoizor memoize_sync(SyncMemoizor::Target target, Options options = {},
                                 std::unique_ptr<StorageController> storage = nullptr) {
    return SyncMemoizor(std::move(target), make_engine(std::move(options), std::move(storage)));
}

inline FutureMemoizor memoize_future(FutureMemoizor::Target target, Options options = {},
                                     std::unique_ptr<StorageController> storage = nullptr) {
    return FutureMemoizor(std::move(target), make_engine(std::move(options), std::move(storage)));
}

inline CallbackMemoizor memoize_callback(CallbackMemoizor::Target target, Options options = {},
                                         std::unique_ptr<StorageController> storage = nullptr) {
    return CallbackMemoizor(std::move(target), make_engine(std::move(options), std::move(storage)));
}

// Options and storage backend taken from a loaded Config.
inline SyncMemoizor memoize_sync(SyncMemoizor::Target target, const Config& config) {
    return memoize_sync(std::move(target), config.options, create_storage(config));
}

// Fix the receiver of a member function so it can be memoized as a target.
template <class Object, class Result, class... Params>
std::function<Result(Params...)> bind_target(Object* receiver, Result (Object::*method)(Params...)) {
    if (!receiver) throw std::invalid_argument("bind_target: receiver cannot be null");
    return [receiver, method](Params... params) -> Result {
        return (receiver->*method)(std::forward<Params>(params)...);
    };
}

template <class Object, class Result, class... Params>
std::function<Result(Params...)> bind_target(const Object* receiver,
                                             Result (Object::*method)(Params...) const) {
    if (!receiver) throw std::invalid_argument("bind_target: receiver cannot be null");
    return [receiver, method](Params... params) -> Result {
        return (receiver->*method)(std::forward<Params>(params)...);
    };
}

// Typed front end over SyncMemoizor. Arguments and the result travel
// through nlohmann::json, so every type needs to_json/from_json.
//
//   Memoized<int(int)> twice([](int x) { return x * 2; });
//   twice(21);  // 42, cached
template <class Signature> class Memoized;

template <class Return, class... Arguments>
class Memoized<Return(Arguments...)> {
    static_assert(!std::is_void_v<Return>, "Memoized needs a result to cache");

public:
    using Function = std::function<Return(Arguments...)>;

    explicit Memoized(Function function, Options options = {},
                      std::unique_ptr<StorageController> storage = nullptr)
        : memoizor_(wrap(std::move(function)), make_engine(std::move(options), std::move(storage)))
    {}

    Return operator()(Arguments... args) const {
        return memoizor_(Args{nlohmann::json(args)...}).template get<Return>();
    }

    std::string key(Arguments... args) const {
        return memoizor_.key(Args{nlohmann::json(args)...});
    }

    // Drop the entry for these arguments. Returns true if one existed.
    bool forget(Arguments... args) const {
        return memoizor_.remove(Args{nlohmann::json(args)...}).has_value();
    }

    SyncMemoizor& memoizor() { return memoizor_; }
    const SyncMemoizor& memoizor() const { return memoizor_; }

private:
    template <size_t... I>
    static Return invoke(const Function& function, const Args& args, std::index_sequence<I...>) {
        (void)args;
        return function(args.at(I).template get<std::decay_t<Arguments>>()...);
    }

    static SyncMemoizor::Target wrap(Function function) {
        if (!function) return SyncMemoizor::Target();
        return [function = std::move(function)](const Args& args) -> nlohmann::json {
            return invoke(function, args, std::index_sequence_for<Arguments...>{});
        };
    }

    SyncMemoizor memoizor_;
};

} // namespace memocache
