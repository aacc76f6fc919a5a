#include "callback_memoizor.hpp"
#include <algorithm>
#include <atomic>
#include <iostream>
#include <stdexcept>

namespace memocache {

const nlohmann::json* value_at(const CallArgs& args, size_t i) {
    if (i >= args.size()) return nullptr;
    return std::get_if<nlohmann::json>(&args[i]);
}

const Callback* callback_at(const CallArgs& args, size_t i) {
    if (i >= args.size()) return nullptr;
    const auto* cb = std::get_if<Callback>(&args[i]);
    return (cb && *cb) ? cb : nullptr;
}

// Stored form is [error, results...]; hand back the results.
static Args stored_results(const nlohmann::json& stored) {
    if (!stored.is_array()) return Args{stored};
    if (stored.empty()) return Args{};
    return Args(stored.begin() + 1, stored.end());
}

CallbackMemoizor::CallbackMemoizor(Target target, std::shared_ptr<CacheEngine> engine)
    : Memoizor(std::move(engine))
    , target_(std::move(target))
{
    if (!target_) throw std::invalid_argument("Cannot memoize non-function");
}

void CallbackMemoizor::operator()(CallArgs args) const {
    if (!engine_->enabled()) {
        target_(std::move(args));
        return;
    }

    Options options = engine_->options();
    size_t argc = args.size();
    size_t index = options.callback_index ? std::min(*options.callback_index, argc)
                                          : (argc > 0 ? argc - 1 : 0);

    Callback done;
    if (index < argc) {
        if (const auto* cb = callback_at(args, index)) done = *cb;
        args.erase(args.begin() + static_cast<std::ptrdiff_t>(index));
    }
    if (!done) {
        std::cerr << "[memocache] Warning: " << options.name
                  << ": no completion callback at argument " << index
                  << ", the call will never report back\n";
        done = [](std::exception_ptr, const Args&) {};
    }

    auto completed = std::make_shared<std::atomic<bool>>(false);
    Callback finish = [done, completed](std::exception_ptr error, const Args& results) {
        if (completed->exchange(true)) return;
        done(error, results);
    };
    auto fired = std::make_shared<std::atomic<bool>>(false);

    try {
        Args params;
        for (size_t i = 0; i < args.size(); ++i) {
            if (const auto* value = value_at(args, i)) params.push_back(*value);
        }
        Args resolved = engine_->resolve(params);
        std::string key = engine_->derive_key(resolved);

        Cached cached = engine_->retrieve(key, resolved);
        if (cached) {
            finish(nullptr, stored_results(*cached));
            return;
        }

        auto engine = engine_;
        Callback wrapped = [engine, key, resolved, finish, fired](std::exception_ptr error,
                                                                  const Args& results) {
            if (fired->exchange(true)) return;
            if (error) {
                finish(error, results);
                return;
            }
            nlohmann::json stored = nlohmann::json::array({nullptr});
            for (const auto& r : results) stored.push_back(r);
            try {
                engine->save(key, stored, resolved);
            } catch (...) {
                finish(std::current_exception(), Args{});
                return;
            }
            finish(nullptr, results);
        };

        size_t slot = std::min(index, args.size());
        args.insert(args.begin() + static_cast<std::ptrdiff_t>(slot), CallArg(std::move(wrapped)));
        target_(std::move(args));
    } catch (...) {
        // Already reported: the failure came after completion, so surface it.
        if (completed->load()) throw;
        // A completion the target kept must not cache after the failure.
        fired->store(true);
        finish(std::current_exception(), Args{});
    }
}

void CallbackMemoizor::key(const Args& args, KeyCallback done) const {
    std::string key;
    try {
        key = engine_->key(args);
    } catch (...) {
        done(std::current_exception(), std::string());
        return;
    }
    done(nullptr, key);
}

void CallbackMemoizor::get(const Args& args, CachedCallback done) const {
    Cached cached;
    try {
        Args resolved = engine_->resolve(args);
        cached = engine_->retrieve(engine_->derive_key(resolved), resolved);
    } catch (...) {
        done(std::current_exception(), not_cached);
        return;
    }
    done(nullptr, cached);
}

void CallbackMemoizor::save(const nlohmann::json& value, const Args& args,
                            CachedCallback done) const {
    nlohmann::json stored = value.is_array() ? value : nlohmann::json::array({nullptr, value});
    Cached saved;
    try {
        Args resolved = engine_->resolve(args);
        saved = engine_->save(engine_->derive_key(resolved), stored, resolved);
    } catch (...) {
        done(std::current_exception(), not_cached);
        return;
    }
    done(nullptr, saved);
}

void CallbackMemoizor::remove(const Args& args, CachedCallback done) const {
    Cached removed;
    try {
        Args resolved = engine_->resolve(args);
        removed = engine_->remove(engine_->derive_key(resolved), resolved);
    } catch (...) {
        done(std::current_exception(), not_cached);
        return;
    }
    done(nullptr, removed);
}

void CallbackMemoizor::empty(DoneCallback done) const {
    try {
        engine_->empty();
    } catch (...) {
        done(std::current_exception());
        return;
    }
    done(nullptr);
}

} // namespace memocache
