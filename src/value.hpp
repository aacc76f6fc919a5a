#pragma once
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace memocache {

// Argument list at the call boundary. Values are JSON so they can be
// normalized for key derivation and persisted by file-backed stores.
using Args = std::vector<nlohmann::json>;

// Result of a lookup. nullopt means "no entry"; a stored JSON null is a
// real cached value.
using Cached = std::optional<nlohmann::json>;

inline constexpr std::nullopt_t not_cached = std::nullopt;

// Read-only snapshot of a store, ordered by key.
using StoreContents = std::map<std::string, nlohmann::json>;

} // namespace memocache
