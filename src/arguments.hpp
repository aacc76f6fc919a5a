#pragma once
#include "options.hpp"
#include "value.hpp"

namespace memocache {

// Canonical argument list used for key derivation and storage:
//   1. truncate to max_args,
//   2. apply coerce_args,
//   3. drop indices listed in ignore_args (indices refer to the truncated
//      list, before anything is dropped).
// The target itself always receives the raw arguments.
Args resolve_arguments(const Args& raw, const Options& options);

} // namespace memocache
