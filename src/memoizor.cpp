#include "memoizor.hpp"
#include <stdexcept>

namespace memocache {

Memoizor::Memoizor(std::shared_ptr<CacheEngine> engine)
    : engine_(std::move(engine))
{
    if (!engine_) throw std::invalid_argument("Memoizor: engine cannot be null");
}

} // namespace memocache
