#ifndef RANGECACHE_SRC_KY_COMMON_NOEXCEPT_H
#define RANGECACHE_SRC_KY_COMMON_NOEXCEPT_H

#include <functional>

namespace ky {

// Runs `function` and turns any escaping exception into a fatal log entry.
// Meant for the outermost frame of a tool's `main`.
int NoExcept(const std::function<int()> &function);

}  // namespace ky

#endif  // RANGECACHE_SRC_KY_COMMON_NOEXCEPT_H
