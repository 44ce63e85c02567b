#ifndef RANGECACHE_SRC_KY_COMMON_CHECKED_MATH_H
#define RANGECACHE_SRC_KY_COMMON_CHECKED_MATH_H

#include <glog/logging.h>

#include <cstdint>
#include <limits>
#include <utility>

namespace ky {

// Narrowing cast that dies instead of silently wrapping.
template <typename T, typename F>
inline T SafeCast(F value) {
  constexpr auto min = std::numeric_limits<T>::min();
  constexpr auto max = std::numeric_limits<T>::max();
  LOG_ASSERT(std::cmp_greater_equal(value, min))
      << " : " << value << " >= " << min;
  LOG_ASSERT(std::cmp_less_equal(value, max))
      << " : " << value << " <= " << max;
  return static_cast<T>(value);
}

// Adds a signed delta to an unsigned position. Returns false (leaving `result`
// untouched) when the sum does not fit in uint64_t.
inline bool CheckedAdd(uint64_t position, int64_t delta, uint64_t &result) {
  if (delta >= 0) {
    auto magnitude = static_cast<uint64_t>(delta);
    if (position > std::numeric_limits<uint64_t>::max() - magnitude) {
      return false;
    }
    result = position + magnitude;
    return true;
  }

  // -(INT64_MIN) is not representable, negate in unsigned space
  auto magnitude = static_cast<uint64_t>(0) - static_cast<uint64_t>(delta);
  if (magnitude > position) {
    return false;
  }
  result = position - magnitude;
  return true;
}

// Signed distance `to - from`. Returns false when it does not fit in int64_t.
inline bool CheckedDistance(uint64_t from, uint64_t to, int64_t &result) {
  constexpr auto kMax =
      static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
  if (to >= from) {
    auto distance = to - from;
    if (distance > kMax) {
      return false;
    }
    result = static_cast<int64_t>(distance);
    return true;
  }

  auto distance = from - to;
  if (distance > kMax + 1) {
    return false;
  }
  result = distance == kMax + 1 ? std::numeric_limits<int64_t>::min()
                                : -static_cast<int64_t>(distance);
  return true;
}

}  // namespace ky

#endif  // RANGECACHE_SRC_KY_COMMON_CHECKED_MATH_H
