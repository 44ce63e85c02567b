#ifndef RANGECACHE_SRC_BUFFERS_INCLUDE_RANGECACHE_BUFFERS_RANGE_BUFFER_H
#define RANGECACHE_SRC_BUFFERS_INCLUDE_RANGECACHE_BUFFERS_RANGE_BUFFER_H

#include <cstdint>
#include <ostream>
#include <vector>

namespace rangecache {

/***
 * Bytes of a source at the absolute offsets [start, end).
 *
 * Buffers are never resized in place: growing a range means merging two
 * buffers into a new one.
 */
class RangeBuffer final {
  uint64_t start_;
  uint64_t end_;
  std::vector<char> data_;

public:
  // Zero filled. Requires start < end.
  RangeBuffer(uint64_t start, uint64_t end);

  // Copies `size` bytes; a zero sized buffer is allowed.
  RangeBuffer(uint64_t start, const void *data, uint64_t size);

  RangeBuffer(uint64_t start, std::vector<char> &&data);

  RangeBuffer(RangeBuffer &&) = default;
  RangeBuffer &operator=(RangeBuffer &&) = default;
  RangeBuffer(const RangeBuffer &) = delete;
  RangeBuffer &operator=(const RangeBuffer &) = delete;

  [[nodiscard]] uint64_t GetStart() const { return start_; }

  [[nodiscard]] uint64_t GetEnd() const { return end_; }

  [[nodiscard]] uint64_t GetSize() const { return end_ - start_; }

  // True when the ranges intersect or touch end to end, so that [0, 10) and
  // [10, 20) overlap.
  [[nodiscard]] bool Overlaps(const RangeBuffer &other) const;

  // Consumes both buffers. Requires Overlaps(other). Where both supply bytes,
  // the ones from `other` are kept.
  [[nodiscard]] RangeBuffer Merge(RangeBuffer &&other) &&;

  [[nodiscard]] bool ContainsRange(uint64_t offset, uint64_t length) const;

  // Bytes at [offset, offset + length), or nullptr unless the whole range is
  // inside this buffer. A buffer holding no bytes has nothing to point at and
  // always yields nullptr.
  [[nodiscard]] const char *GetRange(uint64_t offset, uint64_t length) const;
};

std::ostream &operator<<(std::ostream &out, const RangeBuffer &buffer);

}  // namespace rangecache

#endif  // RANGECACHE_SRC_BUFFERS_INCLUDE_RANGECACHE_BUFFERS_RANGE_BUFFER_H
