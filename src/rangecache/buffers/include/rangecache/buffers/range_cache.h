#ifndef RANGECACHE_SRC_BUFFERS_INCLUDE_RANGECACHE_BUFFERS_RANGE_CACHE_H
#define RANGECACHE_SRC_BUFFERS_INCLUDE_RANGECACHE_BUFFERS_RANGE_CACHE_H

#include <ky/metrics/metrics.h>
#include <rangecache/buffers/range_buffer.h>

#include <cstdint>
#include <vector>

namespace rangecache {

/***
 * Unbounded collection of cached source ranges.
 *
 * After every `Add` no two entries overlap or touch. Entries are kept in the
 * order they survived insertion, the latest coalesced entry last, and lookups
 * scan them linearly returning the first entry that fully covers a request.
 */
class RangeCache final : public ky::metrics::MetricContainer {
  std::vector<RangeBuffer> buffers_;

  ky::metrics::Metric insertions_{};
  ky::metrics::Metric merges_{};

public:
  // Inserts bytes that start at `offset`, folding every entry that overlaps or
  // touches them into a single entry. In regions covered by both, bytes already
  // in the cache win over the new ones.
  void Add(uint64_t offset, const void *data, uint64_t size);

  [[nodiscard]] const char *Find(uint64_t offset, uint64_t length) const;

  [[nodiscard]] const std::vector<RangeBuffer> &GetBuffers() const;

  [[nodiscard]] uint64_t GetCachedBytes() const;

  void Clear();

  void Accept(ky::metrics::MetricVisitor &visitor) override;
};

}  // namespace rangecache

#endif  // RANGECACHE_SRC_BUFFERS_INCLUDE_RANGECACHE_BUFFERS_RANGE_CACHE_H
