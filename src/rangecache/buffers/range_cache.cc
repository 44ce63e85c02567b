#include <glog/logging.h>
#include <rangecache/buffers/range_cache.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace rangecache {

void RangeCache::Add(uint64_t offset, const void *data, uint64_t size) {
  auto candidate = RangeBuffer(offset, data, size);
  insertions_++;

  auto overlapping = std::stable_partition(
      buffers_.begin(),
      buffers_.end(),
      [&candidate](const RangeBuffer &buffer) {
        return !buffer.Overlaps(candidate);
      });

  // the candidate is the accumulator, so each cached buffer overwrites it
  for (auto i = overlapping; i != buffers_.end(); ++i) {
    VLOG(2) << "coalescing " << *i << " into " << candidate;
    candidate = std::move(candidate).Merge(std::move(*i));
    merges_++;
  }
  buffers_.erase(overlapping, buffers_.end());

  VLOG(1) << "cached " << candidate << ", " << buffers_.size() + 1
          << " entries";
  buffers_.push_back(std::move(candidate));
}

const char *RangeCache::Find(uint64_t offset, uint64_t length) const {
  for (const auto &buffer : buffers_) {
    const auto *data = buffer.GetRange(offset, length);
    if (data != nullptr) {
      return data;
    }
  }
  return nullptr;
}

const std::vector<RangeBuffer> &RangeCache::GetBuffers() const {
  return buffers_;
}

uint64_t RangeCache::GetCachedBytes() const {
  uint64_t total = 0;
  for (const auto &buffer : buffers_) {
    total += buffer.GetSize();
  }
  return total;
}

void RangeCache::Clear() { buffers_.clear(); }

void RangeCache::Accept(ky::metrics::MetricVisitor &visitor) {
  VISIT_METRICS(insertions_);
  VISIT_METRICS(merges_);
}

}  // namespace rangecache
