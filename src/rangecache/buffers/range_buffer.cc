#include <glog/logging.h>
#include <ky/checked_math.h>
#include <rangecache/buffers/range_buffer.h>

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <limits>
#include <utility>

namespace rangecache {

static uint64_t EndOf(uint64_t start, uint64_t size) {
  CHECK_LE(size, std::numeric_limits<uint64_t>::max() - start)
      << "range starting at " << start << " overflows";
  return start + size;
}

RangeBuffer::RangeBuffer(uint64_t start, uint64_t end)
    : start_(start),
      end_(end) {
  CHECK_LT(start_, end_) << "buffer must represent a valid range";
  data_.resize(ky::SafeCast<size_t>(end_ - start_));
}

RangeBuffer::RangeBuffer(uint64_t start, const void *data, uint64_t size)
    : start_(start),
      end_(EndOf(start, size)),
      data_(ky::SafeCast<size_t>(size)) {
  if (size > 0) {
    memcpy(data_.data(), data, data_.size());
  }
}

RangeBuffer::RangeBuffer(uint64_t start, std::vector<char> &&data)
    : start_(start),
      end_(EndOf(start, data.size())),
      data_(std::move(data)) {}

bool RangeBuffer::Overlaps(const RangeBuffer &other) const {
  return start_ <= other.end_ && other.start_ <= end_;
}

RangeBuffer RangeBuffer::Merge(RangeBuffer &&other) && {
  CHECK(Overlaps(other)) << "buffers do not overlap: " << *this << " and "
                         << other;

  auto start = std::min(start_, other.start_);
  auto end = std::max(end_, other.end_);
  if (start == end) {
    // both are empty and sit at the same offset
    return RangeBuffer(start, std::vector<char>());
  }

  auto merged = RangeBuffer(start, end);
  std::copy(
      data_.begin(),
      data_.end(),
      merged.data_.begin() + ky::SafeCast<std::ptrdiff_t>(start_ - start));
  std::copy(
      other.data_.begin(),
      other.data_.end(),
      merged.data_.begin() +
          ky::SafeCast<std::ptrdiff_t>(other.start_ - start));

  return merged;
}

bool RangeBuffer::ContainsRange(uint64_t offset, uint64_t length) const {
  return start_ <= offset && offset <= end_ && length <= end_ - offset;
}

const char *RangeBuffer::GetRange(uint64_t offset, uint64_t length) const {
  if (!ContainsRange(offset, length)) {
    return nullptr;
  }
  return data_.data() + (offset - start_);
}

std::ostream &operator<<(std::ostream &out, const RangeBuffer &buffer) {
  return out << "[" << buffer.GetStart() << ", " << buffer.GetEnd() << ")";
}

}  // namespace rangecache
