#include <glog/logging.h>
#include <rangecache/sources/memory_source.h>

#include <algorithm>
#include <cstring>
#include <utility>

namespace rangecache {

MemorySource::MemorySource(std::vector<char> data) : data_(std::move(data)) {}

std::streamsize MemorySource::Read(void *buffer, std::streamsize size) {
  CHECK_GE(size, 0);

  std::streamsize count = 0;
  if (position_ < data_.size()) {
    auto available = data_.size() - position_;
    count = static_cast<std::streamsize>(
        std::min<uint64_t>(available, static_cast<uint64_t>(size)));
  }

  if (count > 0) {
    memcpy(buffer, data_.data() + position_, count);
    position_ += count;
  }

  // make sure the metrics are captured!
  return Source::Read(buffer, count);
}

uint64_t MemorySource::Seek(std::streamoff offset, std::ios::seekdir whence) {
  switch (whence) {
    case std::ios::beg:
      position_ = Offset(0, offset);
      break;
    case std::ios::cur:
      position_ = Offset(position_, offset);
      break;
    case std::ios::end:
      position_ = Offset(data_.size(), offset);
      break;
    default:
      LOG(FATAL) << "unknown seek direction " << whence;
  }
  return position_;
}

const std::vector<char> &MemorySource::GetData() const { return data_; }

}  // namespace rangecache
