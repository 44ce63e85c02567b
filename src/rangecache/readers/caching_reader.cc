#include <gflags/gflags.h>
#include <glog/logging.h>
#include <ky/checked_math.h>
#include <rangecache/readers/caching_reader.h>
#include <rangecache/sources/errors.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

DEFINE_uint32(  // NOLINT
    rangecache_chunk_size,
    8 * 1024,
    "minimum number of bytes a caching reader requests from its source");

namespace rangecache {

CachingReader::CachingReader(
    std::streamsize chunk_size,
    std::unique_ptr<Source> source)
    : source_(std::move(source)),
      chunk_size_(chunk_size) {
  CHECK(source_) << "a caching reader needs a source";
  CHECK_GE(chunk_size_, 0);
}

std::unique_ptr<CachingReader> CachingReader::Create(
    std::unique_ptr<Source> source) {
  return Create(FLAGS_rangecache_chunk_size, std::move(source));
}

std::unique_ptr<CachingReader> CachingReader::Create(
    std::streamsize chunk_size,
    std::unique_ptr<Source> source) {
  return std::make_unique<CachingReader>(chunk_size, std::move(source));
}

std::streamsize CachingReader::Fetch(std::streamsize at_least) {
  auto physical = source_->Tell();
  int64_t delta = 0;
  if (!ky::CheckedDistance(physical, cursor_, delta)) {
    throw SeekOverflowError(
        "cursor " + std::to_string(cursor_) + " too far from source position " +
        std::to_string(physical));
  }
  if (delta != 0) {
    source_->Seek(delta, std::ios::cur);
  }

  auto buffer = std::vector<char>(std::max(at_least, chunk_size_));
  auto count =
      source_->Read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
  fetches_++;
  fetched_bytes_ += count;
  VLOG(1) << "fetched " << count << " of " << buffer.size() << " bytes at "
          << cursor_;

  // an empty read cannot satisfy anything, keep it out of the cache
  if (count > 0) {
    cache_.Add(cursor_, buffer.data(), count);
  }
  return count;
}

void CachingReader::CopyOut(
    const char *data,
    void *buffer,
    std::streamsize size) {
  if (size > 0) {
    memcpy(buffer, data, size);
  }
  cursor_ += size;
}

std::streamsize CachingReader::Read(void *buffer, std::streamsize size) {
  CHECK(source_) << "reader used after Release()";
  if (size < 0) {
    throw std::invalid_argument(
        "negative read size " + std::to_string(size));
  }

  const auto *data = cache_.Find(cursor_, size);
  if (data != nullptr) {
    cache_hits_++;
    VLOG(2) << "cache hit for " << size << " bytes at " << cursor_;
    CopyOut(data, buffer, size);
    return Source::Read(buffer, size);
  }

  cache_misses_++;
  auto count = std::min(Fetch(size), size);
  if (count < size) {
    short_reads_++;
    VLOG(1) << "end of data, " << count << " of " << size << " bytes at "
            << cursor_;
  }
  if (count == 0) {
    return Source::Read(buffer, 0);
  }

  // the fetched bytes start at the cursor, so they are now inside one entry
  data = cache_.Find(cursor_, count);
  CHECK(data != nullptr) << "fetched range at " << cursor_ << " not cached";
  CopyOut(data, buffer, count);
  return Source::Read(buffer, count);
}

uint64_t CachingReader::Seek(std::streamoff offset, std::ios::seekdir whence) {
  CHECK(source_) << "reader used after Release()";

  switch (whence) {
    case std::ios::beg:
      if (offset < 0) {
        throw std::invalid_argument(
            "negative seek position " + std::to_string(offset));
      }
      cursor_ = static_cast<uint64_t>(offset);
      break;
    case std::ios::cur:
      if (!ky::CheckedAdd(cursor_, offset, cursor_)) {
        throw SeekOverflowError(
            "seek by " + std::to_string(offset) + " from " +
            std::to_string(cursor_) + " overflows");
      }
      break;
    case std::ios::end:
      // the length is only known to the source
      cursor_ = source_->Seek(offset, std::ios::end);
      break;
    default:
      LOG(FATAL) << "unknown seek direction " << whence;
  }
  return cursor_;
}

std::unique_ptr<Source> CachingReader::Release() {
  CHECK(source_) << "reader already released";
  VLOG(1) << "releasing source, dropping " << cache_.GetBuffers().size()
          << " cached ranges with " << cache_.GetCachedBytes() << " bytes";
  cache_.Clear();
  return std::move(source_);
}

const RangeCache &CachingReader::GetCache() const { return cache_; }

std::streamsize CachingReader::GetChunkSize() const { return chunk_size_; }

void CachingReader::Accept(ky::metrics::MetricVisitor &visitor) {
  Source::Accept(visitor);
  VISIT_METRICS(cache_hits_);
  VISIT_METRICS(cache_misses_);
  VISIT_METRICS(fetches_);
  VISIT_METRICS(fetched_bytes_);
  VISIT_METRICS(short_reads_);
  visitor.Visit("cache", cache_);
  if (source_) {
    visitor.Visit("source", *source_);
  }
}

}  // namespace rangecache
