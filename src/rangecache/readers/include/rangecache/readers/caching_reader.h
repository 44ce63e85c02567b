#ifndef RANGECACHE_SRC_READERS_INCLUDE_RANGECACHE_READERS_CACHING_READER_H
#define RANGECACHE_SRC_READERS_INCLUDE_RANGECACHE_READERS_CACHING_READER_H

#include <gflags/gflags.h>
#include <ky/metrics/metrics.h>
#include <rangecache/buffers/range_cache.h>
#include <rangecache/sources/source.h>

#include <cstdint>
#include <memory>

DECLARE_uint32(rangecache_chunk_size);

namespace rangecache {

/***
 * Wraps a source and keeps every byte it ever fetched from it, so that reading
 * a region again never touches the source.
 *
 * The position seen by callers is a logical cursor. The source is only moved
 * when data has to be fetched (a relative seek brings it to the cursor first)
 * or when seeking from the end, which needs the source to know where the end
 * is. A read that is not fully inside one cached entry fetches the whole
 * requested span again, at least `chunk_size` bytes of it.
 *
 * At the end of the data a read returns fewer bytes than requested, zero once
 * the cursor is at or past the end.
 *
 * Not thread safe. The cache is never trimmed.
 */
class CachingReader final : public Source {
  std::unique_ptr<Source> source_;
  RangeCache cache_;
  uint64_t cursor_{};
  std::streamsize chunk_size_;

  ky::metrics::Metric cache_hits_{};
  ky::metrics::Metric cache_misses_{};
  ky::metrics::Metric fetches_{};
  ky::metrics::Metric fetched_bytes_{};
  ky::metrics::Metric short_reads_{};

  // Reads at least `at_least` bytes at the cursor into the cache and returns
  // the count actually read.
  std::streamsize Fetch(std::streamsize at_least);

  void CopyOut(const char *data, void *buffer, std::streamsize size);

public:
  CachingReader(std::streamsize chunk_size, std::unique_ptr<Source> source);

  // Chunk size taken from --rangecache_chunk_size.
  static std::unique_ptr<CachingReader> Create(std::unique_ptr<Source> source);

  static std::unique_ptr<CachingReader> Create(
      std::streamsize chunk_size,
      std::unique_ptr<Source> source);

  std::streamsize Read(void *buffer, std::streamsize size) override;

  // `beg` and `cur` only move the cursor, `end` is resolved by the source.
  // Throws SeekOverflowError when a `cur` seek leaves [0, 2^64).
  uint64_t Seek(std::streamoff offset, std::ios::seekdir whence) override;

  // Gives the source back and drops the cache. The source is left wherever the
  // last fetch put it, not necessarily at the cursor. The reader cannot be used
  // afterwards.
  std::unique_ptr<Source> Release();

  [[nodiscard]] const RangeCache &GetCache() const;

  [[nodiscard]] std::streamsize GetChunkSize() const;

  void Accept(ky::metrics::MetricVisitor &visitor) override;
};

}  // namespace rangecache

#endif  // RANGECACHE_SRC_READERS_INCLUDE_RANGECACHE_READERS_CACHING_READER_H
