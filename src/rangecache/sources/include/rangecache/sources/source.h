#ifndef RANGECACHE_SRC_SOURCES_INCLUDE_RANGECACHE_SOURCES_SOURCE_H
#define RANGECACHE_SRC_SOURCES_INCLUDE_RANGECACHE_SOURCES_SOURCE_H

#include <ky/metrics/metrics.h>

#include <cstdint>
#include <ios>
#include <memory>
#include <string>
#include <vector>

namespace rangecache {

/***
 * A seekable byte source.
 *
 * `Read` reads at the current position and advances it. It returns fewer bytes
 * than requested only when the end of the data is reached. Failures are
 * reported by throwing `SourceError`.
 */
class Source : public ky::metrics::MetricContainer {
  ky::metrics::Metric total_reads_{};
  ky::metrics::Metric total_bytes_read_{};

public:
  ~Source() override = default;

  // Implementations call this with the count they actually read so that the
  // metrics are captured.
  virtual std::streamsize Read(void *buffer, std::streamsize size);

  // Returns the new position.
  virtual uint64_t Seek(std::streamoff offset, std::ios::seekdir whence) = 0;

  uint64_t Tell();

  void ReadExact(void *buffer, std::streamsize size);

  // Appends everything up to the end of the data, returns the count appended.
  std::streamsize ReadToEnd(std::vector<char> &output);

  void Accept(ky::metrics::MetricVisitor &visitor) override;

  // file://<path>, http://<host>/<path> or https://<host>/<path>
  static std::unique_ptr<Source> Create(const std::string &uri);

protected:
  // `base + offset`, throwing SourceError if that is not a valid position.
  static uint64_t Offset(uint64_t base, std::streamoff offset);
};

}  // namespace rangecache

#endif  // RANGECACHE_SRC_SOURCES_INCLUDE_RANGECACHE_SOURCES_SOURCE_H
