#ifndef RANGECACHE_SRC_SOURCES_INCLUDE_RANGECACHE_SOURCES_HTTP_SOURCE_H
#define RANGECACHE_SRC_SOURCES_INCLUDE_RANGECACHE_SOURCES_HTTP_SOURCE_H

#include <rangecache/sources/source.h>

#include <memory>
#include <string>

namespace httplib {
class Client;
}  // namespace httplib

namespace rangecache {

/***
 * A remote file read with one `Range` GET per `Read`.
 *
 * Seeking from the end needs the size of the resource, which is obtained with
 * a HEAD request the first time it is needed.
 */
class HttpSource final : public Source {
  std::string host_;
  std::string path_;
  std::unique_ptr<httplib::Client> client_;
  uint64_t position_{};
  bool has_size_{};
  uint64_t size_{};

  uint64_t GetSize();

public:
  explicit HttpSource(const std::string &url);

  ~HttpSource() override;

  std::streamsize Read(void *buffer, std::streamsize size) override;

  uint64_t Seek(std::streamoff offset, std::ios::seekdir whence) override;
};

}  // namespace rangecache

#endif  // RANGECACHE_SRC_SOURCES_INCLUDE_RANGECACHE_SOURCES_HTTP_SOURCE_H
