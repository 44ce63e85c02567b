#ifndef RANGECACHE_SRC_SOURCES_INCLUDE_RANGECACHE_SOURCES_MEMORY_SOURCE_H
#define RANGECACHE_SRC_SOURCES_INCLUDE_RANGECACHE_SOURCES_MEMORY_SOURCE_H

#include <rangecache/sources/source.h>

#include <vector>

namespace rangecache {

// Owns its bytes. Positions past the end are valid and read nothing.
class MemorySource final : public Source {
  std::vector<char> data_;
  uint64_t position_{};

public:
  explicit MemorySource(std::vector<char> data);

  std::streamsize Read(void *buffer, std::streamsize size) override;

  uint64_t Seek(std::streamoff offset, std::ios::seekdir whence) override;

  [[nodiscard]] const std::vector<char> &GetData() const;
};

}  // namespace rangecache

#endif  // RANGECACHE_SRC_SOURCES_INCLUDE_RANGECACHE_SOURCES_MEMORY_SOURCE_H
