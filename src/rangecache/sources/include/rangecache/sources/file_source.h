#ifndef RANGECACHE_SRC_SOURCES_INCLUDE_RANGECACHE_SOURCES_FILE_SOURCE_H
#define RANGECACHE_SRC_SOURCES_INCLUDE_RANGECACHE_SOURCES_FILE_SOURCE_H

#include <rangecache/sources/source.h>

#include <filesystem>
#include <fstream>

namespace rangecache {

class FileSource final : public Source {
  std::filesystem::path path_;
  std::ifstream data_;

public:
  explicit FileSource(const std::filesystem::path &path);

  std::streamsize Read(void *buffer, std::streamsize size) override;

  uint64_t Seek(std::streamoff offset, std::ios::seekdir whence) override;
};

}  // namespace rangecache

#endif  // RANGECACHE_SRC_SOURCES_INCLUDE_RANGECACHE_SOURCES_FILE_SOURCE_H
