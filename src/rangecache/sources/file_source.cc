#include <glog/logging.h>
#include <rangecache/sources/errors.h>
#include <rangecache/sources/file_source.h>

#include <string>

namespace rangecache {

FileSource::FileSource(const std::filesystem::path &path)
    : path_(path),
      data_(std::ifstream(path, std::ios::binary)) {
  if (!data_) {
    LOG(ERROR) << "unable to open " << path_ << " for reading";
    throw SourceError("unable to open " + path_.string());
  }
}

std::streamsize FileSource::Read(void *buffer, std::streamsize size) {
  CHECK_GE(size, 0);

  data_.read(static_cast<char *>(buffer), size);
  if (data_.bad()) {
    throw SourceError("failed reading " + path_.string());
  }
  auto count = data_.gcount();

  // a short read sets eof and fail, neither of which is an error here and both
  // of which would make the next seekg fail
  data_.clear();

  return Source::Read(buffer, count);
}

uint64_t FileSource::Seek(std::streamoff offset, std::ios::seekdir whence) {
  // the seekg was failing if the eof bit was set... :(
  // according to https://devdocs.io/cpp/io/basic_istream/seekg this should
  // not happen since C++11, which is supposed to clear the eof bit, but alas
  data_.clear();

  data_.seekg(offset, whence);
  auto position = data_.tellg();
  if (!data_ || position < 0) {
    data_.clear();
    throw SourceError(
        "invalid seek by " + std::to_string(offset) + " in " +
        path_.string());
  }
  return static_cast<uint64_t>(position);
}

}  // namespace rangecache
