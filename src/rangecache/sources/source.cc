#include <glog/logging.h>
#include <ky/checked_math.h>
#include <rangecache/sources/errors.h>
#include <rangecache/sources/file_source.h>
#include <rangecache/sources/http_source.h>
#include <rangecache/sources/source.h>

#include <filesystem>
#include <stdexcept>
#include <string>

namespace rangecache {

namespace fs = std::filesystem;

static constexpr std::streamsize kReadToEndChunk = 64 * 1024;

std::streamsize Source::Read(void * /*buffer*/, std::streamsize size) {
  total_reads_++;
  total_bytes_read_ += size;
  return size;
}

uint64_t Source::Tell() { return Seek(0, std::ios::cur); }

void Source::ReadExact(void *buffer, std::streamsize size) {
  auto *current = static_cast<char *>(buffer);
  while (size > 0) {
    auto count = Read(current, size);
    if (count == 0) {
      throw SourceError(
          "unexpected end of data, " + std::to_string(size) +
          " bytes missing");
    }
    current += count;
    size -= count;
  }
}

std::streamsize Source::ReadToEnd(std::vector<char> &output) {
  std::streamsize total = 0;
  for (;;) {
    auto offset = output.size();
    output.resize(offset + kReadToEndChunk);
    auto count = Read(output.data() + offset, kReadToEndChunk);
    output.resize(offset + count);
    if (count == 0) {
      return total;
    }
    total += count;
  }
}

uint64_t Source::Offset(uint64_t base, std::streamoff offset) {
  uint64_t result = 0;
  if (!ky::CheckedAdd(base, offset, result)) {
    throw SourceError(
        "invalid seek by " + std::to_string(offset) + " from " +
        std::to_string(base));
  }
  return result;
}

void Source::Accept(ky::metrics::MetricVisitor &visitor) {
  VISIT_METRICS(total_reads_);
  VISIT_METRICS(total_bytes_read_);
}

std::unique_ptr<Source> Source::Create(const std::string &uri) {
  if (uri.starts_with("http://") || uri.starts_with("https://")) {
    return std::make_unique<HttpSource>(uri);
  }

  std::string file = "file://";
  if (uri.starts_with(file)) {
    auto path = uri.substr(file.size());

    if (!fs::exists(path)) {
      LOG(ERROR) << "path '" << path << "' not found";
      throw std::invalid_argument(uri);
    }

    return std::make_unique<FileSource>(path);
  }

  LOG(ERROR) << "unknown protocol for uri=" << uri;
  throw std::invalid_argument(uri);
}

}  // namespace rangecache
