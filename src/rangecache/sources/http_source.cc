#include <glog/logging.h>
#include <httplib.h>
#include <ky/checked_math.h>
#include <rangecache/sources/errors.h>
#include <rangecache/sources/http_source.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>

namespace rangecache {

static constexpr int kOk = 200;
static constexpr int kPartialContent = 206;
static constexpr int kRangeNotSatisfiable = 416;

HttpSource::HttpSource(const std::string &url) {
  auto pos = url.find("//");
  if (pos == std::string::npos) {
    throw std::invalid_argument(url);
  }
  pos = url.find('/', pos + 2);
  if (pos == std::string::npos) {
    throw std::invalid_argument(url);
  }

  host_ = url.substr(0, pos);
  path_ = url.substr(pos);

  client_ = std::make_unique<httplib::Client>(host_);
  client_->set_keep_alive(true);
}

HttpSource::~HttpSource() = default;

uint64_t HttpSource::GetSize() {
  if (has_size_) {
    return size_;
  }

  auto res = client_->Head(path_);
  if (!res) {
    throw SourceError(
        "HEAD " + host_ + path_ + " failed: " + httplib::to_string(res.error()));
  }
  if (res->status != kOk || !res->has_header("Content-Length")) {
    throw SourceError(
        "HEAD " + host_ + path_ + " returned " + std::to_string(res->status) +
        " without a content length");
  }

  size_ = std::stoull(res->get_header_value("Content-Length"), nullptr, 10);
  has_size_ = true;
  VLOG(1) << host_ << path_ << " has " << size_ << " bytes";
  return size_;
}

std::streamsize HttpSource::Read(void *buffer, std::streamsize size) {
  CHECK_GE(size, 0);
  if (size == 0) {
    return Source::Read(buffer, 0);
  }

  auto first = ky::SafeCast<ssize_t>(position_);
  auto last = ky::SafeCast<ssize_t>(position_ + size - 1);
  auto range_header = httplib::make_range_header({{first, last}});
  auto res = client_->Get(path_, {range_header});
  if (!res) {
    throw SourceError(
        "GET " + host_ + path_ + " failed: " + httplib::to_string(res.error()));
  }

  const char *body = res->body.data();
  std::streamsize count = 0;
  switch (res->status) {
    case kPartialContent:
      count = std::min<std::streamsize>(
          size,
          static_cast<std::streamsize>(res->body.size()));
      break;
    case kOk:
      // the server ignored the range and sent the whole resource
      if (position_ < res->body.size()) {
        body += position_;
        count = std::min<std::streamsize>(
            size,
            static_cast<std::streamsize>(res->body.size() - position_));
      }
      break;
    case kRangeNotSatisfiable:
      // nothing at or after the current position
      break;
    default:
      throw SourceError(
          "GET " + host_ + path_ + " returned " + std::to_string(res->status));
  }

  memcpy(buffer, body, count);
  position_ += count;
  return Source::Read(buffer, count);
}

uint64_t HttpSource::Seek(std::streamoff offset, std::ios::seekdir whence) {
  switch (whence) {
    case std::ios::beg:
      position_ = Offset(0, offset);
      break;
    case std::ios::cur:
      position_ = Offset(position_, offset);
      break;
    case std::ios::end:
      position_ = Offset(GetSize(), offset);
      break;
    default:
      LOG(FATAL) << "unknown seek direction " << whence;
  }
  return position_;
}

}  // namespace rangecache
