#include <gflags/gflags.h>
#include <glog/logging.h>
#include <ky/metrics/metric_callback_visitor.h>
#include <ky/noexcept.h>
#include <rangecache/readers/caching_reader.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

DEFINE_string(uri, "", "file://<path> or http(s)://<host>/<path>");  // NOLINT
DEFINE_string(  // NOLINT
    ranges,
    "",
    "comma separated <offset>:<length> pairs, read in order");
DEFINE_string(output_filename, "", "where the bytes read are written");  // NOLINT

static std::vector<std::pair<std::streamoff, std::streamsize>> ParseRanges(
    const std::string &ranges) {
  std::vector<std::pair<std::streamoff, std::streamsize>> result;
  std::stringstream s(ranges);
  std::string item;
  while (std::getline(s, item, ',')) {
    auto colon = item.find(':');
    if (colon == std::string::npos) {
      throw std::invalid_argument("range '" + item + "' is not offset:length");
    }
    auto offset = std::stoll(item.substr(0, colon), nullptr, 10);
    auto length = std::stoll(item.substr(colon + 1), nullptr, 10);
    if (offset < 0 || length < 0) {
      throw std::invalid_argument("range '" + item + "' is negative");
    }
    result.emplace_back(offset, length);
  }
  return result;
}

int main(int argc, char **argv) {
  google::InitGoogleLogging(argv[0]);
  gflags::SetUsageMessage(
      "rangecache_extract --uri=<uri> --ranges=<offset>:<length>,... "
      "--output_filename=<file>");
  gflags::SetVersionString("v0.1");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  FLAGS_logtostderr = true;
  FLAGS_colorlogtostderr = true;

  return ky::NoExcept([]() {
    if (FLAGS_uri.empty() || FLAGS_output_filename.empty()) {
      LOG(ERROR) << "--uri and --output_filename are required";
      return 1;
    }

    auto output = std::ofstream(FLAGS_output_filename, std::ios::binary);
    CHECK(output) << "unable to write to " << FLAGS_output_filename;

    auto reader = rangecache::CachingReader::Create(
        rangecache::Source::Create(FLAGS_uri));

    std::vector<char> buffer;
    for (const auto &[offset, length] : ParseRanges(FLAGS_ranges)) {
      buffer.resize(length);
      reader->Seek(offset, std::ios::beg);
      auto count = reader->Read(buffer.data(), length);
      if (count < length) {
        LOG(WARNING) << "only " << count << " of " << length
                     << " bytes available at " << offset;
      }
      output.write(buffer.data(), count);
      CHECK(output) << "unable to write to " << FLAGS_output_filename;
    }

    auto metrics = ky::metrics::MetricCallbackVisitor("reader").Collect(*reader);
    for (const auto &[key, value] : metrics) {
      LOG(INFO) << key << " = " << value;
    }
    return 0;
  });
}
