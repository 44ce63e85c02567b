#ifndef RANGECACHE_SRC_TEST_HTTP_SERVERS_HTTP_SERVER_H
#define RANGECACHE_SRC_TEST_HTTP_SERVERS_HTTP_SERVER_H

#include <ky/metrics/metrics.h>

#include <filesystem>
#include <memory>
#include <string>
#include <thread>

namespace httplib {
class Server;
class Request;
class Response;
}  // namespace httplib

namespace rangecache {

/***
 * Serves the files under `root` on a local port until stopped.
 */
class HttpServer final : public ky::metrics::MetricContainer {
  std::filesystem::path root_;
  int port_{};
  bool log_headers_;
  std::unique_ptr<httplib::Server> server_;
  std::thread thread_;

  ky::metrics::Metric requests_{};
  ky::metrics::Metric range_requests_{};
  ky::metrics::Metric head_requests_{};

  void Logger(const httplib::Request &req, const httplib::Response &res);
  void Start();

public:
  HttpServer(std::filesystem::path root, bool log_headers);

  HttpServer(const HttpServer &) = delete;
  HttpServer &operator=(const HttpServer &) = delete;

  ~HttpServer() override;

  [[nodiscard]] int GetPort() const;

  // http://localhost:<port>/<name>
  [[nodiscard]] std::string GetUrl(const std::string &name) const;

  void Stop();

  void Accept(ky::metrics::MetricVisitor &visitor) override;
};

}  // namespace rangecache

#endif  // RANGECACHE_SRC_TEST_HTTP_SERVERS_HTTP_SERVER_H
