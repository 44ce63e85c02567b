#include <glog/logging.h>
#include <httplib.h>
#include <rangecache/test_http_servers/http_server.h>

#include <sstream>
#include <utility>

namespace rangecache {

namespace fs = std::filesystem;

void HttpServer::Logger(
    const httplib::Request &req,
    const httplib::Response &res) {
  requests_++;
  if (req.method == "HEAD") {
    head_requests_++;
  }
  if (req.has_header("Range")) {
    range_requests_++;
  }

  if (log_headers_) {
    std::stringstream s;
    s << req.method << " " << req.path << " -> " << res.status << std::endl;
    s << "--- Request Headers ---" << std::endl;
    for (const auto &x : req.headers) {
      s << x.first << " " << x.second << std::endl;
    }
    s << "--- Response Headers ---" << std::endl;
    for (const auto &x : res.headers) {
      s << x.first << " " << x.second << std::endl;
    }
    LOG(INFO) << s.str();
  }
}

void HttpServer::Start() {
  CHECK(server_->set_mount_point("/", root_.string()))
      << "unable to serve " << root_;

  server_->set_logger([this](const auto &req, const auto &res) {
    Logger(req, res);
  });

  // binding here means the socket is already listening once the constructor
  // returns, so early requests queue up instead of failing
  port_ = server_->bind_to_any_port("localhost");
  CHECK_GT(port_, 0) << "unable to bind";

  thread_ = std::thread([this]() { server_->listen_after_bind(); });
  VLOG(1) << "serving " << root_ << " on port " << port_;
}

HttpServer::HttpServer(fs::path root, bool log_headers)
    : root_(std::move(root)),
      log_headers_(log_headers),
      server_(std::make_unique<httplib::Server>()) {
  Start();
}

HttpServer::~HttpServer() { Stop(); }

int HttpServer::GetPort() const { return port_; }

std::string HttpServer::GetUrl(const std::string &name) const {
  return "http://localhost:" + std::to_string(port_) + "/" + name;
}

void HttpServer::Stop() {
  if (thread_.joinable()) {
    server_->stop();
    thread_.join();
  }
}

void HttpServer::Accept(ky::metrics::MetricVisitor &visitor) {
  VISIT_METRICS(requests_);
  VISIT_METRICS(range_requests_);
  VISIT_METRICS(head_requests_);
}

}  // namespace rangecache
