#pragma once

#include <asio.hpp>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "log.hpp"
#include "signal.hpp"

// httplib::Server bound to the lifetime rules shared by the sender and the
// receiver. Handlers run on httplib's worker threads; server_started and
// server_stopped fire on the io_context thread.
class HttpServer : public std::enable_shared_from_this<HttpServer> {
public:
  struct Options {
    std::chrono::milliseconds shutdown_grace{1000};
    // Per-call socket read/write timeout. A connection stuck mid-request is
    // dropped once this expires, even after stop() has already resolved.
    std::chrono::seconds io_timeout{5};
    std::string bind_address = "0.0.0.0";
    std::size_t worker_threads = 8;
  };

  static std::shared_ptr<HttpServer> create(asio::io_context& io,
                                            std::shared_ptr<Logger> logger,
                                            Options options);
  ~HttpServer();

  // Register handlers here before start().
  httplib::Server& routes() { return http_; }

  // Binds, starts the listener thread and returns once it accepts.
  // Port 0 lets the OS choose. Throws HowlError(Configuration) when the port
  // cannot be bound.
  std::uint16_t start(std::uint16_t port);

  // Closes the listener and lets in-flight requests finish. on_stopped runs
  // on the io thread once every worker is done or shutdown_grace has passed,
  // whichever comes first. Safe to call repeatedly.
  void stop(std::function<void()> on_stopped = {});

  bool running() const { return running_.load(); }
  // Streaming callbacks check this to give up early.
  bool stopping() const { return stopping_.load(); }
  std::uint16_t port() const { return port_.load(); }
  asio::io_context& io() { return io_; }

  Signal<std::uint16_t> server_started;
  Signal<> server_stopped;

private:
  HttpServer(asio::io_context& io, std::shared_ptr<Logger> logger, Options options);

  void configure();
  void begin_stop(std::function<void()> on_stopped);
  void finish_stop();

  asio::io_context& io_;
  std::shared_ptr<Logger> logger_;
  Options options_;
  httplib::Server http_;
  std::thread listener_;
  asio::steady_timer grace_timer_;
  std::vector<std::function<void()>> stop_callbacks_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stopping_{false};
  std::atomic<std::uint16_t> port_{0};
  bool started_ = false;
  bool stopped_ = false;
};

void reply_json(httplib::Response& res, int status, const nlohmann::json& body);
// {"success": false, "message": ...}
void reply_error(httplib::Response& res, int status, const std::string& message);

// Reads a small non-multipart body. Throws HowlError(Client) when the body
// exceeds limit or the connection drops first.
std::string read_request_body(const httplib::Request& req,
                              const httplib::ContentReader& reader,
                              std::size_t limit);

// Consumes the body of a request that is about to be rejected so the reply
// is not cut off by a reset. Returns false if the body ended early or
// exceeded limit.
bool discard_request_body(const httplib::Request& req,
                          const httplib::ContentReader& reader,
                          std::uint64_t limit = 64ull * 1024 * 1024);

// Adapts a member handler. Requests that arrive after the owner is gone get
// a 503.
template<typename Owner>
httplib::Server::Handler bind_route(std::weak_ptr<Owner> weak,
                                    void (Owner::*method)(const httplib::Request&, httplib::Response&)) {
  return [weak, method](const httplib::Request& req, httplib::Response& res){
    auto self = weak.lock();
    if(!self) {
      reply_error(res, 503, "Server is shutting down");
      return;
    }
    ((*self).*method)(req, res);
  };
}

template<typename Owner>
httplib::Server::HandlerWithContentReader bind_route(
    std::weak_ptr<Owner> weak,
    void (Owner::*method)(const httplib::Request&, httplib::Response&, const httplib::ContentReader&)) {
  return [weak, method](const httplib::Request& req, httplib::Response& res, const httplib::ContentReader& reader){
    auto self = weak.lock();
    if(!self) {
      if(!discard_request_body(req, reader)) res.set_header("Connection", "close");
      reply_error(res, 503, "Server is shutting down");
      return;
    }
    ((*self).*method)(req, res, reader);
  };
}
