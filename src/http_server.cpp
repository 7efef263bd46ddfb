#include "http_server.hpp"

#include "errors.hpp"

#include <limits>

namespace {
constexpr std::uint64_t kMaxDrainBytes = 64ull * 1024 * 1024;
constexpr time_t kKeepAliveSeconds = 1;
}

void reply_json(httplib::Response& res, int status, const nlohmann::json& body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

void reply_error(httplib::Response& res, int status, const std::string& message) {
  reply_json(res, status, {{"success", false}, {"message", message}});
}

std::string read_request_body(const httplib::Request& req,
                              const httplib::ContentReader& reader,
                              std::size_t limit) {
  if(req.is_multipart_form_data()) {
    const bool drained = discard_request_body(req, reader);
    throw HowlError(ErrorKind::Client, drained ? "Unexpected multipart body" : "Incomplete request body");
  }
  std::string body;
  std::uint64_t received = 0;
  bool too_large = false;
  const bool complete = reader([&](const char* data, std::size_t size){
    received += size;
    if(received > limit) too_large = true;
    if(!too_large) body.append(data, size);
    return received <= kMaxDrainBytes;
  });
  if(too_large) throw HowlError(ErrorKind::Client, "Request body too large");
  if(!complete) throw HowlError(ErrorKind::Client, "Incomplete request body");
  return body;
}

bool discard_request_body(const httplib::Request& req,
                          const httplib::ContentReader& reader,
                          std::uint64_t limit) {
  std::uint64_t drained = 0;
  auto count = [&drained, limit](const char*, std::size_t size){
    drained += size;
    return drained <= limit;
  };
  if(req.is_multipart_form_data()) {
    return reader([&drained, limit](const httplib::MultipartFormData&){ return drained <= limit; }, count);
  }
  return reader(count);
}

std::shared_ptr<HttpServer> HttpServer::create(asio::io_context& io,
                                               std::shared_ptr<Logger> logger,
                                               Options options) {
  return std::shared_ptr<HttpServer>(new HttpServer(io, std::move(logger), std::move(options)));
}

HttpServer::HttpServer(asio::io_context& io, std::shared_ptr<Logger> logger, Options options)
  : io_(io),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("http")),
    options_(std::move(options)),
    grace_timer_(io) {}

HttpServer::~HttpServer() {
  stopping_ = true;
  if(http_.is_running()) http_.stop();
  if(listener_.joinable()) listener_.join();
}

void HttpServer::configure() {
  const auto workers = options_.worker_threads > 0 ? options_.worker_threads : 1;
  http_.new_task_queue = [workers]{ return new httplib::ThreadPool(workers); };

  // Explicit so a second server on the same port fails to bind.
  http_.set_socket_options([](socket_t sock){
    int yes = 1;
    ::setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&yes), sizeof(yes));
  });

  http_.set_payload_max_length(std::numeric_limits<std::size_t>::max());
  const auto timeout = static_cast<time_t>(options_.io_timeout.count());
  http_.set_read_timeout(timeout, 0);
  http_.set_write_timeout(timeout, 0);
  http_.set_keep_alive_timeout(kKeepAliveSeconds);

  auto logger = logger_;
  http_.set_logger([logger](const httplib::Request& req, const httplib::Response& res){
    logger->debug("{} {} {} -> {}", req.remote_addr, req.method, req.path, res.status);
  });

  http_.set_exception_handler([logger](const httplib::Request& req,
                                       httplib::Response& res,
                                       std::exception_ptr failure){
    try {
      std::rethrow_exception(failure);
    } catch(const HowlError& e) {
      if(e.http_status() >= 500) {
        logger->error("{} {} failed: {}", req.method, req.path, e.what());
      }
      reply_error(res, e.http_status(), e.what());
    } catch(const std::exception& e) {
      logger->error("Request error on {} {}: {}", req.method, req.path, e.what());
      reply_error(res, 500, "Internal server error");
    } catch(...) {
      logger->error("Unknown failure on {} {}", req.method, req.path);
      reply_error(res, 500, "Internal server error");
    }
  });

  // Statuses httplib produces on its own (404 routing, 416 bad range, 413)
  // get the same JSON shape as handler errors.
  http_.set_error_handler([](const httplib::Request&, httplib::Response& res){
    if(!res.body.empty()) return;
    reply_error(res, res.status, httplib::status_message(res.status));
  });
}

std::uint16_t HttpServer::start(std::uint16_t port) {
  if(started_) {
    throw HowlError(ErrorKind::Configuration, "Server already started");
  }
  configure();

  int bound = -1;
  if(port == 0) {
    bound = http_.bind_to_any_port(options_.bind_address);
  } else if(http_.bind_to_port(options_.bind_address, port)) {
    bound = port;
  }
  if(bound <= 0) {
    throw HowlError(ErrorKind::Configuration,
                    fmt::format("Unable to listen on {}:{}", options_.bind_address, port));
  }
  port_ = static_cast<std::uint16_t>(bound);
  started_ = true;
  running_ = true;

  std::weak_ptr<HttpServer> weak = shared_from_this();
  listener_ = std::thread([this, weak]{
    if(!http_.listen_after_bind() && !stopping_) {
      logger_->warn("HTTP listener on port {} exited unexpectedly", port_.load());
    }
    // Every worker has been joined at this point.
    asio::post(io_, [weak]{
      if(auto self = weak.lock()) self->finish_stop();
    });
  });
  http_.wait_until_ready();
  logger_->info("HTTP server started on {}:{}", options_.bind_address, port_.load());

  asio::post(io_, [weak]{
    if(auto self = weak.lock()) self->server_started.emit(self->port_.load());
  });
  return port_;
}

void HttpServer::stop(std::function<void()> on_stopped) {
  auto self = shared_from_this();
  asio::post(io_, [self, on_stopped = std::move(on_stopped)]() mutable {
    self->begin_stop(std::move(on_stopped));
  });
}

void HttpServer::begin_stop(std::function<void()> on_stopped) {
  if(stopped_) {
    if(on_stopped) on_stopped();
    return;
  }
  if(on_stopped) stop_callbacks_.push_back(std::move(on_stopped));
  if(stopping_.exchange(true)) return;
  running_ = false;
  if(!started_) {
    finish_stop();
    return;
  }

  logger_->debug("Stopping server on port {}", port_.load());
  http_.stop();

  auto self = shared_from_this();
  grace_timer_.expires_after(options_.shutdown_grace);
  grace_timer_.async_wait([self](const std::error_code& ec){
    if(ec || self->stopped_) return;
    self->logger_->debug("Grace period over on port {}, abandoning open connections", self->port_.load());
    self->finish_stop();
  });
}

void HttpServer::finish_stop() {
  if(stopped_) return;
  stopped_ = true;
  stopping_ = true;
  running_ = false;
  grace_timer_.cancel();
  if(started_) {
    logger_->info("HTTP server on port {} stopped", port_.load());
    server_stopped.emit();
  }
  auto callbacks = std::move(stop_callbacks_);
  stop_callbacks_.clear();
  for(auto& callback : callbacks) {
    callback();
  }
}
