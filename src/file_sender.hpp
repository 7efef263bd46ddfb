#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "http_server.hpp"
#include "log.hpp"
#include "signal.hpp"
#include "types.hpp"
#include "verification_manager.hpp"

// Serves one file over HTTP behind a verification code.
//
// Requests are handled on the HTTP worker threads; every signal is posted
// to the io_context and fires there. start() and stop() may be called from
// any thread, but waiting on stop()'s future from the io thread itself would
// deadlock.
class FileSender : public std::enable_shared_from_this<FileSender> {
public:
  struct Options {
    std::uint16_t port = 0;
    unsigned max_downloads = 0;  // 0 = unlimited
    bool require_verification = true;
    std::optional<std::string> verification_code;  // random when unset
    std::chrono::milliseconds shutdown_grace{1000};
    std::chrono::seconds io_timeout{5};
  };

  struct ConnectionEvent {
    TransferType transfer_type = TransferType::Browser;
    std::string client_ip;
    std::string user_agent;
    std::string timestamp;
  };

  struct VerificationEvent {
    std::string client_ip;
    std::string timestamp;
  };

  struct TransferEvent {
    std::string file_id;
    std::string file_name;
    TransferType transfer_type = TransferType::Browser;
    std::string client_ip;
    std::string timestamp;
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
    unsigned download_count = 0;
    unsigned max_downloads = 0;
  };

  struct LimitEvent {
    unsigned current_count = 0;
    unsigned max_downloads = 0;
  };

  static std::shared_ptr<FileSender> create(asio::io_context& io,
                                            Options options,
                                            std::shared_ptr<Logger> logger = nullptr);
  ~FileSender();

  // Registers the file and starts listening. Returns the bound port.
  // Throws HowlError(Configuration) if the file is unusable or the port
  // cannot be bound.
  std::uint16_t start(FileMetadata file);

  // Resolves once the listener and every connection are closed, at most
  // shutdown_grace after the call. Repeated calls are harmless.
  std::future<void> stop();

  std::string verification_code() const { return verification_.code(); }
  bool requires_verification() const { return options_.require_verification; }
  std::uint16_t port() const;
  bool running() const;
  unsigned download_count() const { return download_count_.load(); }
  unsigned max_downloads() const { return options_.max_downloads; }
  std::optional<FileMetadata> file() const;

  Signal<ConnectionEvent> connection;
  Signal<VerificationEvent> verified;
  Signal<VerificationEvent> verification_failed;
  Signal<ConnectionEvent> verification_required;
  Signal<TransferProgress> progress;
  Signal<TransferEvent> transfer_started;
  Signal<TransferEvent> transfer_completed;
  Signal<LimitEvent> download_limit_reached;
  Signal<FileMetadata> completed;
  Signal<std::string> error;
  Signal<std::uint16_t> started;
  Signal<> stopped;

private:
  FileSender(asio::io_context& io, Options options, std::shared_ptr<Logger> logger);

  void register_routes(httplib::Server& routes);
  void handle_index(const httplib::Request& req, httplib::Response& res);
  void handle_verify_get(const httplib::Request& req, httplib::Response& res);
  void handle_verify(const httplib::Request& req, httplib::Response& res, const httplib::ContentReader& reader);
  void handle_health(const httplib::Request& req, httplib::Response& res);
  void handle_files(const httplib::Request& req, httplib::Response& res);
  void handle_download(const httplib::Request& req, httplib::Response& res);
  void handle_not_allowed(const httplib::Request& req, httplib::Response& res, const httplib::ContentReader& reader);
  void finish_download(const FileMetadata& file,
                       const ConnectionEvent& client,
                       bool ranged,
                       bool ok);
  std::optional<FileMetadata> find_file(const std::string& id_or_name) const;
  bool stopping() const { return !server_ || server_->stopping(); }
  // Runs fn on the io thread if this sender is still alive.
  void dispatch(std::function<void(FileSender&)> fn);
  void cleanup();

  asio::io_context& io_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  VerificationManager verification_;
  std::shared_ptr<HttpServer> server_;

  mutable std::mutex files_mutex_;
  std::map<std::string, FileMetadata> files_;

  std::atomic<unsigned> download_count_{0};
  std::atomic<bool> limit_signalled_{false};
};
