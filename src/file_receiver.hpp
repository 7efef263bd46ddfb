#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
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

// Accepts uploads through a two-stage handshake: the sender first declares
// the file (POST /request-upload), a code is shown on this side, and only
// then is the body sent (POST /upload) with that code and the declared hash.
//
// Handlers run on the HTTP worker threads; signals are posted to the
// io_context and fire there.
class FileReceiver : public std::enable_shared_from_this<FileReceiver> {
public:
  struct Options {
    std::uint16_t port = 0;
    unsigned max_uploads = 0;  // 0 = unlimited
    std::filesystem::path upload_dir = "downloads";
    // A fresh code per upload request instead of one code for the server's lifetime.
    bool per_file_verification = false;
    std::optional<std::string> verification_code;  // global mode only, random when unset
    std::chrono::milliseconds pending_ttl{std::chrono::minutes(5)};
    std::chrono::milliseconds shutdown_grace{1000};
    std::chrono::seconds io_timeout{5};
  };

  struct UploadRequestEvent {
    std::string upload_id;
    std::string filename;
    std::uint64_t size = 0;
    std::string hash;
    std::string created_at;
    std::string modified_at;
    std::string verification_code;
    std::string client_ip;
  };

  struct UploadEvent {
    std::string upload_id;
    std::string filename;
    std::string client_ip;
  };

  struct UploadCompletedEvent {
    std::string upload_id;
    FileMetadata file;
    std::string hash;
    std::string client_ip;
    std::string timestamp;
    unsigned upload_count = 0;
    unsigned max_uploads = 0;
  };

  struct LimitEvent {
    unsigned current_count = 0;
    unsigned max_uploads = 0;
  };

  static std::shared_ptr<FileReceiver> create(asio::io_context& io,
                                              Options options,
                                              std::shared_ptr<Logger> logger = nullptr);
  ~FileReceiver();

  // Creates the upload directory and starts listening. Throws
  // HowlError(Configuration) when either is impossible.
  std::uint16_t start();
  std::future<void> stop();

  // The lifetime code used when per-file verification is off.
  std::string global_verification_code() const { return global_verification_.code(); }
  bool per_file_verification() const { return options_.per_file_verification; }
  const std::filesystem::path& upload_dir() const { return options_.upload_dir; }
  std::uint16_t port() const;
  bool running() const;
  unsigned upload_count() const { return upload_count_.load(); }
  unsigned max_uploads() const { return options_.max_uploads; }
  std::size_t pending_count() const { return pending_count_.load(); }

  Signal<UploadRequestEvent> upload_requested;
  Signal<UploadEvent> upload_verified;
  Signal<UploadEvent> verification_failed;
  Signal<TransferProgress> progress;
  Signal<UploadCompletedEvent> upload_completed;
  Signal<LimitEvent> upload_limit_reached;
  Signal<std::string> error;
  Signal<std::uint16_t> started;
  Signal<> stopped;

private:
  using Clock = std::chrono::steady_clock;

  struct PendingUpload {
    std::string id;
    std::string filename;
    std::uint64_t size = 0;
    std::string hash;
    std::string created_at;
    std::string modified_at;
    std::string verification_code;  // empty in global mode
    Clock::time_point timestamp;
    bool verified = false;
  };

  FileReceiver(asio::io_context& io, Options options, std::shared_ptr<Logger> logger);

  void register_routes(httplib::Server& routes);
  void handle_index(const httplib::Request& req, httplib::Response& res);
  void handle_health(const httplib::Request& req, httplib::Response& res);
  void handle_request_upload(const httplib::Request& req,
                             httplib::Response& res,
                             const httplib::ContentReader& reader);
  void handle_upload(const httplib::Request& req,
                     httplib::Response& res,
                     const httplib::ContentReader& reader);
  // Checks id, code, hash and quota and marks the request verified.
  PendingUpload claim_upload(const std::string& upload_id,
                             const std::string& code,
                             const std::string& declared_hash,
                             const std::string& client_ip);
  void finish_upload(const std::string& client_ip,
                     httplib::Response& res,
                     const PendingUpload& pending,
                     const FileMetadata& stored,
                     const std::string& actual_hash);
  bool code_matches(const PendingUpload& pending, const std::string& code) const;
  void expire_pending();  // pending_mutex_ held
  bool quota_reached() const;
  bool stopping() const { return !server_ || server_->stopping(); }
  void dispatch(std::function<void(FileReceiver&)> fn);
  void cleanup();

  asio::io_context& io_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  VerificationManager global_verification_;
  std::shared_ptr<HttpServer> server_;

  mutable std::mutex pending_mutex_;
  std::map<std::string, PendingUpload> pending_;
  std::atomic<std::size_t> pending_count_{0};
  std::atomic<unsigned> upload_count_{0};
  std::atomic<bool> limit_signalled_{false};
};
