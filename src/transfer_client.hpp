#pragma once

#include <asio.hpp>
#include <httplib.h>

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "abort_signal.hpp"
#include "log.hpp"
#include "signal.hpp"
#include "types.hpp"

// What a receiver handed back for the first upload stage.
struct UploadTicket {
  std::string upload_id;
  std::string filename;
  std::uint64_t size = 0;
  std::string hash;
  std::string path;
  std::string created_at;
  std::string modified_at;
  std::string message;
};

struct DownloadOptions {
  bool resume = false;
  std::shared_ptr<AbortSignal> signal;
};

struct UploadOptions {
  std::shared_ptr<AbortSignal> signal;
};

// Client side of both transfer directions: verify + download against a
// sender, request-upload + upload against a receiver.
//
// Every operation runs on its own thread behind the returned future, which
// blocks on destruction until the operation ends. Signals are posted to the
// io_context and fire there. Failures arrive as HowlError in the future and
// are also reported through the error signal.
class TransferClient : public std::enable_shared_from_this<TransferClient> {
public:
  struct Options {
    std::string user_agent = std::string("howl-client/") + kHowlVersion;
    int max_redirects = 5;  // 0 disables following redirects
    std::chrono::seconds connect_timeout{5};
    std::chrono::seconds io_timeout{30};
  };

  struct VerificationEvent {
    std::string host;
    std::uint16_t port = 0;
    std::string message;
  };

  static std::shared_ptr<TransferClient> create(asio::io_context& io,
                                                Options options,
                                                std::shared_ptr<Logger> logger = nullptr);

  // Resolves true and keeps the session token for host:port when the code
  // is accepted, false when it is rejected.
  std::future<bool> verify(const std::string& host, std::uint16_t port, const std::string& code);

  std::future<std::vector<FileMetadata>> fetch_file_list(const std::string& host, std::uint16_t port);

  // Streams /<file_id> into output_path. With resume set, an existing
  // partial file is continued from its current size.
  std::future<FileMetadata> download(const std::string& host,
                                     std::uint16_t port,
                                     const std::string& file_id,
                                     const std::string& output_path,
                                     DownloadOptions options = {});

  // Stage one: hashes the local file and declares it.
  std::future<UploadTicket> request_upload(const std::string& host,
                                           std::uint16_t port,
                                           const std::string& file_path);

  // Stage two: sends the file body with the code shown on the receiver.
  std::future<FileMetadata> send_upload(const std::string& host,
                                        std::uint16_t port,
                                        const UploadTicket& ticket,
                                        const std::string& code,
                                        UploadOptions options = {});

  // Both stages back to back, for callers that already know the code.
  std::future<FileMetadata> upload(const std::string& host,
                                   std::uint16_t port,
                                   const std::string& file_path,
                                   const std::string& code,
                                   UploadOptions options = {});

  std::optional<std::string> session_token(const std::string& host, std::uint16_t port) const;

  Signal<VerificationEvent> verified;
  Signal<VerificationEvent> verification_failed;
  Signal<FileMetadata> metadata;
  Signal<TransferProgress> progress;
  Signal<FileMetadata> completed;
  Signal<std::string> error;

private:
  TransferClient(asio::io_context& io, Options options, std::shared_ptr<Logger> logger);

  template<typename T, typename Fn>
  std::future<T> launch(Fn fn);

  std::unique_ptr<httplib::Client> connect(const std::string& host, std::uint16_t port) const;
  httplib::Headers request_headers(const std::string& host, std::uint16_t port) const;

  bool verify_now(const std::string& host, std::uint16_t port, const std::string& code);
  std::vector<FileMetadata> fetch_file_list_now(const std::string& host, std::uint16_t port);
  FileMetadata download_now(const std::string& host,
                            std::uint16_t port,
                            const std::string& file_id,
                            const std::string& output_path,
                            const DownloadOptions& options);
  UploadTicket prepare_upload(const std::string& file_path) const;
  UploadTicket request_upload_now(const std::string& host, std::uint16_t port, UploadTicket prepared);
  FileMetadata send_upload_now(const std::string& host,
                               std::uint16_t port,
                               const UploadTicket& ticket,
                               const std::string& code,
                               const UploadOptions& options);

  void dispatch(std::function<void(TransferClient&)> fn);
  void report(std::exception_ptr error);

  asio::io_context& io_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex tokens_mutex_;
  std::map<std::string, std::string> session_tokens_;
};
