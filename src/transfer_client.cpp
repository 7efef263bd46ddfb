#include "transfer_client.hpp"

#include "errors.hpp"
#include "http_message.hpp"
#include "transfer_progress.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <sys/stat.h>

#include <algorithm>
#include <filesystem>
#include <fstream>

using json = nlohmann::json;

namespace {
constexpr std::size_t kChunkSize = 64 * 1024;

std::string string_field(const json& data, const char* key) {
  if(!data.is_object()) return {};
  auto it = data.find(key);
  if(it == data.end() || !it->is_string()) return {};
  return it->get<std::string>();
}

HowlError status_error(int status, const std::string& message) {
  switch(status) {
    case 400: return HowlError(ErrorKind::Client, message);
    case 403: return HowlError(ErrorKind::Auth, message);
    case 404: return HowlError(ErrorKind::NotFound, message);
    case 429: return HowlError(ErrorKind::Quota, message);
    default: return HowlError(ErrorKind::Transport, message);
  }
}

std::string status_line(int status) {
  return "HTTP " + std::to_string(status) + ": " + httplib::status_message(status);
}

// Prefers the server's JSON message over the bare status line.
HowlError response_error(const httplib::Response& response) {
  std::string message;
  try {
    message = string_field(json::parse(response.body), "message");
  } catch(const json::exception&) {
  }
  if(message.empty()) message = status_line(response.status);
  return status_error(response.status, message);
}

HowlError transport_error(const std::string& what, httplib::Error error) {
  return HowlError(ErrorKind::Transport, what + ": " + httplib::to_string(error));
}

std::string describe(std::exception_ptr error) {
  try {
    std::rethrow_exception(error);
  } catch(const std::exception& e) {
    return e.what();
  }
}

// Stops the client's socket while a request is in flight when the caller aborts.
class AbortHook {
public:
  AbortHook(std::shared_ptr<AbortSignal> signal, httplib::Client& client)
    : signal_(std::move(signal)) {
    if(signal_) handle_ = signal_->subscribe([&client]{ client.stop(); });
  }
  ~AbortHook() {
    if(signal_) signal_->unsubscribe(handle_);
  }
  AbortHook(const AbortHook&) = delete;
  AbortHook& operator=(const AbortHook&) = delete;

  bool aborted() const { return signal_ && signal_->aborted(); }

private:
  std::shared_ptr<AbortSignal> signal_;
  SignalHandle handle_ = 0;
};

std::string modified_time_iso(const std::string& path) {
  struct stat info {};
  if(::stat(path.c_str(), &info) != 0) return iso8601_utc();
  return iso8601_utc(std::chrono::system_clock::from_time_t(info.st_mtime));
}
}

std::shared_ptr<TransferClient> TransferClient::create(asio::io_context& io,
                                                       Options options,
                                                       std::shared_ptr<Logger> logger) {
  return std::shared_ptr<TransferClient>(new TransferClient(io, std::move(options), std::move(logger)));
}

TransferClient::TransferClient(asio::io_context& io, Options options, std::shared_ptr<Logger> logger)
  : io_(io),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("client")) {}

template<typename T, typename Fn>
std::future<T> TransferClient::launch(Fn fn) {
  auto self = shared_from_this();
  return std::async(std::launch::async, [self, fn = std::move(fn)]() -> T {
    try {
      return fn(*self);
    } catch(const std::exception&) {
      self->report(std::current_exception());
      throw;
    }
  });
}

std::unique_ptr<httplib::Client> TransferClient::connect(const std::string& host, std::uint16_t port) const {
  auto client = std::make_unique<httplib::Client>(host, port);
  client->set_connection_timeout(options_.connect_timeout);
  client->set_read_timeout(options_.io_timeout);
  client->set_write_timeout(options_.io_timeout);
  client->set_follow_location(options_.max_redirects > 0);
  // Paths are already percent-encoded.
  client->set_url_encode(false);
  return client;
}

httplib::Headers TransferClient::request_headers(const std::string& host, std::uint16_t port) const {
  httplib::Headers headers{{"User-Agent", options_.user_agent}};
  if(auto token = session_token(host, port)) {
    headers.emplace("X-Session-Token", *token);
  }
  return headers;
}

std::optional<std::string> TransferClient::session_token(const std::string& host, std::uint16_t port) const {
  std::lock_guard<std::mutex> lock(tokens_mutex_);
  auto it = session_tokens_.find(host + ":" + std::to_string(port));
  if(it == session_tokens_.end()) return std::nullopt;
  return it->second;
}

void TransferClient::dispatch(std::function<void(TransferClient&)> fn) {
  std::weak_ptr<TransferClient> weak = shared_from_this();
  asio::post(io_, [weak, fn = std::move(fn)]{
    if(auto self = weak.lock()) fn(*self);
  });
}

void TransferClient::report(std::exception_ptr error) {
  auto message = describe(error);
  logger_->debug("Transfer error: {}", message);
  dispatch([message](TransferClient& self){ self.error.emit(message); });
}

std::future<bool> TransferClient::verify(const std::string& host, std::uint16_t port, const std::string& code) {
  return launch<bool>([host, port, code](TransferClient& self){
    return self.verify_now(host, port, code);
  });
}

bool TransferClient::verify_now(const std::string& host, std::uint16_t port, const std::string& code) {
  auto client = connect(host, port);
  auto result = client->Post("/verify", request_headers(host, port), json{{"code", code}}.dump(), "application/json");
  if(!result) throw transport_error("Verification request failed", result.error());

  json data;
  try {
    data = json::parse(result->body);
  } catch(const json::exception&) {
    throw HowlError(ErrorKind::Transport, "Failed to parse verification response");
  }
  const bool success = data.is_object() && data.value("success", false) == true;
  const auto token = string_field(data, "sessionToken");
  VerificationEvent event{host, port, string_field(data, "message")};
  if(success && !token.empty()) {
    {
      std::lock_guard<std::mutex> lock(tokens_mutex_);
      session_tokens_[host + ":" + std::to_string(port)] = token;
    }
    logger_->debug("Verified with {}:{}", host, port);
    dispatch([event](TransferClient& self){ self.verified.emit(event); });
    return true;
  }
  if(event.message.empty()) event.message = "Invalid verification code";
  dispatch([event](TransferClient& self){ self.verification_failed.emit(event); });
  return false;
}

std::future<std::vector<FileMetadata>> TransferClient::fetch_file_list(const std::string& host, std::uint16_t port) {
  return launch<std::vector<FileMetadata>>([host, port](TransferClient& self){
    return self.fetch_file_list_now(host, port);
  });
}

std::vector<FileMetadata> TransferClient::fetch_file_list_now(const std::string& host, std::uint16_t port) {
  auto client = connect(host, port);
  auto result = client->Get("/files", request_headers(host, port));
  if(!result) throw transport_error("File list request failed", result.error());
  if(result->status != 200) throw response_error(*result);
  try {
    return json::parse(result->body).get<std::vector<FileMetadata>>();
  } catch(const json::exception&) {
    throw HowlError(ErrorKind::Transport, "Failed to parse file list");
  }
}

std::future<FileMetadata> TransferClient::download(const std::string& host,
                                                   std::uint16_t port,
                                                   const std::string& file_id,
                                                   const std::string& output_path,
                                                   DownloadOptions options) {
  return launch<FileMetadata>([host, port, file_id, output_path, options](TransferClient& self){
    return self.download_now(host, port, file_id, output_path, options);
  });
}

FileMetadata TransferClient::download_now(const std::string& host,
                                          std::uint16_t port,
                                          const std::string& file_id,
                                          const std::string& output_path,
                                          const DownloadOptions& options) {
  if(options.signal && options.signal->aborted()) {
    throw HowlError(ErrorKind::Transport, "Download aborted");
  }

  std::uint64_t start_byte = 0;
  if(options.resume) {
    std::error_code ec;
    auto existing = std::filesystem::file_size(output_path, ec);
    if(!ec) start_byte = existing;
  }

  auto headers = request_headers(host, port);
  if(start_byte > 0) {
    headers.emplace("Range", "bytes=" + std::to_string(start_byte) + "-");
  }
  logger_->debug("Downloading {} from {}:{} into {} (offset {})", file_id, host, port, output_path, start_byte);

  auto client = connect(host, port);
  AbortHook hook(options.signal, *client);

  std::ofstream out;
  FileMetadata meta;
  std::unique_ptr<ProgressTracker> tracker;
  std::uint64_t received = 0;
  std::exception_ptr failure;

  auto result = client->Get("/" + url_encode(file_id), headers,
    [&](const httplib::Response& response){
      try {
        if(response.status != 200 && response.status != 206) {
          throw status_error(response.status, status_line(response.status));
        }
        if(response.status == 200 && start_byte > 0) {
          // server ignored the range, start over
          start_byte = 0;
        }

        std::uint64_t length = 0;
        auto length_text = response.get_header_value("Content-Length");
        if(!length_text.empty()) {
          try {
            length = std::stoull(length_text);
          } catch(const std::exception&) {
            throw HowlError(ErrorKind::Transport, "Invalid Content-Length in response");
          }
        }
        const std::uint64_t total = response.status == 206
          ? parse_content_range_total(response.get_header_value("Content-Range")).value_or(start_byte + length)
          : length;

        out.open(output_path, std::ios::binary | (start_byte > 0 ? std::ios::app : std::ios::trunc));
        if(!out) {
          throw HowlError(ErrorKind::Client, "Unable to write " + output_path);
        }

        meta.id = file_id;
        meta.name = parse_content_disposition_filename(response.get_header_value("Content-Disposition")).value_or(file_id);
        meta.size = total;
        auto content_type = response.get_header_value("Content-Type");
        if(!content_type.empty()) meta.mime_type = content_type;
        meta.path = output_path;
        tracker = std::make_unique<ProgressTracker>(meta.id, meta.name, total, start_byte);
        dispatch([meta](TransferClient& self){ self.metadata.emit(meta); });
        return true;
      } catch(const std::exception&) {
        failure = std::current_exception();
        return false;
      }
    },
    [&](const char* data, std::size_t size){
      if(hook.aborted()) return false;
      out.write(data, static_cast<std::streamsize>(size));
      if(!out) {
        failure = std::make_exception_ptr(HowlError(ErrorKind::Client, "Unable to write " + output_path));
        return false;
      }
      received += size;
      auto update = tracker->update(start_byte + received);
      dispatch([update](TransferClient& self){ self.progress.emit(update); });
      return true;
    });

  if(out.is_open()) {
    out.close();
    if(!out && !failure) {
      failure = std::make_exception_ptr(HowlError(ErrorKind::Client, "Unable to write " + output_path));
    }
  }
  if(hook.aborted()) throw HowlError(ErrorKind::Transport, "Download aborted");
  if(failure) std::rethrow_exception(failure);
  if(!result) throw transport_error("Download failed", result.error());
  if(!tracker) throw status_error(result->status, status_line(result->status));

  meta.size = std::max(meta.size, start_byte + received);
  logger_->debug("Downloaded {} ({})", meta.name, format_bytes(meta.size));
  dispatch([meta](TransferClient& self){ self.completed.emit(meta); });
  return meta;
}

UploadTicket TransferClient::prepare_upload(const std::string& file_path) const {
  std::error_code ec;
  if(!std::filesystem::is_regular_file(file_path, ec)) {
    throw HowlError(ErrorKind::Client, "File not found: " + file_path);
  }
  UploadTicket ticket;
  ticket.path = file_path;
  ticket.filename = std::filesystem::path(file_path).filename().string();
  ticket.size = std::filesystem::file_size(file_path, ec);
  if(ec) {
    throw HowlError(ErrorKind::Client, "Unable to read " + file_path + ": " + ec.message());
  }
  ticket.hash = sha256_file(file_path);
  ticket.modified_at = modified_time_iso(file_path);
  ticket.created_at = ticket.modified_at;
  return ticket;
}

UploadTicket TransferClient::request_upload_now(const std::string& host,
                                                std::uint16_t port,
                                                UploadTicket prepared) {
  const auto body = json{
    {"filename", prepared.filename},
    {"size", prepared.size},
    {"hash", prepared.hash},
    {"createdAt", prepared.created_at},
    {"modifiedAt", prepared.modified_at}
  }.dump();
  logger_->debug("Requesting upload of {} to {}:{}", prepared.filename, host, port);

  auto client = connect(host, port);
  auto result = client->Post("/request-upload", request_headers(host, port), body, "application/json");
  if(!result) throw transport_error("Upload request failed", result.error());

  json data;
  try {
    data = json::parse(result->body);
  } catch(const json::exception&) {
    if(result->status != 200) throw response_error(*result);
    throw HowlError(ErrorKind::Transport, "Failed to parse upload request response");
  }
  const bool success = data.is_object() && data.value("success", false) == true;
  const auto upload_id = string_field(data, "uploadId");
  if(result->status != 200 || !success || upload_id.empty()) {
    auto message = string_field(data, "message");
    throw status_error(result->status, message.empty() ? "Upload request failed" : message);
  }
  prepared.upload_id = upload_id;
  prepared.message = string_field(data, "message");
  return prepared;
}

FileMetadata TransferClient::send_upload_now(const std::string& host,
                                             std::uint16_t port,
                                             const UploadTicket& ticket,
                                             const std::string& code,
                                             const UploadOptions& options) {
  if(options.signal && options.signal->aborted()) {
    throw HowlError(ErrorKind::Transport, "Upload aborted");
  }
  std::error_code ec;
  auto size = std::filesystem::file_size(ticket.path, ec);
  if(ec) {
    throw HowlError(ErrorKind::Client, "Unable to read " + ticket.path + ": " + ec.message());
  }
  if(size != ticket.size) {
    throw HowlError(ErrorKind::Integrity, "File changed since the upload was requested");
  }
  std::ifstream in(ticket.path, std::ios::binary);
  if(!in) {
    throw HowlError(ErrorKind::Client, "Unable to read " + ticket.path);
  }

  auto headers = request_headers(host, port);
  headers.emplace("X-Upload-Id", ticket.upload_id);
  headers.emplace("X-Verification-Code", trim(code));
  headers.emplace("X-File-Hash", ticket.hash);
  logger_->debug("Uploading {} ({}) to {}:{}", ticket.filename, format_bytes(ticket.size), host, port);

  auto client = connect(host, port);
  client->set_follow_location(false);
  AbortHook hook(options.signal, *client);

  ProgressTracker tracker(ticket.filename, ticket.filename, ticket.size);
  std::vector<char> chunk(kChunkSize);
  std::uint64_t sent = 0;
  bool read_failed = false;

  httplib::MultipartFormDataProviderItems parts{{
    "file",
    [&](std::size_t, httplib::DataSink& sink){
      if(hook.aborted()) return false;
      in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
      const auto got = in.gcount();
      if(got > 0) {
        if(!sink.write(chunk.data(), static_cast<std::size_t>(got))) return false;
        sent += static_cast<std::uint64_t>(got);
        auto update = tracker.update(sent);
        dispatch([update](TransferClient& self){ self.progress.emit(update); });
      }
      if(in.eof()) {
        sink.done();
        return true;
      }
      if(!in) {
        read_failed = true;
        return false;
      }
      return true;
    },
    ticket.filename,
    mime_type_for(ticket.path)
  }};

  auto result = client->Post("/upload", headers, httplib::MultipartFormDataItems{}, parts);
  if(hook.aborted()) throw HowlError(ErrorKind::Transport, "Upload aborted");
  if(read_failed) throw HowlError(ErrorKind::Client, "Unable to read " + ticket.path);
  if(!result) throw transport_error("Upload failed", result.error());

  json data;
  try {
    data = json::parse(result->body);
  } catch(const json::exception&) {
    throw response_error(*result);
  }
  const bool success = data.is_object() && data.value("success", false) == true;
  if(result->status != 200 || !success) {
    auto message = string_field(data, "message");
    throw status_error(result->status, message.empty() ? "Upload failed" : message);
  }
  FileMetadata stored;
  if(data.contains("file") && data["file"].is_object()) {
    try {
      stored = data["file"].get<FileMetadata>();
    } catch(const json::exception&) {
      throw HowlError(ErrorKind::Transport, "Failed to parse upload response");
    }
  }
  logger_->debug("Upload of {} accepted", stored.name);
  dispatch([stored](TransferClient& self){ self.completed.emit(stored); });
  return stored;
}

std::future<UploadTicket> TransferClient::request_upload(const std::string& host,
                                                         std::uint16_t port,
                                                         const std::string& file_path) {
  return launch<UploadTicket>([host, port, file_path](TransferClient& self){
    return self.request_upload_now(host, port, self.prepare_upload(file_path));
  });
}

std::future<FileMetadata> TransferClient::send_upload(const std::string& host,
                                                      std::uint16_t port,
                                                      const UploadTicket& ticket,
                                                      const std::string& code,
                                                      UploadOptions options) {
  return launch<FileMetadata>([host, port, ticket, code, options](TransferClient& self){
    return self.send_upload_now(host, port, ticket, code, options);
  });
}

std::future<FileMetadata> TransferClient::upload(const std::string& host,
                                                 std::uint16_t port,
                                                 const std::string& file_path,
                                                 const std::string& code,
                                                 UploadOptions options) {
  return launch<FileMetadata>([host, port, file_path, code, options](TransferClient& self){
    auto ticket = self.request_upload_now(host, port, self.prepare_upload(file_path));
    return self.send_upload_now(host, port, ticket, code, options);
  });
}
