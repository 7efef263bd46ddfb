#include "file_receiver.hpp"

#include "errors.hpp"
#include "transfer_progress.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

using json = nlohmann::json;

namespace {
constexpr std::size_t kMaxRequestBody = 64 * 1024;

const char* kIndexPage = R"(<!DOCTYPE html>
<html>
<head><meta charset="utf-8"><title>Howl</title></head>
<body>
<h1>Howl receiver</h1>
<p>This device is waiting for files. Send one with <code>howl send &lt;file&gt;</code>
and enter the verification code shown here when asked.</p>
</body>
</html>
)";

// createdAt/modifiedAt arrive either as ISO strings or epoch milliseconds.
std::string timestamp_field(const json& data, const char* key) {
  auto it = data.find(key);
  if(it == data.end() || it->is_null()) return iso8601_utc();
  if(it->is_string()) return it->get<std::string>();
  if(it->is_number()) {
    auto millis = std::chrono::milliseconds(it->get<std::int64_t>());
    return iso8601_utc(std::chrono::system_clock::time_point(millis));
  }
  throw HowlError(ErrorKind::Client, "Invalid request");
}

// Upload target that removes itself unless kept.
struct PartFile {
  explicit PartFile(std::filesystem::path file) : path(std::move(file)) {}
  ~PartFile() { discard(); }

  void discard() {
    if(settled) return;
    settled = true;
    if(out.is_open()) out.close();
    std::error_code ignored;
    std::filesystem::remove(path, ignored);
  }

  std::filesystem::path path;
  std::ofstream out;
  bool settled = false;
};
}

std::shared_ptr<FileReceiver> FileReceiver::create(asio::io_context& io,
                                                   Options options,
                                                   std::shared_ptr<Logger> logger) {
  return std::shared_ptr<FileReceiver>(new FileReceiver(io, std::move(options), std::move(logger)));
}

FileReceiver::FileReceiver(asio::io_context& io, Options options, std::shared_ptr<Logger> logger)
  : io_(io),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("receiver")),
    global_verification_(options_.verification_code.value_or(VerificationManager::generate_code())) {}

FileReceiver::~FileReceiver() = default;

std::uint16_t FileReceiver::start() {
  if(server_) {
    throw HowlError(ErrorKind::Configuration, "Receiver already started");
  }
  std::error_code ec;
  std::filesystem::create_directories(options_.upload_dir, ec);
  if(ec || !std::filesystem::is_directory(options_.upload_dir)) {
    throw HowlError(ErrorKind::Configuration,
                    "Unable to create upload directory " + options_.upload_dir.string() +
                    (ec ? ": " + ec.message() : std::string()));
  }

  HttpServer::Options server_options;
  server_options.shutdown_grace = options_.shutdown_grace;
  server_options.io_timeout = options_.io_timeout;
  server_ = HttpServer::create(io_, logger_, server_options);
  register_routes(server_->routes());

  std::weak_ptr<FileReceiver> weak = shared_from_this();
  server_->server_started.connect([weak](std::uint16_t port){
    if(auto self = weak.lock()) self->started.emit(port);
  });
  server_->server_stopped.connect([weak]{
    if(auto self = weak.lock()) {
      self->cleanup();
      self->stopped.emit();
    }
  });

  auto port = server_->start(options_.port);
  logger_->debug("Accepting uploads into {}", options_.upload_dir.string());
  return port;
}

void FileReceiver::register_routes(httplib::Server& routes) {
  std::weak_ptr<FileReceiver> weak = shared_from_this();
  routes.Get("/", bind_route(weak, &FileReceiver::handle_index));
  routes.Get("/index.html", bind_route(weak, &FileReceiver::handle_index));
  routes.Get("/health", bind_route(weak, &FileReceiver::handle_health));
  routes.Post("/request-upload", bind_route(weak, &FileReceiver::handle_request_upload));
  routes.Post("/upload", bind_route(weak, &FileReceiver::handle_upload));
}

std::future<void> FileReceiver::stop() {
  auto done = std::make_shared<std::promise<void>>();
  auto future = done->get_future();
  if(!server_) {
    done->set_value();
    return future;
  }
  server_->stop([done]{ done->set_value(); });
  return future;
}

std::uint16_t FileReceiver::port() const {
  return server_ ? server_->port() : 0;
}

bool FileReceiver::running() const {
  return server_ && server_->running();
}

void FileReceiver::dispatch(std::function<void(FileReceiver&)> fn) {
  std::weak_ptr<FileReceiver> weak = shared_from_this();
  asio::post(io_, [weak, fn = std::move(fn)]{
    if(auto self = weak.lock()) fn(*self);
  });
}

void FileReceiver::cleanup() {
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_.clear();
    pending_count_ = 0;
  }
  global_verification_.clear_sessions();
}

bool FileReceiver::quota_reached() const {
  return options_.max_uploads > 0 && upload_count_.load() >= options_.max_uploads;
}

void FileReceiver::expire_pending() {
  const auto cutoff = Clock::now() - options_.pending_ttl;
  for(auto it = pending_.begin(); it != pending_.end();) {
    if(!it->second.verified && it->second.timestamp < cutoff) {
      logger_->debug("Expired upload request {}", it->first);
      it = pending_.erase(it);
    } else {
      ++it;
    }
  }
  pending_count_ = pending_.size();
}

bool FileReceiver::code_matches(const PendingUpload& pending, const std::string& code) const {
  if(options_.per_file_verification) {
    return trim(code) == pending.verification_code;
  }
  return global_verification_.matches(code);
}

void FileReceiver::handle_index(const httplib::Request&, httplib::Response& res) {
  res.set_content(kIndexPage, "text/html; charset=utf-8");
}

void FileReceiver::handle_health(const httplib::Request&, httplib::Response& res) {
  json remaining;
  if(options_.max_uploads == 0) {
    remaining = "∞";
  } else {
    auto count = upload_count_.load();
    remaining = count >= options_.max_uploads ? 0u : options_.max_uploads - count;
  }
  reply_json(res, 200, {
    {"status", "ok"},
    {"uploadsRemaining", remaining}
  });
}

void FileReceiver::handle_request_upload(const httplib::Request& req,
                                         httplib::Response& res,
                                         const httplib::ContentReader& reader) {
  const auto body = read_request_body(req, reader, kMaxRequestBody);
  json data;
  try {
    data = json::parse(body);
  } catch(const json::exception&) {
    throw HowlError(ErrorKind::Client, "Invalid request");
  }
  if(!data.is_object()) throw HowlError(ErrorKind::Client, "Invalid request");

  PendingUpload pending;
  try {
    pending.filename = data.value("filename", std::string());
    pending.size = data.value("size", std::uint64_t{0});
    pending.hash = to_lower(data.value("hash", std::string()));
  } catch(const json::exception&) {
    throw HowlError(ErrorKind::Client, "Invalid request");
  }
  if(pending.filename.empty() || pending.size == 0 || pending.hash.empty()) {
    throw HowlError(ErrorKind::Client, "Missing required fields");
  }
  auto leaf = std::filesystem::path(pending.filename).filename().string();
  if(leaf.empty() || leaf == "." || leaf == "..") {
    throw HowlError(ErrorKind::Client, "Invalid filename");
  }
  pending.filename = leaf;

  if(quota_reached()) {
    throw HowlError(ErrorKind::Quota, "Upload limit reached");
  }

  pending.created_at = timestamp_field(data, "createdAt");
  pending.modified_at = timestamp_field(data, "modifiedAt");
  pending.timestamp = Clock::now();

  std::string code;
  if(options_.per_file_verification) {
    pending.verification_code = VerificationManager::generate_code();
    code = pending.verification_code;
  } else {
    code = global_verification_.code();
  }

  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    do {
      pending.id = random_hex(16);
    } while(pending_.count(pending.id) != 0);
    pending_[pending.id] = pending;
    expire_pending();
  }

  const auto client_ip = req.remote_addr;
  logger_->info("Upload request from {}: {} ({}, hash {}...)",
                client_ip, pending.filename, format_bytes(pending.size), pending.hash.substr(0, 8));

  UploadRequestEvent event{pending.id, pending.filename, pending.size, pending.hash,
                           pending.created_at, pending.modified_at, code, client_ip};
  dispatch([event](FileReceiver& self){ self.upload_requested.emit(event); });

  reply_json(res, 200, {
    {"success", true},
    {"uploadId", pending.id},
    {"message", "Upload request received. Enter the verification code shown on receiver to proceed."}
  });
}

FileReceiver::PendingUpload FileReceiver::claim_upload(const std::string& upload_id,
                                                       const std::string& code,
                                                       const std::string& declared_hash,
                                                       const std::string& client_ip) {
  if(upload_id.empty() || code.empty() || declared_hash.empty()) {
    throw HowlError(ErrorKind::Client, "Missing upload ID, verification code, or file hash");
  }

  std::lock_guard<std::mutex> lock(pending_mutex_);
  expire_pending();
  auto it = pending_.find(upload_id);
  if(it == pending_.end()) {
    throw HowlError(ErrorKind::NotFound, "Upload request not found or expired");
  }
  auto& pending = it->second;

  if(!code_matches(pending, code)) {
    logger_->warn("Verification failed for upload {} from {}", pending.filename, client_ip);
    UploadEvent event{upload_id, pending.filename, client_ip};
    dispatch([event](FileReceiver& self){ self.verification_failed.emit(event); });
    throw HowlError(ErrorKind::Auth, "Invalid verification code");
  }

  if(declared_hash != pending.hash) {
    logger_->warn("Hash mismatch for upload {} from {}", pending.filename, client_ip);
    throw HowlError(ErrorKind::Integrity, "File hash does not match initial request");
  }

  if(quota_reached()) {
    throw HowlError(ErrorKind::Quota, "Upload limit reached");
  }

  pending.verified = true;
  logger_->debug("Upload {} verified, receiving {}", upload_id, pending.filename);
  UploadEvent event{upload_id, pending.filename, client_ip};
  dispatch([event](FileReceiver& self){ self.upload_verified.emit(event); });
  return pending;
}

void FileReceiver::handle_upload(const httplib::Request& req,
                                 httplib::Response& res,
                                 const httplib::ContentReader& reader) {
  const auto client_ip = req.remote_addr;
  PendingUpload pending;
  try {
    pending = claim_upload(req.get_header_value("X-Upload-Id"),
                           req.get_header_value("X-Verification-Code"),
                           to_lower(trim(req.get_header_value("X-File-Hash"))),
                           client_ip);
    if(!req.is_multipart_form_data()) {
      throw HowlError(ErrorKind::Client, "Invalid content type");
    }
  } catch(const HowlError&) {
    if(!discard_request_body(req, reader)) res.set_header("Connection", "close");
    throw;
  }

  const auto final_path = options_.upload_dir / pending.filename;
  PartFile part(options_.upload_dir / (pending.filename + ".part-" + pending.id.substr(0, 8)));
  part.out.open(part.path, std::ios::binary | std::ios::trunc);
  if(!part.out) {
    logger_->error("Unable to open {} for writing", part.path.string());
    if(!discard_request_body(req, reader)) res.set_header("Connection", "close");
    throw HowlError(ErrorKind::Internal, "Unable to store upload");
  }

  // Only the first part that carries a filename is stored.
  Sha256Stream hash;
  ProgressTracker tracker(pending.filename, pending.filename, pending.size);
  std::uint64_t written = 0;
  std::string part_type;
  bool in_file = false;
  bool seen_file = false;
  bool write_failed = false;
  const bool complete = reader(
    [&](const httplib::MultipartFormData& header){
      in_file = !seen_file && !header.filename.empty();
      if(in_file) {
        seen_file = true;
        part_type = header.content_type;
      }
      return true;
    },
    [&](const char* data, std::size_t size){
      if(!in_file) return true;
      if(stopping()) return false;
      part.out.write(data, static_cast<std::streamsize>(size));
      if(!part.out) {
        write_failed = true;
        return false;
      }
      hash.update(data, size);
      written += size;
      auto update = tracker.update(written);
      dispatch([update](FileReceiver& self){ self.progress.emit(update); });
      return true;
    });

  if(write_failed) {
    logger_->error("Unable to write {}", part.path.string());
    throw HowlError(ErrorKind::Internal, "Unable to store upload");
  }
  if(!complete) {
    part.discard();
    logger_->warn("Upload of {} from {} was interrupted", pending.filename, client_ip);
    dispatch([name = pending.filename](FileReceiver& self){
      self.error.emit("Upload of " + name + " was interrupted");
    });
    throw HowlError(ErrorKind::Client, "Incomplete upload");
  }
  if(!seen_file) {
    throw HowlError(ErrorKind::Client, "No file uploaded");
  }

  part.out.close();
  if(!part.out) {
    throw HowlError(ErrorKind::Internal, "Unable to store upload");
  }

  auto actual_hash = hash.hex_digest();
  if(actual_hash != pending.hash) {
    logger_->error("Integrity check failed for {} from {}", pending.filename, client_ip);
    throw HowlError(ErrorKind::Integrity, "File integrity check failed");
  }

  std::error_code rename_ec;
  std::filesystem::rename(part.path, final_path, rename_ec);
  if(rename_ec) {
    logger_->error("Unable to move upload into place: {}", rename_ec.message());
    throw HowlError(ErrorKind::Internal, "Unable to store upload");
  }
  part.settled = true;

  FileMetadata stored;
  stored.id = pending.filename;
  stored.name = pending.filename;
  stored.size = written;
  stored.mime_type = part_type.empty() ? mime_type_for(final_path) : part_type;
  stored.path = final_path.string();
  finish_upload(client_ip, res, pending, stored, actual_hash);
}

void FileReceiver::finish_upload(const std::string& client_ip,
                                 httplib::Response& res,
                                 const PendingUpload& pending,
                                 const FileMetadata& stored,
                                 const std::string& actual_hash) {
  const auto count = ++upload_count_;
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_.erase(pending.id);
    pending_count_ = pending_.size();
  }

  UploadCompletedEvent event;
  event.upload_id = pending.id;
  event.file = stored;
  event.hash = actual_hash;
  event.client_ip = client_ip;
  event.timestamp = iso8601_utc();
  event.upload_count = count;
  event.max_uploads = options_.max_uploads;
  logger_->info("Received {} ({}) from {}", stored.name, format_bytes(stored.size), client_ip);

  reply_json(res, 200, {
    {"success", true},
    {"message", "Upload successful"},
    {"file", stored}
  });

  const bool limit_hit = options_.max_uploads > 0 && count >= options_.max_uploads &&
                         !limit_signalled_.exchange(true);
  const LimitEvent limit{count, options_.max_uploads};
  dispatch([event, limit_hit, limit](FileReceiver& self){
    self.upload_completed.emit(event);
    if(limit_hit) self.upload_limit_reached.emit(limit);
  });
}
