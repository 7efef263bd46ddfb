#include "file_sender.hpp"

#include "errors.hpp"
#include "transfer_progress.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <vector>

using json = nlohmann::json;

namespace {
constexpr std::size_t kMaxVerifyBody = 16 * 1024;
constexpr std::size_t kChunkSize = 64 * 1024;

const char* kIndexPage = R"(<!DOCTYPE html>
<html>
<head><meta charset="utf-8"><title>Howl</title></head>
<body>
<h1>Howl file transfer</h1>
<p id="file"></p>
<form id="verify">
  <input id="code" maxlength="6" inputmode="numeric" placeholder="6-digit code" autofocus>
  <button type="submit">Download</button>
</form>
<p id="status"></p>
<script>
let files = [];
fetch('/files').then(r => r.json()).then(list => {
  files = list;
  if(list.length) document.getElementById('file').textContent = list[0].name + ' (' + list[0].size + ' bytes)';
});
document.getElementById('verify').addEventListener('submit', async e => {
  e.preventDefault();
  const res = await fetch('/verify', {method: 'POST', headers: {'Content-Type': 'application/json'},
    body: JSON.stringify({code: document.getElementById('code').value})});
  const data = await res.json();
  if(!data.success) { document.getElementById('status').textContent = data.message; return; }
  if(files.length) window.location = '/' + encodeURIComponent(files[0].id) + '?token=' + data.sessionToken;
});
</script>
</body>
</html>
)";
}

std::shared_ptr<FileSender> FileSender::create(asio::io_context& io,
                                               Options options,
                                               std::shared_ptr<Logger> logger) {
  return std::shared_ptr<FileSender>(new FileSender(io, std::move(options), std::move(logger)));
}

FileSender::FileSender(asio::io_context& io, Options options, std::shared_ptr<Logger> logger)
  : io_(io),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("sender")),
    verification_(options_.verification_code.value_or(VerificationManager::generate_code())) {}

FileSender::~FileSender() = default;

std::uint16_t FileSender::start(FileMetadata file) {
  if(server_) {
    throw HowlError(ErrorKind::Configuration, "Sender already started");
  }
  if(!file.path || file.path->empty()) {
    throw HowlError(ErrorKind::Configuration, "File path is required");
  }
  std::error_code ec;
  if(!std::filesystem::is_regular_file(*file.path, ec)) {
    throw HowlError(ErrorKind::Configuration, "File not found: " + *file.path);
  }
  auto size = std::filesystem::file_size(*file.path, ec);
  if(ec) {
    throw HowlError(ErrorKind::Configuration, "Unable to read " + *file.path + ": " + ec.message());
  }
  file.size = size;
  if(file.name.empty()) file.name = std::filesystem::path(*file.path).filename().string();
  if(file.id.empty()) file.id = file.name;
  if(!file.mime_type) file.mime_type = mime_type_for(*file.path);
  {
    std::lock_guard<std::mutex> lock(files_mutex_);
    files_[file.id] = file;
  }

  HttpServer::Options server_options;
  server_options.shutdown_grace = options_.shutdown_grace;
  server_options.io_timeout = options_.io_timeout;
  server_ = HttpServer::create(io_, logger_, server_options);
  register_routes(server_->routes());

  std::weak_ptr<FileSender> weak = shared_from_this();
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
  logger_->debug("Serving {} ({}) as {}", file.name, format_bytes(file.size), file.id);
  return port;
}

void FileSender::register_routes(httplib::Server& routes) {
  std::weak_ptr<FileSender> weak = shared_from_this();
  routes.Get("/", bind_route(weak, &FileSender::handle_index));
  routes.Get("/index.html", bind_route(weak, &FileSender::handle_index));
  routes.Get("/verify", bind_route(weak, &FileSender::handle_verify_get));
  routes.Post("/verify", bind_route(weak, &FileSender::handle_verify));
  routes.Get("/health", bind_route(weak, &FileSender::handle_health));
  routes.Get("/files", bind_route(weak, &FileSender::handle_files));
  // Last, so the fixed paths above win. HEAD is routed here too.
  routes.Get(R"(/(.+))", bind_route(weak, &FileSender::handle_download));
  routes.Post(R"(/(.+))", bind_route(weak, &FileSender::handle_not_allowed));
  routes.Put(R"(/(.+))", bind_route(weak, &FileSender::handle_not_allowed));
}

std::future<void> FileSender::stop() {
  auto done = std::make_shared<std::promise<void>>();
  auto future = done->get_future();
  if(!server_) {
    cleanup();
    done->set_value();
    return future;
  }
  server_->stop([done]{ done->set_value(); });
  return future;
}

std::uint16_t FileSender::port() const {
  return server_ ? server_->port() : 0;
}

bool FileSender::running() const {
  return server_ && server_->running();
}

std::optional<FileMetadata> FileSender::file() const {
  std::lock_guard<std::mutex> lock(files_mutex_);
  if(files_.empty()) return std::nullopt;
  return files_.begin()->second;
}

void FileSender::dispatch(std::function<void(FileSender&)> fn) {
  std::weak_ptr<FileSender> weak = shared_from_this();
  asio::post(io_, [weak, fn = std::move(fn)]{
    if(auto self = weak.lock()) fn(*self);
  });
}

void FileSender::cleanup() {
  {
    std::lock_guard<std::mutex> lock(files_mutex_);
    files_.clear();
  }
  verification_.clear_sessions();
}

void FileSender::handle_index(const httplib::Request&, httplib::Response& res) {
  res.set_content(kIndexPage, "text/html; charset=utf-8");
}

void FileSender::handle_verify_get(const httplib::Request&, httplib::Response&) {
  throw HowlError(ErrorKind::Client, "Use POST for /verify");
}

void FileSender::handle_not_allowed(const httplib::Request& req,
                                    httplib::Response& res,
                                    const httplib::ContentReader& reader) {
  if(!discard_request_body(req, reader)) res.set_header("Connection", "close");
  reply_error(res, 405, "Method not allowed");
}

void FileSender::handle_verify(const httplib::Request& req,
                               httplib::Response& res,
                               const httplib::ContentReader& reader) {
  const auto body = read_request_body(req, reader, kMaxVerifyBody);
  std::string code;
  try {
    auto data = json::parse(body);
    code = data.at("code").get<std::string>();
  } catch(const json::exception&) {
    reply_error(res, 400, "Invalid request");
    return;
  }

  VerificationEvent event{req.remote_addr, iso8601_utc()};
  auto result = verification_.verify_and_create_session(code);
  if(!result.valid) {
    logger_->debug("Rejected verification code from {}", event.client_ip);
    dispatch([event](FileSender& self){ self.verification_failed.emit(event); });
    reply_json(res, 200, {
      {"success", false},
      {"message", "Invalid verification code"}
    });
    return;
  }
  logger_->debug("Client {} verified", event.client_ip);
  dispatch([event](FileSender& self){ self.verified.emit(event); });
  reply_json(res, 200, {
    {"success", true},
    {"sessionToken", *result.session_token}
  });
}

void FileSender::handle_health(const httplib::Request&, httplib::Response& res) {
  std::size_t file_count = 0;
  {
    std::lock_guard<std::mutex> lock(files_mutex_);
    file_count = files_.size();
  }
  json remaining;
  if(options_.max_downloads == 0) {
    remaining = "∞";
  } else {
    auto count = download_count_.load();
    remaining = count >= options_.max_downloads ? 0u : options_.max_downloads - count;
  }
  reply_json(res, 200, {
    {"status", "ok"},
    {"files", file_count},
    {"downloadsRemaining", remaining}
  });
}

void FileSender::handle_files(const httplib::Request&, httplib::Response& res) {
  auto list = json::array();
  {
    std::lock_guard<std::mutex> lock(files_mutex_);
    for(const auto& entry : files_) {
      const auto& file = entry.second;
      list.push_back({
        {"id", file.id},
        {"name", file.name},
        {"size", file.size},
        {"mimeType", file.mime_type.value_or("application/octet-stream")}
      });
    }
  }
  reply_json(res, 200, list);
}

std::optional<FileMetadata> FileSender::find_file(const std::string& id_or_name) const {
  std::lock_guard<std::mutex> lock(files_mutex_);
  auto it = files_.find(id_or_name);
  if(it != files_.end()) return it->second;
  for(const auto& entry : files_) {
    if(entry.second.name == id_or_name) return entry.second;
  }
  return std::nullopt;
}

void FileSender::handle_download(const httplib::Request& req, httplib::Response& res) {
  const auto file_id = std::filesystem::path(req.path).filename().string();
  const auto token = req.has_param("token")
    ? req.get_param_value("token")
    : req.get_header_value("X-Session-Token");

  const auto user_agent = req.get_header_value("User-Agent");
  ConnectionEvent client{classify_user_agent(user_agent), req.remote_addr, user_agent, iso8601_utc()};
  dispatch([client](FileSender& self){ self.connection.emit(client); });

  if(options_.require_verification && !verification_.is_session_verified(token)) {
    logger_->debug("Unverified request for {} from {}", file_id, client.client_ip);
    dispatch([client](FileSender& self){ self.verification_required.emit(client); });
    reply_error(res, 403, "Verification required. Please verify first.");
    return;
  }

  auto file = find_file(file_id);
  if(!file) {
    throw HowlError(ErrorKind::NotFound, "File not found");
  }

  if(options_.max_downloads > 0 && download_count_.load() >= options_.max_downloads) {
    throw HowlError(ErrorKind::Quota, "Download limit reached");
  }

  std::error_code ec;
  const auto size = std::filesystem::file_size(*file->path, ec);
  if(ec) {
    dispatch([path = *file->path](FileSender& self){ self.error.emit("File is no longer readable: " + path); });
    throw HowlError(ErrorKind::NotFound, "File not found");
  }

  const auto mime = file->mime_type.value_or("application/octet-stream");
  res.set_header("Content-Disposition", attachment_disposition(file->name));
  res.set_header("Accept-Ranges", "bytes");

  // httplib slices the provider output to the requested range and answers
  // 206 on its own; only the unsatisfiable case is decided here.
  ByteRange range{0, size > 0 ? size - 1 : 0};
  const bool ranged = req.has_header("Range");
  if(ranged) {
    auto parsed = parse_range(req.get_header_value("Range"), size);
    if(!parsed) {
      res.set_header("Content-Range", "bytes */" + std::to_string(size));
      reply_error(res, 416, "Requested range not satisfiable");
      return;
    }
    range = *parsed;
  }

  // HEAD gets the same headers but is neither a transfer nor a download.
  const bool head = req.method == "HEAD";
  if(size == 0) {
    res.set_content(std::string(), mime);
    if(!head) finish_download(*file, client, false, true);
    return;
  }

  auto stream = std::make_shared<std::ifstream>(*file->path, std::ios::binary);
  if(!*stream) {
    throw HowlError(ErrorKind::Internal, "Unable to read file");
  }

  if(head) {
    res.set_content_provider(static_cast<std::size_t>(size), mime,
      [](std::size_t, std::size_t, httplib::DataSink&){ return false; });
    return;
  }

  TransferEvent started_event;
  started_event.file_id = file->id;
  started_event.file_name = file->name;
  started_event.transfer_type = client.transfer_type;
  started_event.client_ip = client.client_ip;
  started_event.timestamp = iso8601_utc();
  started_event.offset = range.start;
  started_event.length = range.length();
  started_event.download_count = download_count_.load();
  started_event.max_downloads = options_.max_downloads;
  logger_->debug("Sending {} bytes of {} to {} from offset {}",
                 range.length(), file->name, client.client_ip, range.start);
  dispatch([started_event](FileSender& self){ self.transfer_started.emit(started_event); });

  auto tracker = std::make_shared<ProgressTracker>(file->id, file->name, size, range.start);
  std::weak_ptr<FileSender> weak = shared_from_this();
  auto meta = *file;
  res.set_content_provider(static_cast<std::size_t>(size), mime,
    [weak, stream, tracker, meta](std::size_t offset, std::size_t length, httplib::DataSink& sink){
      auto self = weak.lock();
      if(!self || self->stopping()) return false;
      std::vector<char> chunk(std::min(length, kChunkSize));
      stream->seekg(static_cast<std::streamoff>(offset));
      stream->read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
      const auto got = stream->gcount();
      if(got <= 0) {
        self->logger_->error("Short read while streaming {} at offset {}", meta.name, offset);
        return false;
      }
      if(!sink.write(chunk.data(), static_cast<std::size_t>(got))) return false;
      auto update = tracker->update(offset + static_cast<std::uint64_t>(got));
      self->dispatch([update](FileSender& sender){ sender.progress.emit(update); });
      return true;
    },
    [weak, meta, client, ranged](bool success){
      if(auto self = weak.lock()) self->finish_download(meta, client, ranged, success);
    });
}

// Runs on the worker thread once the response has been written or dropped.
void FileSender::finish_download(const FileMetadata& file,
                                 const ConnectionEvent& client,
                                 bool ranged,
                                 bool ok) {
  if(!ok) {
    logger_->warn("Transfer of {} to {} was interrupted", file.name, client.client_ip);
    dispatch([message = "Transfer of " + file.name + " to " + client.client_ip + " was interrupted"](FileSender& self){
      self.error.emit(message);
    });
    return;
  }

  const auto count = ++download_count_;
  TransferEvent event;
  event.file_id = file.id;
  event.file_name = file.name;
  event.transfer_type = client.transfer_type;
  event.client_ip = client.client_ip;
  event.timestamp = iso8601_utc();
  event.download_count = count;
  event.max_downloads = options_.max_downloads;
  logger_->info("{} downloaded {} ({})", client.client_ip, file.name, to_string(client.transfer_type));

  const bool limit_hit = options_.max_downloads > 0 && count >= options_.max_downloads &&
                         !limit_signalled_.exchange(true);
  const LimitEvent limit{count, options_.max_downloads};
  dispatch([event, file, ranged, limit_hit, limit](FileSender& self){
    self.transfer_completed.emit(event);
    if(!ranged) self.completed.emit(file);
    if(limit_hit) self.download_limit_reached.emit(limit);
  });
}
