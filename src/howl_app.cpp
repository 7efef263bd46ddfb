#include "howl_app.hpp"

#include <csignal>
#include <future>
#include <stdexcept>

#include "console_prompt.hpp"
#include "discovery.hpp"
#include "errors.hpp"
#include "file_receiver.hpp"
#include "file_sender.hpp"
#include "firewall.hpp"
#include "peer_selector.hpp"
#include "settings_manager.hpp"
#include "transfer_client.hpp"
#include "utils.hpp"

namespace {

constexpr std::chrono::milliseconds kProgressInterval{500};

std::string limit_text(unsigned limit) {
  return limit == 0 ? std::string("unlimited") : std::to_string(limit);
}

} // namespace

HowlApp::Options HowlApp::options_from_settings(const SettingsManager& settings) {
  Options options;
  const auto command = to_lower(settings.get<std::string>("command"));
  if(command == "send") {
    options.mode = Mode::Send;
    options.file = settings.get<std::string>("file");
    if(options.file.empty()) {
      throw HowlError(ErrorKind::Client, "Missing file to send");
    }
  } else if(command == "receive") {
    options.mode = Mode::Receive;
  } else if(command.empty()) {
    throw HowlError(ErrorKind::Client, "Missing command (send or receive)");
  } else {
    throw HowlError(ErrorKind::Client, "Unknown command '" + command + "'");
  }

  int port = settings.get<int>("port");
  if(port < 0 || port > 65535) {
    throw HowlError(ErrorKind::Client, "Invalid port " + std::to_string(port));
  }
  options.port = static_cast<std::uint16_t>(port);

  int limit = settings.get<int>("limit");
  if(limit < 0) {
    throw HowlError(ErrorKind::Client, "Invalid limit " + std::to_string(limit));
  }
  options.limit = static_cast<unsigned>(limit);

  options.name = settings.get<std::string>("name");
  if(options.name.empty()) options.name = local_hostname();
  options.require_verification = !settings.get<bool>("no_verification");
  options.per_file_verification = settings.get<bool>("upload_verify");
  options.output = settings.get<std::string>("output");
  options.enable_lan = !settings.get<bool>("disable_lan");
  options.skip_firewall = settings.get<bool>("skip_firewall");
  options.debug = settings.get<bool>("debug");
  return options;
}

std::shared_ptr<HowlApp> HowlApp::create(Options options, std::shared_ptr<Logger> logger) {
  return std::shared_ptr<HowlApp>(new HowlApp(std::move(options), std::move(logger)));
}

HowlApp::HowlApp(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("howl", options_.debug)),
    work_(asio::make_work_guard(io_)),
    signals_(io_, SIGINT, SIGTERM) {}

HowlApp::~HowlApp() {
  shutdown();
}

void HowlApp::start() {
  if(started_) return;
  started_ = true;

  peer_id_ = generate_peer_id();
  port_ = find_available_port(io_, options_.port, logger_.get());
  logger_->debug("Using port {}", port_);
  check_firewall();

  io_thread_ = std::thread([this]{ io_.run(); });
  watch_signals();

  client_ = TransferClient::create(io_, TransferClient::Options{}, logger_->child("client"));

  try {
    if(options_.mode == Mode::Send) {
      start_sender();
    } else {
      start_receiver();
    }
    if(options_.enable_lan) {
      start_discovery();
    }
  } catch(...) {
    shutdown();
    throw;
  }

  if(selector_ && options_.interactive) {
    prompt_done_ = false;
    auto self = shared_from_this();
    prompt_thread_ = std::thread([self]{
      self->prompt_loop();
      self->prompt_done_ = true;
    });
  }
}

void HowlApp::check_firewall() {
  if(options_.skip_firewall) return;
  auto result = FirewallHelper::ensure_port_allowed(port_);
  if(result.success) {
    logger_->debug("{}", result.message);
    return;
  }
  logger_->warn("{}", result.message);
  logger_->print("{}", FirewallHelper::manual_instructions(port_));
  logger_->warn("Continuing without firewall rule, other devices may not be able to connect");
}

void HowlApp::watch_signals() {
  std::weak_ptr<HowlApp> weak = shared_from_this();
  signals_.async_wait([weak](const std::error_code& ec, int signal_number){
    if(ec) return;
    if(auto self = weak.lock()) {
      self->logger_->print("");
      self->logger_->print("Shutting down...");
      self->logger_->debug("Signal {}", signal_number);
      self->request_shutdown(0);
    }
  });
}

void HowlApp::show_server_info(const std::string& code) const {
  logger_->print("");
  logger_->print("Server ready on 0.0.0.0:{}", port_);
  auto addresses = local_ipv4_addresses();
  if(addresses.empty()) addresses.push_back("localhost");
  for(const auto& address : addresses) {
    logger_->print("  http://{}:{}", address, port_);
  }
  if(!code.empty()) {
    logger_->print("Verification code: {}", code);
  }
  logger_->print("");
}

void HowlApp::start_sender() {
  std::error_code ec;
  auto absolute = std::filesystem::absolute(options_.file, ec);
  if(ec) absolute = options_.file;

  FileSender::Options sender_options;
  sender_options.port = port_;
  sender_options.max_downloads = options_.limit;
  sender_options.require_verification = options_.require_verification;
  sender_ = FileSender::create(io_, sender_options, logger_->child("sender"));

  auto logger = logger_;
  sender_->connection.connect([logger](const FileSender::ConnectionEvent& event){
    logger->print("Incoming connection from {} ({})", event.client_ip, to_string(event.transfer_type));
  });
  sender_->verified.connect([logger](const FileSender::VerificationEvent& event){
    logger->print("Verification successful from {}", event.client_ip);
  });
  sender_->verification_failed.connect([logger](const FileSender::VerificationEvent& event){
    logger->print("Verification failed from {} (invalid code)", event.client_ip);
  });
  sender_->verification_required.connect([logger](const FileSender::ConnectionEvent& event){
    logger->print("Verification required for {} ({})", event.client_ip, to_string(event.transfer_type));
  });
  sender_->transfer_started.connect([logger](const FileSender::TransferEvent& event){
    logger->print("Transfer started to {} ({})", event.client_ip, to_string(event.transfer_type));
    logger->print("  File: {} | Time: {}", event.file_name, event.timestamp);
  });

  std::weak_ptr<HowlApp> weak = shared_from_this();
  sender_->progress.connect([weak](const TransferProgress& progress){
    if(auto self = weak.lock()) self->print_progress("Transfer", progress);
  });
  sender_->transfer_completed.connect([logger](const FileSender::TransferEvent& event){
    logger->print("Transfer completed! ({}/{})", event.download_count, limit_text(event.max_downloads));
    logger->print("  Client: {} | Type: {}", event.client_ip, to_string(event.transfer_type));
  });
  sender_->error.connect([logger](const std::string& message){
    logger->print_err("Error: {}", message);
  });
  sender_->download_limit_reached.connect([weak](const FileSender::LimitEvent& event){
    if(auto self = weak.lock()) {
      self->logger_->print("Download limit reached ({}/{}). Shutting down...", event.current_count, event.max_downloads);
      self->request_shutdown(0);
    }
  });

  FileMetadata file;
  file.path = absolute.string();
  sender_->start(file);

  auto served = sender_->file();
  if(served) {
    logger_->print("Sending {} ({})", served->name, format_bytes(served->size));
  }
  if(options_.require_verification) {
    show_server_info(sender_->verification_code());
  } else {
    logger_->warn("Verification is disabled, anyone on the network can download this file");
    show_server_info(std::string());
  }
  logger_->print("Waiting for receivers (limit: {})...", limit_text(options_.limit));
}

void HowlApp::start_receiver() {
  FileReceiver::Options receiver_options;
  receiver_options.port = port_;
  receiver_options.max_uploads = options_.limit;
  receiver_options.upload_dir = options_.output;
  receiver_options.per_file_verification = options_.per_file_verification;
  receiver_ = FileReceiver::create(io_, receiver_options, logger_->child("receiver"));

  auto logger = logger_;
  const bool per_file = options_.per_file_verification;
  receiver_->upload_requested.connect([logger, per_file](const FileReceiver::UploadRequestEvent& event){
    logger->print("Upload request from {}: {} ({})", event.client_ip, event.filename, format_bytes(event.size));
    if(per_file) {
      logger->print("Verification code for this file: {}", event.verification_code);
    } else {
      logger->print("Give the sender the verification code: {}", event.verification_code);
    }
  });
  receiver_->upload_verified.connect([logger](const FileReceiver::UploadEvent& event){
    logger->print("Receiving {} from {}", event.filename, event.client_ip);
  });
  receiver_->verification_failed.connect([logger](const FileReceiver::UploadEvent& event){
    logger->print("Verification failed from {} (invalid code)", event.client_ip);
  });

  std::weak_ptr<HowlApp> weak = shared_from_this();
  receiver_->progress.connect([weak](const TransferProgress& progress){
    if(auto self = weak.lock()) self->print_progress("Upload", progress);
  });
  receiver_->upload_completed.connect([logger](const FileReceiver::UploadCompletedEvent& event){
    logger->print("Received: {} ({}) ({}/{})",
                  event.file.name,
                  format_bytes(event.file.size),
                  event.upload_count,
                  limit_text(event.max_uploads));
  });
  receiver_->error.connect([logger](const std::string& message){
    logger->print_err("Error: {}", message);
  });
  receiver_->upload_limit_reached.connect([weak](const FileReceiver::LimitEvent& event){
    if(auto self = weak.lock()) {
      self->logger_->print("Upload limit reached ({} files). Shutting down server...", event.max_uploads);
      self->request_shutdown(0);
    }
  });

  receiver_->start();
  show_server_info(per_file ? std::string() : receiver_->global_verification_code());
  logger_->print("Saving to {}", options_.output.string());
  logger_->print("Limit: {} uploads", limit_text(options_.limit));
}

void HowlApp::start_discovery() {
  discovery_ = Discovery::create(io_, Discovery::Options{}, logger_->child("discovery"));
  auto logger = logger_;
  discovery_->error.connect([logger](const std::string& message){
    logger->warn("Discovery: {}", message);
  });

  std::map<std::string, std::string> txt;
  PeerSelector::Options selector_options;
  if(options_.mode == Mode::Send) {
    txt["role"] = to_string(PeerRole::Sender);
    if(auto served = sender_->file()) {
      txt["fileName"] = served->name;
      txt["fileSize"] = std::to_string(served->size);
    }
    selector_options.wanted_role = PeerRole::Receiver;
  } else {
    txt["role"] = to_string(PeerRole::Receiver);
    selector_options.wanted_role = PeerRole::Sender;
  }
  discovery_->advertise(peer_id_, options_.name, port_, txt);
  logger_->print("Broadcasting on local network as {}", options_.name);

  selector_ = std::make_unique<PeerSelector>(*discovery_, selector_options, logger_->child("selector"));
  selector_->peer_found.connect([logger](const ServiceInfo& info){
    logger->print("Found: {} ({}:{})", info.display_name(), info.host, info.port);
  });
  selector_->peer_lost.connect([logger](const ServiceInfo& info){
    logger->print("Left: {}", info.display_name());
  });
  selector_->start();
}

void HowlApp::prompt_loop() {
  ConsolePrompt prompt(options_.mode == Mode::Send ? "receiver" : "sender", logger_->child("prompt"));
  auto peer = selector_->run(prompt);
  if(shutting_down()) return;
  if(!peer) {
    logger_->print("No device selected, continuing in server mode...");
    return;
  }
  bool ok = options_.mode == Mode::Send ? upload_to(*peer, prompt) : download_from(*peer, prompt);
  if(shutting_down()) return;
  if(ok) {
    logger_->print("Server still running, waiting for more connections...");
  } else {
    logger_->print("Server still running...");
  }
}

bool HowlApp::upload_to(const ServiceInfo& peer, ConsolePrompt& prompt) {
  logger_->print("Connecting to {} ({}:{})...", peer.display_name(), peer.host, peer.port);
  try {
    auto ticket = client_->request_upload(peer.host, peer.port, options_.file.string()).get();
    if(!ticket.message.empty()) logger_->print("{}", ticket.message);
    auto code = prompt.prompt_code("Enter the 6-digit verification code from the receiver:");
    if(!code) {
      logger_->print("Cancelled");
      return false;
    }
    auto handle = client_->progress.connect([this](const TransferProgress& progress){
      print_progress("Upload", progress);
    });
    std::future<FileMetadata> pending = client_->send_upload(peer.host, peer.port, ticket, *code);
    try {
      auto stored = pending.get();
      client_->progress.disconnect(handle);
      logger_->print("Uploaded: {} ({})", stored.name, format_bytes(stored.size));
      return true;
    } catch(...) {
      client_->progress.disconnect(handle);
      throw;
    }
  } catch(const std::exception& e) {
    logger_->print_err("Upload failed: {}", e.what());
    return false;
  }
}

bool HowlApp::download_from(const ServiceInfo& peer, ConsolePrompt& prompt) {
  logger_->print("Connecting to {} ({}:{})...", peer.display_name(), peer.host, peer.port);
  auto code = prompt.prompt_code("Enter verification code:");
  if(!code) {
    logger_->print("Cancelled, continuing in server mode...");
    return false;
  }
  try {
    if(!client_->verify(peer.host, peer.port, *code).get()) {
      logger_->print_err("Verification failed");
      return false;
    }
    logger_->print("Verified");

    std::string file_id;
    auto advertised = peer.txt.find("fileName");
    if(advertised != peer.txt.end() && !advertised->second.empty()) {
      file_id = advertised->second;
    } else {
      auto files = client_->fetch_file_list(peer.host, peer.port).get();
      if(files.empty()) {
        logger_->print_err("{} is not offering any file", peer.display_name());
        return false;
      }
      file_id = files.front().id;
    }

    std::error_code ec;
    std::filesystem::create_directories(options_.output, ec);
    if(ec) {
      throw HowlError(ErrorKind::Configuration,
                      "Unable to create " + options_.output.string() + ": " + ec.message());
    }
    auto output_path = options_.output / std::filesystem::path(file_id).filename();
    logger_->print("Downloading: {}", output_path.filename().string());

    auto handle = client_->progress.connect([this](const TransferProgress& progress){
      print_progress("Download", progress);
    });
    std::future<FileMetadata> pending = client_->download(peer.host, peer.port, file_id, output_path.string());
    try {
      auto file = pending.get();
      client_->progress.disconnect(handle);
      logger_->print("Downloaded: {} ({})", output_path.string(), format_bytes(file.size));
      return true;
    } catch(...) {
      client_->progress.disconnect(handle);
      throw;
    }
  } catch(const std::exception& e) {
    logger_->print_err("Download failed: {}", e.what());
    return false;
  }
}

void HowlApp::print_progress(const char* label, const TransferProgress& progress) {
  const auto now = std::chrono::steady_clock::now();
  const bool done = progress.total > 0 && progress.transferred >= progress.total;
  {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    if(!done && now - last_progress_ < kProgressInterval) return;
    last_progress_ = now;
  }
  logger_->print("{} {:5.1f}% | {}/{} | Speed: {} | ETA: {}",
                 label,
                 progress.percentage,
                 format_bytes(progress.transferred),
                 format_bytes(progress.total),
                 format_speed(progress.speed),
                 format_time(progress.eta));
}

void HowlApp::request_shutdown(int exit_code) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if(shutdown_requested_) return;
    shutdown_requested_ = true;
    exit_code_ = exit_code;
  }
  shutdown_cv_.notify_all();
}

bool HowlApp::shutting_down() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return shutdown_requested_;
}

int HowlApp::run() {
  if(!started_) start();
  {
    std::unique_lock<std::mutex> lock(state_mutex_);
    shutdown_cv_.wait(lock, [this]{ return shutdown_requested_; });
  }
  shutdown();
  std::lock_guard<std::mutex> lock(state_mutex_);
  return exit_code_;
}

void HowlApp::shutdown() {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if(stopped_) return;
    stopped_ = true;
    shutdown_requested_ = true;
  }
  shutdown_cv_.notify_all();

  if(selector_) selector_->stop();

  if(sender_) {
    auto done = sender_->stop();
    if(done.wait_for(options_.stop_timeout) != std::future_status::ready) {
      logger_->warn("Sender did not stop in time");
    }
  }
  if(receiver_) {
    auto done = receiver_->stop();
    if(done.wait_for(options_.stop_timeout) != std::future_status::ready) {
      logger_->warn("Receiver did not stop in time");
    }
  }
  if(discovery_) {
    auto done = discovery_->destroy();
    if(done.wait_for(options_.stop_timeout) != std::future_status::ready) {
      logger_->warn("Discovery did not shut down in time");
    }
  }

  std::error_code ignored;
  signals_.cancel(ignored);
  work_.reset();
  io_.stop();
  if(io_thread_.joinable()) {
    if(io_thread_.get_id() == std::this_thread::get_id()) {
      io_thread_.detach();
    } else {
      io_thread_.join();
    }
  }

  // A prompt still blocked in readline cannot be woken; the process is
  // about to exit, so it is left behind holding its own reference.
  if(prompt_thread_.joinable()) {
    if(prompt_done_ && prompt_thread_.get_id() != std::this_thread::get_id()) {
      prompt_thread_.join();
    } else {
      prompt_thread_.detach();
    }
  }
}
