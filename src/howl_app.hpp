#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "log.hpp"
#include "types.hpp"

class ConsolePrompt;
class Discovery;
class FileReceiver;
class FileSender;
class PeerSelector;
class SettingsManager;
class TransferClient;

// One `howl send` or `howl receive` session: local server, mDNS presence,
// the interactive selection flow and the transfer it leads to.
//
// The io_context runs on its own thread; the selection flow runs on a
// prompt thread and blocks on client futures there. run() waits on the
// calling thread until the transfer limit is reached or a signal arrives.
class HowlApp : public std::enable_shared_from_this<HowlApp> {
public:
  enum class Mode {
    Send,
    Receive
  };

  struct Options {
    Mode mode = Mode::Receive;
    std::filesystem::path file;  // send only
    std::uint16_t port = 0;
    std::string name;
    unsigned limit = 1;  // downloads or uploads, 0 = unlimited
    bool require_verification = true;
    bool per_file_verification = false;
    std::filesystem::path output = "downloads";
    bool enable_lan = true;
    bool skip_firewall = false;
    bool debug = false;
    bool interactive = true;
    std::chrono::milliseconds stop_timeout{1500};
  };

  // Throws HowlError(Client) for a missing or unknown command or a send without a file.
  static Options options_from_settings(const SettingsManager& settings);

  static std::shared_ptr<HowlApp> create(Options options, std::shared_ptr<Logger> logger = nullptr);
  ~HowlApp();

  // Picks the port, starts the server and discovery. Throws HowlError(Configuration).
  void start();
  // Blocks until shutdown, then tears everything down. Returns the exit code.
  int run();
  void request_shutdown(int exit_code = 0);

  std::uint16_t port() const { return port_; }
  const Options& options() const { return options_; }

private:
  HowlApp(Options options, std::shared_ptr<Logger> logger);

  void start_sender();
  void start_receiver();
  void start_discovery();
  void check_firewall();
  void watch_signals();
  void show_server_info(const std::string& code) const;

  void prompt_loop();
  bool upload_to(const ServiceInfo& peer, ConsolePrompt& prompt);
  bool download_from(const ServiceInfo& peer, ConsolePrompt& prompt);

  void print_progress(const char* label, const TransferProgress& progress);
  bool shutting_down() const;
  void shutdown();

  Options options_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  asio::executor_work_guard<asio::io_context::executor_type> work_;
  asio::signal_set signals_;
  std::thread io_thread_;
  std::thread prompt_thread_;
  std::atomic<bool> prompt_done_{true};

  std::string peer_id_;
  std::uint16_t port_ = 0;
  std::shared_ptr<FileSender> sender_;
  std::shared_ptr<FileReceiver> receiver_;
  std::shared_ptr<TransferClient> client_;
  std::shared_ptr<Discovery> discovery_;
  std::unique_ptr<PeerSelector> selector_;

  mutable std::mutex state_mutex_;
  std::condition_variable shutdown_cv_;
  bool shutdown_requested_ = false;
  int exit_code_ = 0;
  bool started_ = false;
  bool stopped_ = false;

  std::mutex progress_mutex_;
  std::chrono::steady_clock::time_point last_progress_{};
};
