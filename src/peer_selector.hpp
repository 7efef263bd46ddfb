#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "discovery.hpp"
#include "log.hpp"
#include "signal.hpp"
#include "types.hpp"

// Shows the discovered peers and reads the user's decision.
class SelectionPrompt {
public:
  enum class Action {
    Select,
    SearchAgain,
    Cancel
  };

  struct Choice {
    Action action = Action::Cancel;
    std::size_t index = 0;  // into the peers passed to choose()
  };

  virtual ~SelectionPrompt() = default;
  virtual Choice choose(const std::vector<ServiceInfo>& peers) = 0;
};

// Keeps browsing for peers of one role and decides when the menu appears:
// a fixed delay after the first peer shows up, never with an empty list,
// and a bounded re-search window when peers are already known.
//
// The blocking calls belong on a prompt thread; browser signals may arrive
// from any thread.
class PeerSelector {
public:
  struct Options {
    PeerRole wanted_role = PeerRole::Unknown;  // Unknown accepts every role
    std::chrono::milliseconds menu_delay{3000};
    std::chrono::milliseconds research_window{5000};
  };

  PeerSelector(ServiceBrowser& browser, Options options, std::shared_ptr<Logger> logger = nullptr);
  ~PeerSelector();

  PeerSelector(const PeerSelector&) = delete;
  PeerSelector& operator=(const PeerSelector&) = delete;

  void start();
  // Wakes every blocked call; they return false / nullopt.
  void stop();
  bool stopped() const;

  // Blocks until a peer is known and menu_delay has passed since the first one appeared.
  bool wait_for_menu();
  // With peers known, browses for research_window; with none, until one appears.
  bool search_again();
  // Menu loop. Empty result means the user declined or the selector stopped.
  std::optional<ServiceInfo> run(SelectionPrompt& prompt);

  std::vector<ServiceInfo> peers() const;

  Signal<ServiceInfo> peer_found;
  Signal<ServiceInfo> peer_lost;

private:
  using Clock = std::chrono::steady_clock;

  bool accepts(const ServiceInfo& info) const;
  void on_service_up(const ServiceInfo& info);
  void on_service_down(const ServiceInfo& info);
  bool wait_for_peer(std::unique_lock<std::mutex>& lock);

  ServiceBrowser& browser_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  SignalHandle up_handle_ = 0;
  SignalHandle down_handle_ = 0;

  mutable std::mutex mutex_;
  std::condition_variable changed_;
  std::map<std::string, ServiceInfo> peers_;  // by host:port
  std::optional<Clock::time_point> first_found_;
  bool started_ = false;
  bool stopped_ = false;
};
