#include "console_prompt.hpp"
#include "peer_selector.hpp"
#include "test_runner_utils.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <future>
#include <mutex>
#include <string>
#include <vector>

namespace {

using howl::test::TestCase;
using howl::test::TestContext;
using namespace std::chrono_literals;

class ScriptedBrowser : public ServiceBrowser {
public:
  void start_discovery() override { ++queries; }
  void stop_discovery() override {}
  std::vector<ServiceInfo> discovered_services() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return known_;
  }

  void seed(const ServiceInfo& info) {
    std::lock_guard<std::mutex> lock(mutex_);
    known_.push_back(info);
  }

  std::atomic<int> queries{0};

private:
  mutable std::mutex mutex_;
  std::vector<ServiceInfo> known_;
};

class ScriptedPrompt : public SelectionPrompt {
public:
  explicit ScriptedPrompt(std::deque<Choice> script) : script_(std::move(script)) {}

  Choice choose(const std::vector<ServiceInfo>& peers) override {
    std::lock_guard<std::mutex> lock(mutex_);
    shown_.push_back(peers.size());
    if(script_.empty()) return Choice{Action::Cancel, 0};
    auto next = script_.front();
    script_.pop_front();
    return next;
  }

  std::vector<std::size_t> shown_counts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shown_;
  }

private:
  mutable std::mutex mutex_;
  std::deque<Choice> script_;
  std::vector<std::size_t> shown_;
};

ServiceInfo peer(const std::string& name, std::uint16_t port, const std::string& role) {
  ServiceInfo info;
  info.id = name + "-id";
  info.name = name;
  info.host = "192.168.1.10";
  info.port = port;
  info.txt = {{"id", info.id}, {"name", name}, {"role", role}};
  return info;
}

PeerSelector::Options fast_options(PeerRole role = PeerRole::Unknown) {
  PeerSelector::Options options;
  options.wanted_role = role;
  options.menu_delay = 150ms;
  options.research_window = 200ms;
  return options;
}

template<typename T>
bool still_blocked(std::future<T>& future, std::chrono::milliseconds wait) {
  return future.wait_for(wait) == std::future_status::timeout;
}

template<typename T>
bool finishes(std::future<T>& future) {
  return future.wait_for(5s) == std::future_status::ready;
}

bool test_menu_waits_for_first_peer_and_delay(TestContext&) {
  ScriptedBrowser browser;
  PeerSelector selector(browser, fast_options());
  selector.start();

  auto menu = std::async(std::launch::async, [&]{ return selector.wait_for_menu(); });
  if(!still_blocked(menu, 300ms)) return false;

  const auto found_at = std::chrono::steady_clock::now();
  browser.service_up.emit(peer("Desk", 40000, "sender"));
  if(!finishes(menu) || !menu.get()) return false;
  const auto waited = std::chrono::steady_clock::now() - found_at;
  return waited >= 140ms && browser.queries.load() >= 1;
}

bool test_role_filtering(TestContext&) {
  ScriptedBrowser browser;
  PeerSelector selector(browser, fast_options(PeerRole::Receiver));
  std::atomic<int> found{0};
  selector.peer_found.connect([&](const ServiceInfo&){ ++found; });
  selector.start();

  browser.service_up.emit(peer("Sender", 40000, "sender"));
  browser.service_up.emit(peer("NoRole", 40001, ""));
  browser.service_up.emit(peer("Inbox", 40002, "receiver"));
  // the same peer re-announced is not a new peer
  browser.service_up.emit(peer("Inbox", 40002, "receiver"));

  auto list = selector.peers();
  return list.size() == 1 && list.front().name == "Inbox" && found.load() == 1;
}

bool test_already_known_services_are_picked_up(TestContext&) {
  ScriptedBrowser browser;
  browser.seed(peer("Early", 40010, "sender"));
  PeerSelector selector(browser, fast_options(PeerRole::Sender));
  selector.start();
  return selector.peers().size() == 1;
}

bool test_lost_peer_is_removed(TestContext&) {
  ScriptedBrowser browser;
  PeerSelector selector(browser, fast_options());
  std::atomic<int> lost{0};
  selector.peer_lost.connect([&](const ServiceInfo&){ ++lost; });
  selector.start();

  auto desk = peer("Desk", 40000, "sender");
  browser.service_up.emit(desk);
  browser.service_down.emit(desk);
  browser.service_down.emit(desk);
  return selector.peers().empty() && lost.load() == 1;
}

bool test_search_again_without_peers_blocks(TestContext&) {
  ScriptedBrowser browser;
  PeerSelector selector(browser, fast_options());
  selector.start();
  const int queries_before = browser.queries.load();

  auto search = std::async(std::launch::async, [&]{ return selector.search_again(); });
  // well past research_window with nobody around
  if(!still_blocked(search, 500ms)) return false;
  browser.service_up.emit(peer("Late", 40020, "receiver"));
  return finishes(search) && search.get() && browser.queries.load() > queries_before;
}

bool test_search_again_with_peers_is_bounded(TestContext&) {
  ScriptedBrowser browser;
  PeerSelector selector(browser, fast_options());
  selector.start();
  browser.service_up.emit(peer("Desk", 40000, "sender"));

  const auto begin = std::chrono::steady_clock::now();
  auto search = std::async(std::launch::async, [&]{ return selector.search_again(); });
  if(!finishes(search) || !search.get()) return false;
  return std::chrono::steady_clock::now() - begin >= 190ms;
}

bool test_stop_wakes_blocked_calls(TestContext&) {
  ScriptedBrowser browser;
  PeerSelector selector(browser, fast_options());
  selector.start();
  auto menu = std::async(std::launch::async, [&]{ return selector.wait_for_menu(); });
  auto search = std::async(std::launch::async, [&]{ return selector.search_again(); });
  if(!still_blocked(menu, 100ms)) return false;
  selector.stop();
  bool ok = finishes(menu) && !menu.get() && finishes(search) && !search.get();
  // signals after stop no longer reach the selector
  browser.service_up.emit(peer("Desk", 40000, "sender"));
  return ok && selector.stopped() && selector.peers().empty() &&
         browser.service_up.slot_count() == 0;
}

bool test_run_selects_peer(TestContext&) {
  ScriptedBrowser browser;
  PeerSelector selector(browser, fast_options(PeerRole::Sender));
  selector.start();
  browser.service_up.emit(peer("A", 40000, "sender"));
  browser.service_up.emit(peer("B", 40001, "sender"));

  ScriptedPrompt prompt({{SelectionPrompt::Action::Select, 1}});
  auto chosen = selector.run(prompt);
  auto shown = prompt.shown_counts();
  return chosen && chosen->port == 40001 && shown.size() == 1 && shown[0] == 2;
}

bool test_run_search_again_then_select(TestContext&) {
  ScriptedBrowser browser;
  auto options = fast_options();
  options.research_window = 600ms;
  PeerSelector selector(browser, options);
  selector.start();
  browser.service_up.emit(peer("A", 40000, "receiver"));

  ScriptedPrompt prompt({
    {SelectionPrompt::Action::SearchAgain, 0},
    {SelectionPrompt::Action::Select, 7},  // out of range, menu comes back
    {SelectionPrompt::Action::Select, 0}
  });
  auto result = std::async(std::launch::async, [&]{ return selector.run(prompt); });
  std::this_thread::sleep_for(250ms);
  browser.service_up.emit(peer("B", 40001, "receiver"));
  if(!finishes(result)) return false;
  auto chosen = result.get();
  auto shown = prompt.shown_counts();
  return chosen.has_value() && shown.size() == 3 && shown[0] == 1 && shown[2] == 2;
}

bool test_run_cancel(TestContext&) {
  ScriptedBrowser browser;
  PeerSelector selector(browser, fast_options());
  selector.start();
  browser.service_up.emit(peer("A", 40000, "sender"));
  ScriptedPrompt prompt({{SelectionPrompt::Action::Cancel, 0}});
  return !selector.run(prompt) && prompt.shown_counts().size() == 1;
}

bool test_code_validation(TestContext&) {
  return ConsolePrompt::is_valid_code("123456") &&
         !ConsolePrompt::is_valid_code("12345") &&
         !ConsolePrompt::is_valid_code("1234567") &&
         !ConsolePrompt::is_valid_code("12a456") &&
         !ConsolePrompt::is_valid_code("");
}

bool test_service_info_helpers(TestContext&) {
  auto info = peer("Office", 40100, "receiver");
  ServiceInfo bare;
  bare.name = "fallback";
  bare.host = "10.0.0.2";
  bare.port = 1;
  return info.role() == PeerRole::Receiver &&
         info.key() == "192.168.1.10:40100" &&
         info.display_name() == "Office (192.168.1.10:40100)" &&
         bare.role() == PeerRole::Unknown &&
         bare.display_name() == "fallback (10.0.0.2:1)";
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"menu_waits_for_first_peer_and_delay", test_menu_waits_for_first_peer_and_delay},
    {"role_filtering", test_role_filtering},
    {"already_known_services_are_picked_up", test_already_known_services_are_picked_up},
    {"lost_peer_is_removed", test_lost_peer_is_removed},
    {"search_again_without_peers_blocks", test_search_again_without_peers_blocks},
    {"search_again_with_peers_is_bounded", test_search_again_with_peers_is_bounded},
    {"stop_wakes_blocked_calls", test_stop_wakes_blocked_calls},
    {"run_selects_peer", test_run_selects_peer},
    {"run_search_again_then_select", test_run_search_again_then_select},
    {"run_cancel", test_run_cancel},
    {"code_validation", test_code_validation},
    {"service_info_helpers", test_service_info_helpers}
  };
  return howl::test::run_suite("peer selector", tests, argc, argv);
}
