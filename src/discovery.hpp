#pragma once

#include <asio.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include "dns_message.hpp"
#include "log.hpp"
#include "signal.hpp"
#include "types.hpp"

// The part of discovery the selection flow depends on.
class ServiceBrowser {
public:
  virtual ~ServiceBrowser() = default;

  // Starts browsing, or sends a fresh query when already browsing.
  virtual void start_discovery() = 0;
  virtual void stop_discovery() = 0;
  virtual std::vector<ServiceInfo> discovered_services() const = 0;

  Signal<ServiceInfo> service_up;
  Signal<ServiceInfo> service_down;
};

// mDNS advertiser and browser for "_howl-share._tcp.local" on one UDP socket.
//
// Public calls may come from any thread; the protocol work runs on the
// io_context and every signal fires there. Socket failures are reported
// through the error signal and never thrown.
class Discovery : public ServiceBrowser, public std::enable_shared_from_this<Discovery> {
public:
  struct Options {
    std::string service_type = "howl-share";
    std::string protocol = "tcp";
    std::string group_address = kMdnsGroupV4;
    std::uint16_t mdns_port = kMdnsPort;
    std::uint32_t ttl = kMdnsDefaultTtl;
    int claim_count = 3;
    std::chrono::milliseconds claim_interval{250};
    std::chrono::milliseconds announce_interval{60000};
    std::chrono::milliseconds query_interval{30000};
    std::chrono::milliseconds expiry_check_interval{1000};
    // Without the socket, packets only arrive through deliver_packet() and
    // nothing is sent.
    bool open_socket = true;
  };

  static std::shared_ptr<Discovery> create(asio::io_context& io,
                                           Options options,
                                           std::shared_ptr<Logger> logger = nullptr);
  ~Discovery() override;

  // Claims the instance name with conflict queries, renaming on conflict,
  // then announces.
  // txt gains id, name and version entries.
  void advertise(const std::string& id,
                 const std::string& name,
                 std::uint16_t port,
                 std::map<std::string, std::string> txt = {});
  // Withdraws the advertisement with a goodbye packet.
  void unpublish();

  void start_discovery() override;
  void stop_discovery() override;
  std::vector<ServiceInfo> discovered_services() const override;

  // Goodbye, stop browsing, close the socket. Later calls return a ready future.
  std::future<void> destroy();
  bool destroyed() const { return destroyed_.load(); }

  // Feeds one received mDNS packet through the same path as the socket.
  void deliver_packet(std::vector<std::uint8_t> packet, std::string sender_ip);

  std::string service_type_fqdn() const { return service_type_; }
  std::string instance_name() const;

  Signal<ServiceInfo> advertised;
  Signal<std::string> error;

private:
  enum class AdvertState {
    Idle,
    Claiming,
    Announced
  };

  struct Entry {
    ServiceInfo info;
    std::string instance_fqdn;
    std::chrono::steady_clock::time_point expires;
  };

  Discovery(asio::io_context& io, Options options, std::shared_ptr<Logger> logger);

  bool ensure_socket();
  void close_socket();
  void do_receive();
  void process_packet(const std::vector<std::uint8_t>& packet, const std::string& sender_ip);
  void handle_packet(const std::vector<std::uint8_t>& packet, const std::string& sender_ip);
  void handle_query(const DnsMessage& query);
  void handle_response(const DnsMessage& response, const std::string& sender_ip);

  void begin_claim();
  void send_claim();
  void announce(bool first);
  void send_goodbye();
  void rename_after_conflict();
  void send_query();
  void schedule_query();
  void schedule_expiry();
  void expire_entries();
  void shutdown();

  DnsMessage build_response(std::uint32_t ttl) const;
  void send_packet(const DnsMessage& message);
  void send_packet_now(const DnsMessage& message);
  void report_error(const std::string& message);
  std::string instance_fqdn() const;
  ServiceInfo own_service_info() const;

  asio::io_context& io_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  std::string service_type_;
  std::string host_fqdn_;

  asio::ip::udp::socket socket_;
  asio::ip::udp::endpoint group_endpoint_;
  asio::ip::udp::endpoint sender_;
  std::array<std::uint8_t, 9000> receive_buffer_{};
  asio::steady_timer claim_timer_;
  asio::steady_timer announce_timer_;
  asio::steady_timer query_timer_;
  asio::steady_timer expiry_timer_;
  std::mt19937 rng_;

  // io thread only
  AdvertState advert_state_ = AdvertState::Idle;
  std::string advert_id_;
  std::string advert_base_label_;
  std::uint16_t advert_port_ = 0;
  std::map<std::string, std::string> advert_txt_;
  int claims_sent_ = 0;
  int rename_suffix_ = 1;
  bool browsing_ = false;

  mutable std::mutex state_mutex_;
  std::string instance_label_;
  std::map<std::string, Entry> services_;  // by lower-cased instance fqdn

  std::atomic<bool> destroyed_{false};
};
