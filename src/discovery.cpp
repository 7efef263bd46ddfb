#include "discovery.hpp"

#include "utils.hpp"

#include <algorithm>

using asio::ip::udp;

namespace {
#ifdef SO_REUSEPORT
using reuse_port = asio::detail::socket_option::boolean<SOL_SOCKET, SO_REUSEPORT>;
#endif

constexpr std::chrono::milliseconds kFirstRepeat{1000};
}

std::shared_ptr<Discovery> Discovery::create(asio::io_context& io,
                                             Options options,
                                             std::shared_ptr<Logger> logger) {
  return std::shared_ptr<Discovery>(new Discovery(io, std::move(options), std::move(logger)));
}

Discovery::Discovery(asio::io_context& io, Options options, std::shared_ptr<Logger> logger)
  : io_(io),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("discovery")),
    service_type_(mdns_service_type(options_.service_type, options_.protocol)),
    host_fqdn_(mdns_instance_label(local_hostname()) + ".local"),
    socket_(io),
    claim_timer_(io),
    announce_timer_(io),
    query_timer_(io),
    expiry_timer_(io),
    rng_(std::random_device{}()) {
  std::error_code ec;
  auto group = asio::ip::make_address(options_.group_address, ec);
  if(ec) group = asio::ip::make_address(kMdnsGroupV4);
  group_endpoint_ = udp::endpoint(group, options_.mdns_port);
}

Discovery::~Discovery() {
  std::error_code ignored;
  socket_.close(ignored);
}

std::string Discovery::instance_name() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return instance_label_;
}

std::string Discovery::instance_fqdn() const {
  return instance_name() + "." + service_type_;
}

void Discovery::report_error(const std::string& message) {
  logger_->warn("{}", message);
  error.emit(message);
}

bool Discovery::ensure_socket() {
  if(!options_.open_socket || socket_.is_open()) return true;
  std::error_code ec;
  socket_.open(udp::v4(), ec);
  if(ec) {
    report_error("Unable to open mDNS socket: " + ec.message());
    return false;
  }
  socket_.set_option(udp::socket::reuse_address(true), ec);
#ifdef SO_REUSEPORT
  std::error_code port_ec;
  socket_.set_option(reuse_port(true), port_ec);
  if(port_ec) logger_->debug("SO_REUSEPORT unavailable: {}", port_ec.message());
#endif
  if(!ec) socket_.bind(udp::endpoint(asio::ip::address_v4::any(), options_.mdns_port), ec);
  if(!ec) socket_.set_option(asio::ip::multicast::join_group(group_endpoint_.address()), ec);
  if(ec) {
    close_socket();
    report_error("Unable to join mDNS group " + group_endpoint_.address().to_string() + ": " + ec.message());
    return false;
  }
  std::error_code option_ec;
  socket_.set_option(asio::ip::multicast::enable_loopback(true), option_ec);
  socket_.set_option(asio::ip::multicast::hops(255), option_ec);
  logger_->debug("mDNS socket listening on port {}", options_.mdns_port);
  do_receive();
  return true;
}

void Discovery::close_socket() {
  std::error_code ignored;
  socket_.close(ignored);
}

void Discovery::do_receive() {
  auto self = shared_from_this();
  socket_.async_receive_from(asio::buffer(receive_buffer_), sender_,
    [self](std::error_code ec, std::size_t bytes){
      if(ec) {
        if(ec == asio::error::operation_aborted || !self->socket_.is_open()) return;
        self->logger_->debug("mDNS receive error: {}", ec.message());
        self->do_receive();
        return;
      }
      std::vector<std::uint8_t> packet(self->receive_buffer_.begin(),
                                       self->receive_buffer_.begin() + static_cast<std::ptrdiff_t>(bytes));
      self->process_packet(packet, self->sender_.address().to_string());
      self->do_receive();
    });
}

void Discovery::deliver_packet(std::vector<std::uint8_t> packet, std::string sender_ip) {
  auto self = shared_from_this();
  asio::post(io_, [self, packet = std::move(packet), sender_ip = std::move(sender_ip)]{
    if(self->destroyed_) return;
    self->process_packet(packet, sender_ip);
  });
}

void Discovery::process_packet(const std::vector<std::uint8_t>& packet, const std::string& sender_ip) {
  try {
    handle_packet(packet, sender_ip);
  } catch(const std::exception& e) {
    logger_->warn("Failed to process mDNS packet: {}", e.what());
  }
}

void Discovery::handle_packet(const std::vector<std::uint8_t>& packet, const std::string& sender_ip) {
  auto message = parse_dns_message(packet);
  if(!message) {
    logger_->debug("Ignoring malformed mDNS packet from {}", sender_ip);
    return;
  }
  if(message->header.is_response()) {
    handle_response(*message, sender_ip);
  } else {
    handle_query(*message);
  }
}

void Discovery::handle_query(const DnsMessage& query) {
  if(advert_state_ != AdvertState::Announced) return;
  const auto own = instance_fqdn();
  bool respond = false;
  for(const auto& question : query.questions) {
    const bool any = question.type == DnsRecordType::ANY;
    if((question.type == DnsRecordType::PTR || any) && dns_names_equal(question.name, service_type_)) respond = true;
    if(dns_names_equal(question.name, own)) respond = true;
    if((question.type == DnsRecordType::A || any) && dns_names_equal(question.name, host_fqdn_)) respond = true;
  }
  if(!respond) return;

  // spread responses from several hosts apart
  std::uniform_int_distribution<int> delay(20, 120);
  auto timer = std::make_shared<asio::steady_timer>(io_, std::chrono::milliseconds(delay(rng_)));
  auto self = shared_from_this();
  timer->async_wait([self, timer](const std::error_code& ec){
    if(ec || self->advert_state_ != AdvertState::Announced) return;
    self->send_packet(self->build_response(self->options_.ttl));
  });
}

void Discovery::handle_response(const DnsMessage& response, const std::string& sender_ip) {
  if(advert_state_ == AdvertState::Claiming) {
    const auto own = instance_fqdn();
    bool named = false;
    bool ours = false;
    for(const auto* section : {&response.answers, &response.additionals}) {
      for(const auto& record : *section) {
        if(!dns_names_equal(record.name, own)) continue;
        if(record.type == DnsRecordType::TXT) {
          named = true;
          auto txt = decode_txt_record(record.data);
          auto id = txt.find("id");
          if(id != txt.end() && id->second == advert_id_) ours = true;
        } else if(record.type == DnsRecordType::SRV) {
          named = true;
        }
      }
    }
    if(named && !ours) {
      rename_after_conflict();
      return;
    }
  }

  if(!browsing_) return;

  std::vector<ServiceInfo> ups;
  std::vector<ServiceInfo> downs;
  const auto now = std::chrono::steady_clock::now();
  for(auto& found : extract_services(response, service_type_, sender_ip)) {
    auto id = found.txt.find("id");
    if(!advert_id_.empty() && id != found.txt.end() && id->second == advert_id_) continue;
    const auto key = to_lower(found.instance_fqdn);

    std::lock_guard<std::mutex> lock(state_mutex_);
    auto existing = services_.find(key);
    if(found.ttl == 0) {
      if(existing != services_.end()) {
        downs.push_back(existing->second.info);
        services_.erase(existing);
      }
      continue;
    }
    if(!found.complete || found.port == 0) {
      if(existing != services_.end()) {
        existing->second.expires = now + std::chrono::seconds(found.ttl);
      }
      continue;
    }

    ServiceInfo info;
    info.id = id != found.txt.end() ? id->second : found.instance;
    auto name = found.txt.find("name");
    info.name = name != found.txt.end() ? name->second : found.instance;
    info.host = found.address;
    info.port = found.port;
    info.txt = found.txt;

    Entry entry{info, found.instance_fqdn, now + std::chrono::seconds(found.ttl)};
    if(existing == services_.end()) {
      services_.emplace(key, entry);
      ups.push_back(info);
    } else if(existing->second.info.key() != info.key()) {
      downs.push_back(existing->second.info);
      existing->second = entry;
      ups.push_back(info);
    } else {
      existing->second = entry;
    }
  }

  for(const auto& info : downs) {
    logger_->debug("Service down: {}", info.display_name());
    service_down.emit(info);
  }
  for(const auto& info : ups) {
    logger_->debug("Service up: {} ({})", info.display_name(), to_string(info.role()));
    service_up.emit(info);
  }
}

void Discovery::advertise(const std::string& id,
                          const std::string& name,
                          std::uint16_t port,
                          std::map<std::string, std::string> txt) {
  auto self = shared_from_this();
  asio::post(io_, [self, id, name, port, txt = std::move(txt)]() mutable {
    if(self->destroyed_ || !self->ensure_socket()) return;
    if(self->advert_state_ == AdvertState::Announced) self->send_goodbye();
    self->claim_timer_.cancel();
    self->announce_timer_.cancel();

    txt["id"] = id;
    txt["name"] = name;
    txt["version"] = kHowlVersion;
    self->advert_id_ = id;
    self->advert_base_label_ = name;
    self->advert_port_ = port;
    self->advert_txt_ = std::move(txt);
    self->rename_suffix_ = 1;
    {
      std::lock_guard<std::mutex> lock(self->state_mutex_);
      self->instance_label_ = mdns_instance_label(name);
    }
    self->begin_claim();
  });
}

void Discovery::begin_claim() {
  advert_state_ = AdvertState::Claiming;
  claims_sent_ = 0;
  logger_->debug("Claiming {}", instance_fqdn());
  send_claim();
}

void Discovery::send_claim() {
  if(advert_state_ != AdvertState::Claiming) return;
  if(claims_sent_ >= options_.claim_count) {
    announce(true);
    return;
  }
  const auto own = instance_fqdn();
  DnsMessage claim;
  claim.header.flags = kDnsFlagsQuery;
  claim.questions.push_back(DnsQuestion{own, DnsRecordType::ANY, kDnsClassIn});
  claim.authorities.push_back(make_srv_record(own, host_fqdn_, advert_port_, options_.ttl));
  send_packet(claim);
  ++claims_sent_;

  auto self = shared_from_this();
  claim_timer_.expires_after(options_.claim_interval);
  claim_timer_.async_wait([self](const std::error_code& ec){
    if(ec) return;
    self->send_claim();
  });
}

void Discovery::announce(bool first) {
  const bool was_announced = advert_state_ == AdvertState::Announced;
  advert_state_ = AdvertState::Announced;
  send_packet(build_response(options_.ttl));
  if(first && !was_announced) {
    logger_->info("Advertising {} on port {}", instance_name(), advert_port_);
    advertised.emit(own_service_info());
  }

  auto self = shared_from_this();
  announce_timer_.expires_after(first ? std::min(kFirstRepeat, options_.announce_interval) : options_.announce_interval);
  announce_timer_.async_wait([self](const std::error_code& ec){
    if(ec || self->advert_state_ != AdvertState::Announced) return;
    self->announce(false);
  });
}

void Discovery::rename_after_conflict() {
  ++rename_suffix_;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    instance_label_ = mdns_instance_label(advert_base_label_ + " (" + std::to_string(rename_suffix_) + ")");
  }
  logger_->info("Service name in use, renamed to {}", instance_name());
  claim_timer_.cancel();
  begin_claim();
}

void Discovery::unpublish() {
  auto self = shared_from_this();
  asio::post(io_, [self]{
    self->send_goodbye();
    self->advert_state_ = AdvertState::Idle;
    self->claim_timer_.cancel();
    self->announce_timer_.cancel();
  });
}

void Discovery::send_goodbye() {
  if(advert_state_ != AdvertState::Announced || !socket_.is_open()) return;
  logger_->debug("Withdrawing {}", instance_fqdn());
  send_packet_now(build_response(0));
}

void Discovery::start_discovery() {
  auto self = shared_from_this();
  asio::post(io_, [self]{
    if(self->destroyed_) return;
    if(self->browsing_) {
      self->send_query();
      return;
    }
    if(!self->ensure_socket()) return;
    self->browsing_ = true;
    self->logger_->debug("Browsing for {}", self->service_type_);
    self->send_query();
    self->schedule_expiry();
  });
}

void Discovery::stop_discovery() {
  auto self = shared_from_this();
  asio::post(io_, [self]{
    self->browsing_ = false;
    self->query_timer_.cancel();
    self->expiry_timer_.cancel();
    std::lock_guard<std::mutex> lock(self->state_mutex_);
    self->services_.clear();
  });
}

std::vector<ServiceInfo> Discovery::discovered_services() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  std::vector<ServiceInfo> out;
  out.reserve(services_.size());
  for(const auto& entry : services_) out.push_back(entry.second.info);
  return out;
}

void Discovery::send_query() {
  if(!browsing_) return;
  DnsMessage query;
  query.header.flags = kDnsFlagsQuery;
  query.questions.push_back(DnsQuestion{service_type_, DnsRecordType::PTR, kDnsClassIn});
  send_packet(query);
  schedule_query();
}

void Discovery::schedule_query() {
  auto self = shared_from_this();
  query_timer_.expires_after(options_.query_interval);
  query_timer_.async_wait([self](const std::error_code& ec){
    if(ec) return;
    self->send_query();
  });
}

void Discovery::schedule_expiry() {
  auto self = shared_from_this();
  expiry_timer_.expires_after(options_.expiry_check_interval);
  expiry_timer_.async_wait([self](const std::error_code& ec){
    if(ec || !self->browsing_) return;
    self->expire_entries();
    self->schedule_expiry();
  });
}

void Discovery::expire_entries() {
  std::vector<ServiceInfo> expired;
  const auto now = std::chrono::steady_clock::now();
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    for(auto it = services_.begin(); it != services_.end();) {
      if(it->second.expires <= now) {
        expired.push_back(it->second.info);
        it = services_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for(const auto& info : expired) {
    logger_->debug("Service expired: {}", info.display_name());
    service_down.emit(info);
  }
}

std::future<void> Discovery::destroy() {
  auto done = std::make_shared<std::promise<void>>();
  auto future = done->get_future();
  if(destroyed_.exchange(true)) {
    done->set_value();
    return future;
  }
  auto self = shared_from_this();
  asio::post(io_, [self, done]{
    self->shutdown();
    done->set_value();
  });
  return future;
}

void Discovery::shutdown() {
  send_goodbye();
  advert_state_ = AdvertState::Idle;
  browsing_ = false;
  claim_timer_.cancel();
  announce_timer_.cancel();
  query_timer_.cancel();
  expiry_timer_.cancel();
  close_socket();
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    services_.clear();
  }
  logger_->debug("Discovery stopped");
}

DnsMessage Discovery::build_response(std::uint32_t ttl) const {
  const auto own = instance_fqdn();
  DnsMessage message;
  message.header.flags = kDnsFlagsAuthoritative;
  message.answers.push_back(make_ptr_record(service_type_, own, ttl));
  message.answers.push_back(make_srv_record(own, host_fqdn_, advert_port_, ttl));
  message.answers.push_back(make_txt_record(own, advert_txt_, ttl));
  for(const auto& address : local_ipv4_addresses()) {
    message.additionals.push_back(make_a_record(host_fqdn_, address, ttl));
  }
  return message;
}

ServiceInfo Discovery::own_service_info() const {
  ServiceInfo info;
  info.id = advert_id_;
  info.name = advert_base_label_;
  auto addresses = local_ipv4_addresses();
  info.host = addresses.empty() ? host_fqdn_ : addresses.front();
  info.port = advert_port_;
  info.txt = advert_txt_;
  return info;
}

void Discovery::send_packet(const DnsMessage& message) {
  if(!socket_.is_open()) return;
  auto payload = std::make_shared<std::vector<std::uint8_t>>(serialize_dns_message(message));
  auto self = shared_from_this();
  socket_.async_send_to(asio::buffer(*payload), group_endpoint_,
    [self, payload](std::error_code ec, std::size_t){
      if(ec && ec != asio::error::operation_aborted) {
        self->report_error("mDNS send failed: " + ec.message());
      }
    });
}

void Discovery::send_packet_now(const DnsMessage& message) {
  auto payload = serialize_dns_message(message);
  std::error_code ec;
  socket_.send_to(asio::buffer(payload), group_endpoint_, 0, ec);
  if(ec) logger_->debug("mDNS send failed: {}", ec.message());
}
