#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Minimal DNS wire codec for multicast DNS service discovery (RFC 6762/6763).
// Names are handled without the trailing root dot: "_howl-share._tcp.local".

inline constexpr std::uint16_t kMdnsPort = 5353;
inline constexpr const char* kMdnsGroupV4 = "224.0.0.251";
inline constexpr std::uint32_t kMdnsDefaultTtl = 120;

enum class DnsRecordType : std::uint16_t {
  A = 1,
  PTR = 12,
  TXT = 16,
  AAAA = 28,
  SRV = 33,
  ANY = 255
};

inline constexpr std::uint16_t kDnsClassIn = 0x0001;
inline constexpr std::uint16_t kDnsClassInFlush = 0x8001;  // cache-flush bit on responses
inline constexpr std::uint16_t kDnsClassMask = 0x7fff;

inline constexpr std::uint16_t kDnsFlagsQuery = 0x0000;
inline constexpr std::uint16_t kDnsFlagsResponse = 0x8000;
inline constexpr std::uint16_t kDnsFlagsAuthoritative = 0x8400;

struct DnsHeader {
  std::uint16_t transaction_id = 0;
  std::uint16_t flags = 0;
  std::uint16_t question_count = 0;
  std::uint16_t answer_count = 0;
  std::uint16_t authority_count = 0;
  std::uint16_t additional_count = 0;

  bool is_response() const { return (flags & kDnsFlagsResponse) != 0; }
};

struct DnsQuestion {
  std::string name;
  DnsRecordType type = DnsRecordType::PTR;
  std::uint16_t record_class = kDnsClassIn;
};

struct DnsResourceRecord {
  std::string name;
  DnsRecordType type = DnsRecordType::PTR;
  std::uint16_t record_class = kDnsClassIn;
  std::uint32_t ttl = kMdnsDefaultTtl;
  std::vector<std::uint8_t> data;
  // Where data starts in the packet it was read from; compressed names in
  // PTR and SRV data point back into that packet.
  std::size_t data_offset_in_packet = 0;
};

struct DnsMessage {
  DnsHeader header;
  std::vector<DnsQuestion> questions;
  std::vector<DnsResourceRecord> answers;
  std::vector<DnsResourceRecord> authorities;
  std::vector<DnsResourceRecord> additionals;
  std::vector<std::uint8_t> raw_packet;
};

// Section counts are taken from the vectors, not from message.header.
std::vector<std::uint8_t> serialize_dns_message(const DnsMessage& message);
// Empty on a truncated or malformed packet.
std::optional<DnsMessage> parse_dns_message(const std::vector<std::uint8_t>& packet);

void write_dns_name(std::vector<std::uint8_t>& buffer, const std::string& name);
// Follows compression pointers (at most 10 jumps). Throws std::out_of_range
// on malformed input. offset ends just past the name as stored.
std::string read_dns_name(const std::vector<std::uint8_t>& buffer, std::size_t& offset);
bool dns_names_equal(const std::string& a, const std::string& b);

std::vector<std::uint8_t> encode_txt_record(const std::map<std::string, std::string>& entries);
std::map<std::string, std::string> decode_txt_record(const std::vector<std::uint8_t>& data);

struct SrvData {
  std::uint16_t priority = 0;
  std::uint16_t weight = 0;
  std::uint16_t port = 0;
  std::string target;
};

std::vector<std::uint8_t> encode_srv_record(const SrvData& srv);
std::optional<SrvData> decode_srv_record(const DnsMessage& message, const DnsResourceRecord& record);
std::optional<std::string> decode_ptr_record(const DnsMessage& message, const DnsResourceRecord& record);
std::optional<std::string> decode_a_record(const DnsResourceRecord& record);

DnsResourceRecord make_ptr_record(const std::string& service_type, const std::string& instance_fqdn, std::uint32_t ttl);
DnsResourceRecord make_srv_record(const std::string& instance_fqdn, const std::string& host_fqdn,
                                  std::uint16_t port, std::uint32_t ttl);
DnsResourceRecord make_txt_record(const std::string& instance_fqdn,
                                  const std::map<std::string, std::string>& entries,
                                  std::uint32_t ttl);
// Throws std::invalid_argument if ipv4 is not a dotted quad.
DnsResourceRecord make_a_record(const std::string& host_fqdn, const std::string& ipv4, std::uint32_t ttl);

// "_<type>._<protocol>.local"
std::string mdns_service_type(const std::string& type, const std::string& protocol);
// Instance labels may not contain dots; they are replaced.
std::string mdns_instance_label(const std::string& name);

// One service instance assembled from the PTR, SRV, TXT and A records of a response.
struct MdnsServiceRecord {
  std::string instance_fqdn;
  std::string instance;  // first label of instance_fqdn
  std::string host_name;
  std::string address;
  std::uint16_t port = 0;
  std::map<std::string, std::string> txt;
  std::uint32_t ttl = 0;  // 0 is a goodbye
  bool complete = false;  // SRV seen
};

// sender_ip stands in for the address when no A record is present.
std::vector<MdnsServiceRecord> extract_services(const DnsMessage& message,
                                                const std::string& service_type,
                                                const std::string& sender_ip);
