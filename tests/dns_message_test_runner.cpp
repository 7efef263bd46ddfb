#include "dns_message.hpp"
#include "test_runner_utils.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace {

using howl::test::TestCase;
using howl::test::TestContext;

const std::string kServiceType = "_howl-share._tcp.local";

DnsMessage announcement(const std::string& label,
                        std::uint16_t port,
                        const std::map<std::string, std::string>& txt,
                        std::uint32_t ttl,
                        bool with_address) {
  const std::string instance = label + "." + kServiceType;
  const std::string host = "laptop-1234.local";
  DnsMessage msg;
  msg.header.flags = kDnsFlagsAuthoritative;
  msg.answers.push_back(make_ptr_record(kServiceType, instance, ttl));
  msg.additionals.push_back(make_srv_record(instance, host, port, ttl));
  msg.additionals.push_back(make_txt_record(instance, txt, ttl));
  if(with_address) {
    msg.additionals.push_back(make_a_record(host, "192.168.1.20", ttl));
  }
  return msg;
}

std::optional<DnsMessage> over_the_wire(const DnsMessage& msg) {
  return parse_dns_message(serialize_dns_message(msg));
}

bool test_service_type_and_labels(TestContext&) {
  return mdns_service_type("howl-share", "tcp") == kServiceType &&
         mdns_instance_label("my.laptop.local") == "my-laptop-local" &&
         mdns_instance_label("   ") == "howl" &&
         mdns_instance_label(std::string(100, 'x')).size() == 63;
}

bool test_name_roundtrip_and_case(TestContext&) {
  std::vector<std::uint8_t> buffer;
  write_dns_name(buffer, "Office PC._howl-share._tcp.local.");
  std::size_t offset = 0;
  auto name = read_dns_name(buffer, offset);
  return name == "Office PC._howl-share._tcp.local" &&
         offset == buffer.size() &&
         dns_names_equal("_HOWL-SHARE._TCP.LOCAL.", kServiceType);
}

bool test_compressed_names(TestContext&) {
  // "local" at offset 0, then "_tcp" + pointer to it, then "x" + pointer to "_tcp"
  std::vector<std::uint8_t> packet = {5, 'l', 'o', 'c', 'a', 'l', 0,
                                      4, '_', 't', 'c', 'p', 0xC0, 0x00,
                                      1, 'x', 0xC0, 0x07};
  std::size_t offset = 14;
  auto name = read_dns_name(packet, offset);
  return name == "x._tcp.local" && offset == packet.size();
}

bool test_compression_loop_rejected(TestContext&) {
  std::vector<std::uint8_t> packet = {0xC0, 0x02, 0xC0, 0x00};
  std::size_t offset = 0;
  try {
    read_dns_name(packet, offset);
    return false;
  } catch(const std::out_of_range&) {
    return true;
  }
}

bool test_truncated_packets_rejected(TestContext&) {
  auto bytes = serialize_dns_message(announcement("Desk", 40000, {{"role", "sender"}}, 120, true));
  if(!parse_dns_message(bytes)) return false;
  for(std::size_t cut : {std::size_t{0}, std::size_t{5}, std::size_t{12}, bytes.size() / 2, bytes.size() - 1}) {
    std::vector<std::uint8_t> truncated(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(cut));
    if(parse_dns_message(truncated)) return false;
  }
  return true;
}

bool test_txt_encoding(TestContext&) {
  std::map<std::string, std::string> entries = {
    {"id", "3f1c"}, {"role", "sender"}, {"fileName", "a=b.txt"}, {"flag", ""}
  };
  auto decoded = decode_txt_record(encode_txt_record(entries));
  auto empty = encode_txt_record({});
  return decoded == entries && empty.size() == 1 && empty[0] == 0 && decode_txt_record(empty).empty();
}

bool test_query_header(TestContext&) {
  DnsMessage query;
  query.header.flags = kDnsFlagsQuery;
  query.questions.push_back({kServiceType, DnsRecordType::PTR, kDnsClassIn});
  auto parsed = over_the_wire(query);
  return parsed && !parsed->header.is_response() &&
         parsed->questions.size() == 1 &&
         parsed->questions[0].name == kServiceType &&
         parsed->questions[0].type == DnsRecordType::PTR;
}

bool test_extract_full_announcement(TestContext&) {
  std::map<std::string, std::string> txt = {{"id", "peer-1"}, {"name", "Desk"}, {"role", "receiver"}};
  auto parsed = over_the_wire(announcement("Desk", 40001, txt, 120, true));
  if(!parsed || !parsed->header.is_response()) return false;
  auto services = extract_services(*parsed, kServiceType, "10.0.0.9");
  if(services.size() != 1) return false;
  const auto& service = services.front();
  return service.complete &&
         service.instance == "Desk" &&
         service.instance_fqdn == "Desk." + kServiceType &&
         service.host_name == "laptop-1234.local" &&
         service.address == "192.168.1.20" &&
         service.port == 40001 &&
         service.ttl == 120 &&
         service.txt == txt;
}

bool test_extract_falls_back_to_sender_address(TestContext&) {
  auto parsed = over_the_wire(announcement("Desk", 40001, {{"role", "sender"}}, 120, false));
  if(!parsed) return false;
  auto services = extract_services(*parsed, kServiceType, "10.0.0.9");
  return services.size() == 1 && services.front().address == "10.0.0.9";
}

bool test_goodbye_has_zero_ttl(TestContext&) {
  auto parsed = over_the_wire(announcement("Desk", 40001, {}, 0, true));
  if(!parsed) return false;
  auto services = extract_services(*parsed, kServiceType, "10.0.0.9");
  return services.size() == 1 && services.front().ttl == 0;
}

bool test_other_service_types_ignored(TestContext&) {
  DnsMessage msg;
  msg.header.flags = kDnsFlagsAuthoritative;
  msg.answers.push_back(make_ptr_record("_printer._tcp.local", "Ink._printer._tcp.local", 120));
  msg.additionals.push_back(make_srv_record("Ink._printer._tcp.local", "ink.local", 631, 120));
  auto parsed = over_the_wire(msg);
  return parsed && extract_services(*parsed, kServiceType, "10.0.0.9").empty();
}

bool test_record_classes(TestContext&) {
  auto ptr = make_ptr_record(kServiceType, "Desk." + kServiceType, 120);
  auto srv = make_srv_record("Desk." + kServiceType, "h.local", 1, 120);
  auto a = make_a_record("h.local", "10.1.2.3", 120);
  auto address = decode_a_record(a);
  bool threw = false;
  try {
    make_a_record("h.local", "not-an-ip", 120);
  } catch(const std::invalid_argument&) {
    threw = true;
  }
  return ptr.record_class == kDnsClassIn &&
         srv.record_class == kDnsClassInFlush &&
         address && *address == "10.1.2.3" &&
         threw;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"service_type_and_labels", test_service_type_and_labels},
    {"name_roundtrip_and_case", test_name_roundtrip_and_case},
    {"compressed_names", test_compressed_names},
    {"compression_loop_rejected", test_compression_loop_rejected},
    {"truncated_packets_rejected", test_truncated_packets_rejected},
    {"txt_encoding", test_txt_encoding},
    {"query_header", test_query_header},
    {"extract_full_announcement", test_extract_full_announcement},
    {"extract_falls_back_to_sender_address", test_extract_falls_back_to_sender_address},
    {"goodbye_has_zero_ttl", test_goodbye_has_zero_ttl},
    {"other_service_types_ignored", test_other_service_types_ignored},
    {"record_classes", test_record_classes}
  };
  return howl::test::run_suite("dns message", tests, argc, argv);
}
