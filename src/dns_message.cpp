#include "dns_message.hpp"

#include "utils.hpp"

#include <asio.hpp>

#include <stdexcept>

namespace {
constexpr int kMaxCompressionJumps = 10;
constexpr std::size_t kMaxNameLength = 255;

void write_uint16(std::vector<std::uint8_t>& buffer, std::uint16_t value) {
  buffer.push_back(static_cast<std::uint8_t>(value >> 8));
  buffer.push_back(static_cast<std::uint8_t>(value & 0xFF));
}

void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
  buffer.push_back(static_cast<std::uint8_t>(value >> 24));
  buffer.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
  buffer.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
  buffer.push_back(static_cast<std::uint8_t>(value & 0xFF));
}

std::uint16_t read_uint16(const std::vector<std::uint8_t>& buffer, std::size_t& offset) {
  if(offset + 2 > buffer.size()) throw std::out_of_range("Buffer too small for uint16");
  std::uint16_t value = static_cast<std::uint16_t>((buffer[offset] << 8) | buffer[offset + 1]);
  offset += 2;
  return value;
}

std::uint32_t read_uint32(const std::vector<std::uint8_t>& buffer, std::size_t& offset) {
  if(offset + 4 > buffer.size()) throw std::out_of_range("Buffer too small for uint32");
  std::uint32_t value = (static_cast<std::uint32_t>(buffer[offset]) << 24) |
                        (static_cast<std::uint32_t>(buffer[offset + 1]) << 16) |
                        (static_cast<std::uint32_t>(buffer[offset + 2]) << 8) |
                        buffer[offset + 3];
  offset += 4;
  return value;
}

void write_record(std::vector<std::uint8_t>& buffer, const DnsResourceRecord& record) {
  write_dns_name(buffer, record.name);
  write_uint16(buffer, static_cast<std::uint16_t>(record.type));
  write_uint16(buffer, record.record_class);
  write_uint32(buffer, record.ttl);
  write_uint16(buffer, static_cast<std::uint16_t>(record.data.size()));
  buffer.insert(buffer.end(), record.data.begin(), record.data.end());
}

void read_records(const std::vector<std::uint8_t>& data,
                  std::size_t& offset,
                  std::uint16_t count,
                  std::vector<DnsResourceRecord>& records) {
  records.clear();
  for(std::uint16_t i = 0; i < count; ++i) {
    DnsResourceRecord record;
    record.name = read_dns_name(data, offset);
    record.type = static_cast<DnsRecordType>(read_uint16(data, offset));
    record.record_class = read_uint16(data, offset);
    record.ttl = read_uint32(data, offset);
    auto length = read_uint16(data, offset);
    if(offset + length > data.size()) throw std::out_of_range("Record data extends beyond packet");
    record.data_offset_in_packet = offset;
    record.data.assign(data.begin() + static_cast<std::ptrdiff_t>(offset),
                       data.begin() + static_cast<std::ptrdiff_t>(offset + length));
    offset += length;
    records.push_back(std::move(record));
  }
}

std::string strip_root(const std::string& name) {
  if(!name.empty() && name.back() == '.') return name.substr(0, name.size() - 1);
  return name;
}

std::string first_label(const std::string& fqdn) {
  auto dot = fqdn.find('.');
  return dot == std::string::npos ? fqdn : fqdn.substr(0, dot);
}
}

std::vector<std::uint8_t> serialize_dns_message(const DnsMessage& message) {
  std::vector<std::uint8_t> buffer;
  write_uint16(buffer, message.header.transaction_id);
  write_uint16(buffer, message.header.flags);
  write_uint16(buffer, static_cast<std::uint16_t>(message.questions.size()));
  write_uint16(buffer, static_cast<std::uint16_t>(message.answers.size()));
  write_uint16(buffer, static_cast<std::uint16_t>(message.authorities.size()));
  write_uint16(buffer, static_cast<std::uint16_t>(message.additionals.size()));

  for(const auto& question : message.questions) {
    write_dns_name(buffer, question.name);
    write_uint16(buffer, static_cast<std::uint16_t>(question.type));
    write_uint16(buffer, question.record_class);
  }
  for(const auto& record : message.answers) write_record(buffer, record);
  for(const auto& record : message.authorities) write_record(buffer, record);
  for(const auto& record : message.additionals) write_record(buffer, record);
  return buffer;
}

std::optional<DnsMessage> parse_dns_message(const std::vector<std::uint8_t>& packet) {
  if(packet.size() < 12) return std::nullopt;
  DnsMessage message;
  message.raw_packet = packet;
  std::size_t offset = 0;
  try {
    message.header.transaction_id = read_uint16(packet, offset);
    message.header.flags = read_uint16(packet, offset);
    message.header.question_count = read_uint16(packet, offset);
    message.header.answer_count = read_uint16(packet, offset);
    message.header.authority_count = read_uint16(packet, offset);
    message.header.additional_count = read_uint16(packet, offset);

    for(std::uint16_t i = 0; i < message.header.question_count; ++i) {
      DnsQuestion question;
      question.name = read_dns_name(packet, offset);
      question.type = static_cast<DnsRecordType>(read_uint16(packet, offset));
      question.record_class = read_uint16(packet, offset);
      message.questions.push_back(std::move(question));
    }
    read_records(packet, offset, message.header.answer_count, message.answers);
    read_records(packet, offset, message.header.authority_count, message.authorities);
    read_records(packet, offset, message.header.additional_count, message.additionals);
  } catch(const std::out_of_range&) {
    return std::nullopt;
  }
  return message;
}

void write_dns_name(std::vector<std::uint8_t>& buffer, const std::string& name) {
  const auto normalized = strip_root(name);
  std::size_t start = 0;
  while(start <= normalized.size()) {
    auto dot = normalized.find('.', start);
    if(dot == std::string::npos) dot = normalized.size();
    auto label = normalized.substr(start, dot - start);
    if(!label.empty()) {
      if(label.size() > 63) label.resize(63);
      buffer.push_back(static_cast<std::uint8_t>(label.size()));
      buffer.insert(buffer.end(), label.begin(), label.end());
    }
    start = dot + 1;
  }
  buffer.push_back(0);
}

std::string read_dns_name(const std::vector<std::uint8_t>& buffer, std::size_t& offset) {
  std::string name;
  std::size_t cursor = offset;
  std::size_t resume = 0;
  bool jumped = false;
  int jumps = 0;

  while(true) {
    if(cursor >= buffer.size()) throw std::out_of_range("DNS name runs past packet");
    const std::uint8_t length = buffer[cursor++];
    if(length == 0) break;

    if((length & 0xC0) == 0xC0) {
      if(cursor >= buffer.size()) throw std::out_of_range("Truncated compression pointer");
      const std::size_t pointer = (static_cast<std::size_t>(length & 0x3F) << 8) | buffer[cursor++];
      if(!jumped) {
        resume = cursor;
        jumped = true;
      }
      if(++jumps > kMaxCompressionJumps) throw std::out_of_range("Too many compression jumps");
      if(pointer >= buffer.size()) throw std::out_of_range("Compression pointer outside packet");
      cursor = pointer;
      continue;
    }
    if(length > 63) throw std::out_of_range("Invalid label length");
    if(cursor + length > buffer.size()) throw std::out_of_range("Label runs past packet");

    if(!name.empty()) name += '.';
    name.append(reinterpret_cast<const char*>(&buffer[cursor]), length);
    if(name.size() > kMaxNameLength) throw std::out_of_range("DNS name too long");
    cursor += length;
  }

  offset = jumped ? resume : cursor;
  return name;
}

bool dns_names_equal(const std::string& a, const std::string& b) {
  return to_lower(strip_root(a)) == to_lower(strip_root(b));
}

std::vector<std::uint8_t> encode_txt_record(const std::map<std::string, std::string>& entries) {
  std::vector<std::uint8_t> data;
  if(entries.empty()) {
    data.push_back(0);
    return data;
  }
  for(const auto& entry : entries) {
    std::string item = entry.first;
    if(!entry.second.empty()) item += "=" + entry.second;
    if(item.size() > 255) item.resize(255);
    data.push_back(static_cast<std::uint8_t>(item.size()));
    data.insert(data.end(), item.begin(), item.end());
  }
  return data;
}

std::map<std::string, std::string> decode_txt_record(const std::vector<std::uint8_t>& data) {
  std::map<std::string, std::string> result;
  std::size_t offset = 0;
  while(offset < data.size()) {
    const std::uint8_t length = data[offset++];
    if(length == 0) continue;
    if(offset + length > data.size()) break;
    std::string item(reinterpret_cast<const char*>(&data[offset]), length);
    offset += length;
    auto eq = item.find('=');
    if(eq == 0) continue;
    if(eq == std::string::npos) {
      result.emplace(item, "");
    } else {
      result.emplace(item.substr(0, eq), item.substr(eq + 1));
    }
  }
  return result;
}

std::vector<std::uint8_t> encode_srv_record(const SrvData& srv) {
  std::vector<std::uint8_t> data;
  write_uint16(data, srv.priority);
  write_uint16(data, srv.weight);
  write_uint16(data, srv.port);
  write_dns_name(data, srv.target);
  return data;
}

std::optional<SrvData> decode_srv_record(const DnsMessage& message, const DnsResourceRecord& record) {
  if(record.type != DnsRecordType::SRV || record.data.size() < 7) return std::nullopt;
  const auto& packet = message.raw_packet.empty() ? record.data : message.raw_packet;
  std::size_t offset = message.raw_packet.empty() ? 0 : record.data_offset_in_packet;
  try {
    SrvData srv;
    srv.priority = read_uint16(packet, offset);
    srv.weight = read_uint16(packet, offset);
    srv.port = read_uint16(packet, offset);
    srv.target = read_dns_name(packet, offset);
    return srv;
  } catch(const std::out_of_range&) {
    return std::nullopt;
  }
}

std::optional<std::string> decode_ptr_record(const DnsMessage& message, const DnsResourceRecord& record) {
  if(record.type != DnsRecordType::PTR || record.data.empty()) return std::nullopt;
  const auto& packet = message.raw_packet.empty() ? record.data : message.raw_packet;
  std::size_t offset = message.raw_packet.empty() ? 0 : record.data_offset_in_packet;
  try {
    return read_dns_name(packet, offset);
  } catch(const std::out_of_range&) {
    return std::nullopt;
  }
}

std::optional<std::string> decode_a_record(const DnsResourceRecord& record) {
  if(record.type != DnsRecordType::A || record.data.size() != 4) return std::nullopt;
  asio::ip::address_v4::bytes_type bytes{};
  for(std::size_t i = 0; i < 4; ++i) bytes[i] = record.data[i];
  return asio::ip::address_v4(bytes).to_string();
}

DnsResourceRecord make_ptr_record(const std::string& service_type, const std::string& instance_fqdn, std::uint32_t ttl) {
  DnsResourceRecord record;
  record.name = service_type;
  record.type = DnsRecordType::PTR;
  record.record_class = kDnsClassIn;  // shared record, no cache flush
  record.ttl = ttl;
  write_dns_name(record.data, instance_fqdn);
  return record;
}

DnsResourceRecord make_srv_record(const std::string& instance_fqdn, const std::string& host_fqdn,
                                  std::uint16_t port, std::uint32_t ttl) {
  DnsResourceRecord record;
  record.name = instance_fqdn;
  record.type = DnsRecordType::SRV;
  record.record_class = kDnsClassInFlush;
  record.ttl = ttl;
  SrvData srv;
  srv.port = port;
  srv.target = host_fqdn;
  record.data = encode_srv_record(srv);
  return record;
}

DnsResourceRecord make_txt_record(const std::string& instance_fqdn,
                                  const std::map<std::string, std::string>& entries,
                                  std::uint32_t ttl) {
  DnsResourceRecord record;
  record.name = instance_fqdn;
  record.type = DnsRecordType::TXT;
  record.record_class = kDnsClassInFlush;
  record.ttl = ttl;
  record.data = encode_txt_record(entries);
  return record;
}

DnsResourceRecord make_a_record(const std::string& host_fqdn, const std::string& ipv4, std::uint32_t ttl) {
  std::error_code ec;
  auto address = asio::ip::make_address_v4(ipv4, ec);
  if(ec) throw std::invalid_argument("Not an IPv4 address: " + ipv4);
  DnsResourceRecord record;
  record.name = host_fqdn;
  record.type = DnsRecordType::A;
  record.record_class = kDnsClassInFlush;
  record.ttl = ttl;
  auto bytes = address.to_bytes();
  record.data.assign(bytes.begin(), bytes.end());
  return record;
}

std::string mdns_service_type(const std::string& type, const std::string& protocol) {
  return "_" + type + "._" + protocol + ".local";
}

std::string mdns_instance_label(const std::string& name) {
  std::string label = trim(name);
  for(auto& c : label) {
    if(c == '.') c = '-';
  }
  if(label.size() > 63) label.resize(63);
  if(label.empty()) label = "howl";
  return label;
}

std::vector<MdnsServiceRecord> extract_services(const DnsMessage& message,
                                                const std::string& service_type,
                                                const std::string& sender_ip) {
  std::vector<const DnsResourceRecord*> records;
  for(const auto& record : message.answers) records.push_back(&record);
  for(const auto& record : message.additionals) records.push_back(&record);

  std::vector<MdnsServiceRecord> services;
  for(const auto* ptr : records) {
    if(ptr->type != DnsRecordType::PTR || !dns_names_equal(ptr->name, service_type)) continue;
    auto instance_fqdn = decode_ptr_record(message, *ptr);
    if(!instance_fqdn) continue;

    MdnsServiceRecord service;
    service.instance_fqdn = strip_root(*instance_fqdn);
    service.instance = first_label(service.instance_fqdn);
    service.ttl = ptr->ttl;
    service.address = sender_ip;

    for(const auto* record : records) {
      if(!dns_names_equal(record->name, service.instance_fqdn)) continue;
      if(record->type == DnsRecordType::SRV) {
        if(auto srv = decode_srv_record(message, *record)) {
          service.port = srv->port;
          service.host_name = strip_root(srv->target);
          service.complete = true;
        }
      } else if(record->type == DnsRecordType::TXT) {
        service.txt = decode_txt_record(record->data);
      }
    }
    if(!service.host_name.empty()) {
      for(const auto* record : records) {
        if(record->type != DnsRecordType::A || !dns_names_equal(record->name, service.host_name)) continue;
        if(auto address = decode_a_record(*record)) {
          service.address = *address;
          break;
        }
      }
    }
    services.push_back(std::move(service));
  }
  return services;
}
