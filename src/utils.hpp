#pragma once
#include <cstddef>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(const std::string &data);
std::string sha256_hex(const std::string &data);

// Streams the file through SHA-256. Throws HowlError(Client) if unreadable.
std::string sha256_file(const std::filesystem::path& path);

// Incremental SHA-256 for bytes that arrive in pieces.
class Sha256Stream {
public:
  Sha256Stream();
  ~Sha256Stream();
  Sha256Stream(const Sha256Stream&) = delete;
  Sha256Stream& operator=(const Sha256Stream&) = delete;

  void update(const char* data, std::size_t size);
  std::string hex_digest();

private:
  void* ctx_ = nullptr;
};

std::string random_hex(std::size_t byte_count);
std::string generate_peer_id();

std::string local_hostname();
std::vector<std::string> local_ipv4_addresses();

std::string mime_type_for(const std::filesystem::path& path);

// ISO-8601 UTC with milliseconds, e.g. 2024-05-01T12:00:00.000Z
std::string iso8601_utc(std::chrono::system_clock::time_point when = std::chrono::system_clock::now());

std::string format_bytes(std::uint64_t bytes);
std::string format_speed(double bytes_per_second);
std::string format_time(double seconds);

std::string trim(const std::string& value);
std::string to_lower(std::string value);
