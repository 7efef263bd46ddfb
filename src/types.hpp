#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>

constexpr const char* kHowlVersion = "1.0.0";

struct FileMetadata {
  std::string id;
  std::string name;
  std::uint64_t size = 0;
  std::optional<std::string> mime_type;
  std::optional<std::string> path;
};

void to_json(nlohmann::json& j, const FileMetadata& meta);
void from_json(const nlohmann::json& j, FileMetadata& meta);

enum class PeerRole {
  Unknown,
  Sender,
  Receiver
};

const char* to_string(PeerRole role);
PeerRole peer_role_from_string(const std::string& value);

// A discovered peer. Two records describe the same peer when key() matches.
struct ServiceInfo {
  std::string id;
  std::string name;
  std::string host;
  std::uint16_t port = 0;
  std::map<std::string, std::string> txt;

  std::string key() const { return host + ":" + std::to_string(port); }
  PeerRole role() const;
  std::string display_name() const;
};

struct TransferProgress {
  std::string file_id;
  std::string file_name;
  std::uint64_t transferred = 0;
  std::uint64_t total = 0;
  double percentage = 0.0;
  double speed = 0.0;  // bytes per second
  double eta = 0.0;    // seconds, infinity while speed is zero
};

void to_json(nlohmann::json& j, const TransferProgress& progress);

enum class TransferType {
  Browser,
  Cli,
  Client
};

const char* to_string(TransferType type);
TransferType classify_user_agent(const std::string& user_agent);
