#include "types.hpp"

#include "utils.hpp"

#include <cmath>

void to_json(nlohmann::json& j, const FileMetadata& meta) {
  j = nlohmann::json{{"id", meta.id}, {"name", meta.name}, {"size", meta.size}};
  if(meta.mime_type) j["mimeType"] = *meta.mime_type;
  if(meta.path) j["path"] = *meta.path;
}

void from_json(const nlohmann::json& j, FileMetadata& meta) {
  meta.id = j.value("id", std::string());
  meta.name = j.value("name", std::string());
  meta.size = j.value("size", std::uint64_t{0});
  meta.mime_type.reset();
  meta.path.reset();
  if(j.contains("mimeType") && j.at("mimeType").is_string()) {
    meta.mime_type = j.at("mimeType").get<std::string>();
  }
  if(j.contains("path") && j.at("path").is_string()) {
    meta.path = j.at("path").get<std::string>();
  }
}

const char* to_string(PeerRole role) {
  switch(role) {
    case PeerRole::Sender: return "sender";
    case PeerRole::Receiver: return "receiver";
    default: return "unknown";
  }
}

PeerRole peer_role_from_string(const std::string& value) {
  if(value == "sender") return PeerRole::Sender;
  if(value == "receiver") return PeerRole::Receiver;
  return PeerRole::Unknown;
}

PeerRole ServiceInfo::role() const {
  auto it = txt.find("role");
  if(it == txt.end()) return PeerRole::Unknown;
  return peer_role_from_string(it->second);
}

std::string ServiceInfo::display_name() const {
  auto it = txt.find("name");
  std::string label = (it != txt.end() && !it->second.empty()) ? it->second : name;
  return label + " (" + key() + ")";
}

void to_json(nlohmann::json& j, const TransferProgress& progress) {
  j = nlohmann::json{
    {"fileId", progress.file_id},
    {"fileName", progress.file_name},
    {"transferred", progress.transferred},
    {"total", progress.total},
    {"percentage", progress.percentage},
    {"speed", progress.speed}
  };
  // JSON has no infinity
  if(std::isfinite(progress.eta)) {
    j["eta"] = progress.eta;
  } else {
    j["eta"] = nullptr;
  }
}

const char* to_string(TransferType type) {
  switch(type) {
    case TransferType::Cli: return "CLI";
    case TransferType::Client: return "Client";
    default: return "Browser";
  }
}

TransferType classify_user_agent(const std::string& user_agent) {
  auto lowered = to_lower(user_agent);
  if(lowered.find("howl-cli") != std::string::npos) return TransferType::Cli;
  if(lowered.find("howl-client") != std::string::npos) return TransferType::Client;
  return TransferType::Browser;
}
