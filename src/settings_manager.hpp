#pragma once

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "log.hpp"
#include "utils.hpp"

// One row per setting. "min"/"max" bound int settings, "persistent" false
// keeps a setting out of the settings file, "section" groups the help text.
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","command"},         {"aliases", nlohmann::json::array()},      {"type","string"}, {"default",""},            {"section","positional"}, {"persistent", false}, {"description","send or receive"}},
  {{"key","file"},            {"aliases", {"f"}},                        {"type","string"}, {"default",""},            {"section","positional"}, {"persistent", false}, {"description","File to send"}},
  {{"key","port"},            {"aliases", {"p"}},                        {"type","int"},    {"default",0}, {"min",0}, {"max",65535}, {"section","general"}, {"persistent", true}, {"description","HTTP port, 0 picks the first free port from 40000"}},
  {{"key","name"},            {"aliases", {"n"}},                        {"type","string"}, {"default",""},            {"section","general"},    {"persistent", true},  {"description","Name other devices see, empty uses the host name"}},
  {{"key","limit"},           {"aliases", {"downloads","uploads","l"}},  {"type","int"},    {"default",1}, {"min",0},  {"section","general"},    {"persistent", true},  {"description","Transfers to serve before exiting, 0 for no limit"}},
  {{"key","no_verification"}, {"aliases", {"nv"}},                       {"type","bool"},   {"default",false},         {"section","send"},       {"persistent", true},  {"description","Serve the file without a verification code"}},
  {{"key","upload_verify"},   {"aliases", {"uv"}},                       {"type","bool"},   {"default",false},         {"section","receive"},    {"persistent", true},  {"description","Issue a separate code for every upload request"}},
  {{"key","output"},          {"aliases", {"o"}},                        {"type","string"}, {"default","./downloads"}, {"section","receive"},    {"persistent", true},  {"description","Directory for received files"}},
  {{"key","disable_lan"},     {"aliases", {"no_mdns"}},                  {"type","bool"},   {"default",false},         {"section","general"},    {"persistent", true},  {"description","Neither advertise nor browse with mDNS"}},
  {{"key","skip_firewall"},   {"aliases", {"sf"}},                       {"type","bool"},   {"default",false},         {"section","general"},    {"persistent", true},  {"description","Skip the firewall rule check"}},
  {{"key","debug"},           {"aliases", {"dev","verbose","v"}},        {"type","bool"},   {"default",false},         {"section","general"},    {"persistent", true},  {"description","Debug logging"}},
  {{"key","help"},            {"aliases", {"h","?"}},                    {"type","bool"},   {"default",false},         {"section","general"},    {"persistent", false}, {"description","Show this help"}},
  {{"key","save"},            {"aliases", {"persist"}},                  {"type","bool"},   {"default",false},         {"section","general"},    {"persistent", false}, {"description","Write the persistent options to the settings file"}}
});

// Typed settings backed by SETTINGS_SPECIFICATION. Values come from the
// defaults, then the settings file, then the command line; the last write
// wins and remembers where it came from.
class SettingsManager {
public:
  enum class Source {
    Default,
    File,
    CommandLine
  };

  struct OptionInfo {
    std::string key;
    std::vector<std::string> aliases;
    std::string type;
    std::string section;
    std::string description;
    std::string default_text;
  };

  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  // Throws HowlError(Internal) for a key the table does not define.
  template<typename T>
  T get(const std::string& key) const;
  Source source(const std::string& key) const;

  // Converts text to the setting's type and stores it. Throws
  // HowlError(Client) for unknown names and unusable values.
  void set(const std::string& name, const std::string& text, Source source = Source::CommandLine);

  // Canonical key for a key or alias; '-' and '_' are interchangeable.
  std::optional<std::string> resolve_key(const std::string& name) const;
  bool is_flag(const std::string& key) const;
  std::vector<OptionInfo> options() const;

  // Missing file is not an error. Invalid entries are reported and skipped.
  bool load();
  bool save() const;
  bool load_from_file(const std::filesystem::path& path);
  bool save_to_file(const std::filesystem::path& path) const;
  nlohmann::json persistent_json() const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path) { path_override_ = path; }
  static std::filesystem::path default_settings_path();

  bool help_requested() const { return get<bool>("help"); }
  bool save_requested() const { return get<bool>("save"); }

  static std::optional<bool> parse_bool(const std::string& text);

private:
  struct Entry {
    OptionInfo info;
    nlohmann::json default_value;
    nlohmann::json value;
    Source source = Source::Default;
    bool persistent = true;
    std::optional<long long> min;
    std::optional<long long> max;
  };

  static std::string normalize(const std::string& name);
  const Entry* find(const std::string& name) const;
  Entry* find(const std::string& name);
  const Entry& require(const std::string& key) const;

  // Throws HowlError(Client) describing why the value does not fit.
  nlohmann::json coerce(const Entry& entry, const nlohmann::json& value) const;
  nlohmann::json parse_text(const Entry& entry, const std::string& text) const;

  std::vector<Entry> entries_;
  std::filesystem::path path_override_;
};

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification) {
  for(const auto& row : specification) {
    Entry entry;
    entry.info.key = row.at("key").get<std::string>();
    for(const auto& alias : row.value("aliases", nlohmann::json::array())) {
      entry.info.aliases.push_back(normalize(alias.get<std::string>()));
    }
    entry.info.type = row.at("type").get<std::string>();
    entry.info.section = row.value("section", "general");
    entry.info.description = row.value("description", "");
    entry.default_value = row.at("default");
    entry.info.default_text = entry.default_value.is_string()
      ? entry.default_value.get<std::string>()
      : entry.default_value.dump();
    entry.persistent = row.value("persistent", true);
    if(row.contains("min")) entry.min = row.at("min").get<long long>();
    if(row.contains("max")) entry.max = row.at("max").get<long long>();
    entry.value = entry.default_value;
    entries_.push_back(std::move(entry));
  }
}

inline std::string SettingsManager::normalize(const std::string& name) {
  auto out = to_lower(trim(name));
  std::replace(out.begin(), out.end(), '-', '_');
  return out;
}

inline const SettingsManager::Entry* SettingsManager::find(const std::string& name) const {
  const auto wanted = normalize(name);
  for(const auto& entry : entries_) {
    if(entry.info.key == wanted) return &entry;
    const auto& aliases = entry.info.aliases;
    if(std::find(aliases.begin(), aliases.end(), wanted) != aliases.end()) return &entry;
  }
  return nullptr;
}

inline SettingsManager::Entry* SettingsManager::find(const std::string& name) {
  return const_cast<Entry*>(static_cast<const SettingsManager*>(this)->find(name));
}

inline const SettingsManager::Entry& SettingsManager::require(const std::string& key) const {
  for(const auto& entry : entries_) {
    if(entry.info.key == key) return entry;
  }
  throw HowlError(ErrorKind::Internal, "Unknown setting: " + key);
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  return require(key).value.get<T>();
}

inline SettingsManager::Source SettingsManager::source(const std::string& key) const {
  return require(key).source;
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& name) const {
  if(const auto* entry = find(name)) return entry->info.key;
  return std::nullopt;
}

inline bool SettingsManager::is_flag(const std::string& key) const {
  const auto* entry = find(key);
  return entry && entry->info.type == "bool";
}

inline std::vector<SettingsManager::OptionInfo> SettingsManager::options() const {
  std::vector<OptionInfo> out;
  out.reserve(entries_.size());
  for(const auto& entry : entries_) out.push_back(entry.info);
  return out;
}

inline std::optional<bool> SettingsManager::parse_bool(const std::string& text) {
  const auto v = to_lower(trim(text));
  if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
  if(v == "false" || v == "0" || v == "off" || v == "no") return false;
  return std::nullopt;
}

inline nlohmann::json SettingsManager::coerce(const Entry& entry, const nlohmann::json& value) const {
  const auto& type = entry.info.type;
  if(type == "bool") {
    if(value.is_boolean()) return value;
    if(value.is_number_integer()) return value.get<long long>() != 0;
    throw HowlError(ErrorKind::Client, entry.info.key + " expects true or false");
  }
  if(type == "int") {
    if(!value.is_number_integer()) {
      throw HowlError(ErrorKind::Client, entry.info.key + " expects a whole number");
    }
    const auto n = value.get<long long>();
    if((entry.min && n < *entry.min) || (entry.max && n > *entry.max)) {
      std::string range = entry.max
        ? std::to_string(entry.min.value_or(0)) + "-" + std::to_string(*entry.max)
        : "at least " + std::to_string(entry.min.value_or(0));
      throw HowlError(ErrorKind::Client, entry.info.key + " must be " + range);
    }
    return static_cast<int>(n);
  }
  if(type == "string") {
    if(value.is_string()) return value;
    throw HowlError(ErrorKind::Client, entry.info.key + " expects text");
  }
  throw HowlError(ErrorKind::Internal, "Setting " + entry.info.key + " has unknown type " + type);
}

inline nlohmann::json SettingsManager::parse_text(const Entry& entry, const std::string& text) const {
  const auto clean = trim(text);
  if(entry.info.type == "bool") {
    auto flag = parse_bool(clean);
    if(!flag) throw HowlError(ErrorKind::Client, entry.info.key + " expects true or false, got '" + clean + "'");
    return *flag;
  }
  if(entry.info.type == "int") {
    std::size_t used = 0;
    long long n = 0;
    try {
      n = std::stoll(clean, &used);
    } catch(const std::exception&) {
      used = 0;
    }
    if(clean.empty() || used != clean.size()) {
      throw HowlError(ErrorKind::Client, entry.info.key + " expects a whole number, got '" + clean + "'");
    }
    return n;
  }
  return clean;
}

inline void SettingsManager::set(const std::string& name, const std::string& text, Source source) {
  auto* entry = find(name);
  if(!entry) throw HowlError(ErrorKind::Client, "Unknown option '" + name + "'");
  entry->value = coerce(*entry, parse_text(*entry, text));
  entry->source = source;
}

inline std::filesystem::path SettingsManager::settings_path() const {
  return path_override_.empty() ? default_settings_path() : path_override_;
}

inline std::filesystem::path SettingsManager::default_settings_path() {
  const char* home = std::getenv("HOME");
  std::filesystem::path base = (home && *home) ? std::filesystem::path(home) : std::filesystem::current_path();
  return base / ".config" / "howl" / "settings.json";
}

inline bool SettingsManager::load() {
  return load_from_file(settings_path());
}

inline bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(!in) return false;
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Ignoring unreadable settings file {}: {}", path.string(), e.what());
    return false;
  }
  if(!doc.is_object()) {
    print_err(nullptr, "Ignoring settings file {}: expected a JSON object", path.string());
    return false;
  }
  for(const auto& item : doc.items()) {
    auto* entry = find(item.key());
    if(!entry || !entry->persistent) continue;
    try {
      entry->value = coerce(*entry, item.value());
      entry->source = Source::File;
    } catch(const HowlError& e) {
      print_err(nullptr, "Ignoring setting '{}' in {}: {}", item.key(), path.string(), e.what());
    }
  }
  return true;
}

inline nlohmann::json SettingsManager::persistent_json() const {
  auto doc = nlohmann::json::object();
  for(const auto& entry : entries_) {
    if(entry.persistent) doc[entry.info.key] = entry.value;
  }
  return doc;
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  std::error_code ec;
  if(path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::trunc);
  if(!out) return false;
  out << persistent_json().dump(2) << "\n";
  return static_cast<bool>(out);
}
