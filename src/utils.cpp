#include "utils.hpp"
#include "errors.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netinet/in.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <unordered_map>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> sha256_bytes(const std::string &data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256((const unsigned char*)data.data(), data.size(), out.data());
    return out;
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data));
}

Sha256Stream::Sha256Stream() {
  auto* ctx = EVP_MD_CTX_new();
  if(!ctx || EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx);
    throw HowlError(ErrorKind::Internal, "Unable to initialise SHA-256 context");
  }
  ctx_ = ctx;
}

Sha256Stream::~Sha256Stream() {
  EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
}

void Sha256Stream::update(const char* data, std::size_t size) {
  if(size == 0) return;
  EVP_DigestUpdate(static_cast<EVP_MD_CTX*>(ctx_), data, size);
}

std::string Sha256Stream::hex_digest() {
  std::vector<unsigned char> out(EVP_MAX_MD_SIZE);
  unsigned int length = 0;
  EVP_DigestFinal_ex(static_cast<EVP_MD_CTX*>(ctx_), out.data(), &length);
  out.resize(length);
  return hex_from_bytes(out);
}

std::string sha256_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if(!in) {
    throw HowlError(ErrorKind::Client, "Unable to read " + path.string());
  }
  Sha256Stream hasher;
  std::vector<char> buffer(64 * 1024);
  while(in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto got = in.gcount();
    if(got > 0) hasher.update(buffer.data(), static_cast<std::size_t>(got));
  }
  if(in.bad()) {
    throw HowlError(ErrorKind::Client, "Read error on " + path.string());
  }
  return hasher.hex_digest();
}

std::string random_hex(std::size_t byte_count) {
  std::vector<unsigned char> bytes(byte_count);
  if(RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw HowlError(ErrorKind::Internal, "Random generator unavailable");
  }
  return hex_from_bytes(bytes);
}

std::string generate_peer_id() {
  std::vector<unsigned char> bytes(16);
  if(RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw HowlError(ErrorKind::Internal, "Random generator unavailable");
  }
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);
  auto hex = hex_from_bytes(bytes);
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
         hex.substr(16, 4) + "-" + hex.substr(20);
}

std::string local_hostname() {
  char hostname[256];
  if(gethostname(hostname, sizeof(hostname)) != 0) {
    return "howl-device";
  }
  hostname[sizeof(hostname) - 1] = '\0';
  return hostname;
}

std::vector<std::string> local_ipv4_addresses() {
  std::vector<std::string> out;
  ifaddrs* list = nullptr;
  if(getifaddrs(&list) != 0) return out;
  for(ifaddrs* it = list; it; it = it->ifa_next) {
    if(!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) continue;
    auto* addr = reinterpret_cast<sockaddr_in*>(it->ifa_addr);
    char text[INET_ADDRSTRLEN] = {0};
    if(!inet_ntop(AF_INET, &addr->sin_addr, text, sizeof(text))) continue;
    std::string ip(text);
    if(ip.rfind("127.", 0) == 0) continue;
    if(std::find(out.begin(), out.end(), ip) == out.end()) out.push_back(ip);
  }
  freeifaddrs(list);
  return out;
}

std::string mime_type_for(const std::filesystem::path& path) {
  static const std::unordered_map<std::string, std::string> table = {
    {".mp4", "video/mp4"}, {".avi", "video/x-msvideo"}, {".mkv", "video/x-matroska"},
    {".mov", "video/quicktime"}, {".wmv", "video/x-ms-wmv"}, {".flv", "video/x-flv"},
    {".webm", "video/webm"},
    {".mp3", "audio/mpeg"}, {".wav", "audio/wav"}, {".flac", "audio/flac"},
    {".aac", "audio/aac"}, {".ogg", "audio/ogg"},
    {".jpg", "image/jpeg"}, {".jpeg", "image/jpeg"}, {".png", "image/png"},
    {".gif", "image/gif"}, {".bmp", "image/bmp"}, {".svg", "image/svg+xml"},
    {".webp", "image/webp"},
    {".pdf", "application/pdf"}, {".doc", "application/msword"},
    {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
    {".xls", "application/vnd.ms-excel"},
    {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
    {".ppt", "application/vnd.ms-powerpoint"},
    {".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
    {".zip", "application/zip"}, {".rar", "application/x-rar-compressed"},
    {".7z", "application/x-7z-compressed"}, {".tar", "application/x-tar"},
    {".gz", "application/gzip"},
    {".txt", "text/plain"}, {".json", "application/json"}, {".xml", "application/xml"},
    {".html", "text/html"}, {".css", "text/css"}, {".js", "application/javascript"}
  };
  auto it = table.find(to_lower(path.extension().string()));
  if(it == table.end()) return "application/octet-stream";
  return it->second;
}

std::string iso8601_utc(std::chrono::system_clock::time_point when) {
  auto seconds = std::chrono::system_clock::to_time_t(when);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count() % 1000;
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
  std::ostringstream oss;
  oss << buffer << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return oss.str();
}

std::string format_bytes(std::uint64_t bytes) {
  if(bytes == 0) return "0 Bytes";
  static const char* units[] = {"Bytes", "KB", "MB", "GB", "TB"};
  double value = static_cast<double>(bytes);
  std::size_t unit = 0;
  while(value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
    value /= 1024.0;
    ++unit;
  }
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << value << " " << units[unit];
  return oss.str();
}

std::string format_speed(double bytes_per_second) {
  if(!(bytes_per_second > 0)) return format_bytes(0) + "/s";
  return format_bytes(static_cast<std::uint64_t>(bytes_per_second)) + "/s";
}

std::string format_time(double seconds) {
  if(!std::isfinite(seconds) || seconds < 0) return "--";
  auto total = static_cast<std::uint64_t>(seconds);
  auto h = total / 3600;
  auto m = (total % 3600) / 60;
  auto s = total % 60;
  std::ostringstream oss;
  if(h > 0) {
    oss << h << "h " << m << "m " << s << "s";
  } else if(m > 0) {
    oss << m << "m " << s << "s";
  } else {
    oss << s << "s";
  }
  return oss.str();
}

std::string trim(const std::string& value) {
  auto begin = std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); });
  auto end = std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base();
  if(begin >= end) return std::string();
  return std::string(begin, end);
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}
