#include "http_message.hpp"

#include "utils.hpp"

#include <cctype>
#include <regex>

namespace {

// Leading-digit parse; nullopt when the value does not start with a digit.
std::optional<std::uint64_t> leading_integer(const std::string& value) {
  std::string clean = trim(value);
  std::size_t i = 0;
  while(i < clean.size() && std::isdigit(static_cast<unsigned char>(clean[i]))) ++i;
  if(i == 0) return std::nullopt;
  try {
    return std::stoull(clean.substr(0, i));
  } catch(const std::exception&) {
    return std::nullopt;
  }
}

std::string quoted_filename(const std::string& value, std::size_t pos) {
  std::string name;
  for(++pos; pos < value.size() && value[pos] != '"'; ++pos) {
    if(value[pos] == '\\' && pos + 1 < value.size()) ++pos;
    name.push_back(value[pos]);
  }
  return name;
}

} // namespace

std::optional<ByteRange> parse_range(const std::string& header, std::uint64_t total_size) {
  const std::string prefix = "bytes=";
  if(header.rfind(prefix, 0) != 0) return std::nullopt;
  auto range_text = header.substr(prefix.size());
  if(range_text.empty()) return std::nullopt;

  auto dash = range_text.find('-');
  std::string first = range_text.substr(0, dash);
  std::string second;
  if(dash != std::string::npos) {
    second = range_text.substr(dash + 1);
    auto comma = second.find(',');
    if(comma != std::string::npos) second = second.substr(0, comma);
  }

  if(first.empty() && !second.empty()) {
    auto suffix = leading_integer(second);
    if(!suffix || *suffix == 0 || total_size == 0) return std::nullopt;
    std::uint64_t start = *suffix >= total_size ? 0 : total_size - *suffix;
    return ByteRange{start, total_size - 1};
  }

  auto start = leading_integer(first);
  if(!start) return std::nullopt;
  if(total_size == 0 || *start >= total_size) return std::nullopt;

  std::uint64_t end = total_size - 1;
  if(!second.empty()) {
    auto parsed = leading_integer(second);
    if(!parsed) return std::nullopt;
    end = *parsed;
  }
  if(*start > end) return std::nullopt;
  if(end > total_size - 1) end = total_size - 1;
  return ByteRange{*start, end};
}

std::string content_range(const ByteRange& range, std::uint64_t total_size) {
  return "bytes " + std::to_string(range.start) + "-" + std::to_string(range.end) + "/" +
         std::to_string(total_size);
}

std::string attachment_disposition(const std::string& filename) {
  std::string fallback;
  for(unsigned char ch : filename) {
    if(ch < 0x20 || ch >= 0x7f) {
      fallback.push_back('_');
    } else {
      if(ch == '"' || ch == '\\') fallback.push_back('\\');
      fallback.push_back(static_cast<char>(ch));
    }
  }
  return "attachment; filename=\"" + fallback + "\"; filename*=UTF-8''" + url_encode(filename);
}

std::optional<std::string> parse_content_disposition_filename(const std::string& value) {
  const auto lower = to_lower(value);

  auto star = lower.find("filename*=");
  if(star != std::string::npos) {
    auto start = star + 10;
    auto end = value.find(';', start);
    auto encoded = trim(value.substr(start, end == std::string::npos ? std::string::npos : end - start));
    auto charset_end = encoded.find('\'');
    auto language_end = charset_end == std::string::npos ? std::string::npos : encoded.find('\'', charset_end + 1);
    if(language_end != std::string::npos) {
      auto name = url_decode(encoded.substr(language_end + 1), false);
      if(!name.empty()) return name;
    }
  }

  auto plain = lower.find("filename=");
  if(plain == std::string::npos) return std::nullopt;
  auto pos = plain + 9;
  std::string name;
  if(pos < value.size() && value[pos] == '"') {
    name = quoted_filename(value, pos);
  } else {
    auto end = value.find(';', pos);
    name = value.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
  }
  name = trim(name);
  if(name.empty()) return std::nullopt;
  return name;
}

std::optional<std::uint64_t> parse_content_range_total(const std::string& value) {
  static const std::regex pattern("bytes \\d+-\\d+/(\\d+)");
  std::smatch match;
  if(!std::regex_search(value, match, pattern)) return std::nullopt;
  try {
    return std::stoull(match[1].str());
  } catch(const std::exception&) {
    return std::nullopt;
  }
}

std::string url_decode(const std::string& value, bool plus_as_space) {
  std::string out;
  out.reserve(value.size());
  for(std::size_t i = 0; i < value.size(); ++i) {
    char ch = value[i];
    if(ch == '%' && i + 2 < value.size() &&
       std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
       std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
      out.push_back(static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16)));
      i += 2;
    } else if(ch == '+' && plus_as_space) {
      out.push_back(' ');
    } else {
      out.push_back(ch);
    }
  }
  return out;
}

std::string url_encode(const std::string& value) {
  static const char* hex = "0123456789ABCDEF";
  std::string out;
  for(unsigned char ch : value) {
    if(std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
      out.push_back(static_cast<char>(ch));
    } else {
      out.push_back('%');
      out.push_back(hex[ch >> 4]);
      out.push_back(hex[ch & 0x0F]);
    }
  }
  return out;
}
