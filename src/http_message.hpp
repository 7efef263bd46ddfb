#pragma once

#include <cstdint>
#include <optional>
#include <string>

// Header-value helpers used on both sides of a transfer. Framing itself is
// left to httplib.

struct ByteRange {
  std::uint64_t start = 0;
  std::uint64_t end = 0;  // inclusive

  std::uint64_t length() const { return end - start + 1; }
  bool operator==(const ByteRange& other) const {
    return start == other.start && end == other.end;
  }
};

// First range of a "bytes=" header against a resource of total_size bytes.
// nullopt when malformed or unsatisfiable.
std::optional<ByteRange> parse_range(const std::string& header, std::uint64_t total_size);

std::string content_range(const ByteRange& range, std::uint64_t total_size);

// attachment; filename="<ascii fallback>"; filename*=UTF-8''<encoded>
// Quotes and backslashes are escaped, control and non-ASCII bytes never
// reach the quoted form.
std::string attachment_disposition(const std::string& filename);
// Prefers filename* over filename.
std::optional<std::string> parse_content_disposition_filename(const std::string& value);
std::optional<std::uint64_t> parse_content_range_total(const std::string& value);

std::string url_decode(const std::string& value, bool plus_as_space = true);
std::string url_encode(const std::string& value);
