#include "errors.hpp"
#include "http_message.hpp"
#include "http_server.hpp"
#include "types.hpp"
#include "utils.hpp"
#include "test_runner_utils.hpp"

#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace {

using howl::test::TestCase;
using howl::test::TestContext;

bool range_is(const std::optional<ByteRange>& range, std::uint64_t start, std::uint64_t end) {
  return range && range->start == start && range->end == end;
}

bool test_parse_range_explicit(TestContext&) {
  return range_is(parse_range("bytes=0-499", 1000), 0, 499) &&
         range_is(parse_range("bytes=500-999", 1000), 500, 999) &&
         range_is(parse_range("bytes=0-0", 1000), 0, 0);
}

bool test_parse_range_open_and_suffix(TestContext&) {
  return range_is(parse_range("bytes=-100", 1000), 900, 999) &&
         range_is(parse_range("bytes=200-", 1000), 200, 999) &&
         range_is(parse_range("bytes=-5000", 1000), 0, 999) &&
         range_is(parse_range("bytes=900-5000", 1000), 900, 999);
}

bool test_parse_range_unsatisfiable(TestContext&) {
  return !parse_range("bytes=500-400", 1000) &&
         !parse_range("bytes=1000-", 1000) &&
         !parse_range("bytes=1500-1600", 1000) &&
         !parse_range("bytes=-0", 1000) &&
         !parse_range("bytes=0-10", 0);
}

bool test_parse_range_malformed(TestContext&) {
  return !parse_range("", 1000) &&
         !parse_range("items=0-10", 1000) &&
         !parse_range("bytes=", 1000) &&
         !parse_range("bytes=abc-def", 1000);
}

bool test_content_disposition_parsing(TestContext&) {
  auto quoted = parse_content_disposition_filename("attachment; filename=\"report final.pdf\"");
  auto escaped = parse_content_disposition_filename("attachment; filename=\"a\\\"b.txt\"");
  auto bare = parse_content_disposition_filename("attachment; filename=plain.txt; size=3");
  auto extended = parse_content_disposition_filename(
    "attachment; filename=\"_.txt\"; filename*=UTF-8''%E2%82%AC%20rates.txt");
  return quoted && *quoted == "report final.pdf" &&
         escaped && *escaped == "a\"b.txt" &&
         bare && *bare == "plain.txt" &&
         extended && *extended == "\xE2\x82\xAC rates.txt" &&
         !parse_content_disposition_filename("inline");
}

bool test_content_range_total(TestContext&) {
  auto total = parse_content_range_total("bytes 100-999/1000");
  return total && *total == 1000 &&
         !parse_content_range_total("bytes */1000") &&
         content_range(ByteRange{100, 999}, 1000) == "bytes 100-999/1000";
}

bool test_attachment_disposition_escapes_name(TestContext&) {
  const std::string name = "a\"b\r\nSet-Cookie: x=1\\.txt";
  const auto header = attachment_disposition(name);
  auto parsed = parse_content_disposition_filename(header);
  const auto fallback_end = header.find("\"; filename*=");
  return header.find('\r') == std::string::npos &&
         header.find('\n') == std::string::npos &&
         fallback_end != std::string::npos &&
         header.substr(0, fallback_end).find("a\\\"b__Set-Cookie: x=1\\\\.txt") != std::string::npos &&
         parsed && *parsed == name;
}

bool test_attachment_disposition_plain_name(TestContext&) {
  return attachment_disposition("notes.txt") ==
         "attachment; filename=\"notes.txt\"; filename*=UTF-8''notes.txt";
}

bool test_url_encoding(TestContext&) {
  return url_encode("my file+1.txt") == "my%20file%2B1.txt" &&
         url_decode("my%20file%2B1.txt") == "my file+1.txt" &&
         url_decode("a+b") == "a b" &&
         url_decode("a+b", false) == "a+b";
}

bool test_status_mapping(TestContext&) {
  return http_status_for(ErrorKind::Client) == 400 &&
         http_status_for(ErrorKind::Auth) == 403 &&
         http_status_for(ErrorKind::NotFound) == 404 &&
         http_status_for(ErrorKind::Quota) == 429 &&
         http_status_for(ErrorKind::Integrity) == 400 &&
         http_status_for(ErrorKind::Transport) == 502 &&
         http_status_for(ErrorKind::Internal) == 500;
}

bool test_error_response_body(TestContext&) {
  httplib::Response res;
  reply_error(res, 403, "Verification required. Please verify first.");
  auto body = nlohmann::json::parse(res.body);
  return res.status == 403 &&
         res.get_header_value("Content-Type") == "application/json" &&
         body.value("success", true) == false &&
         body.value("message", std::string()) == "Verification required. Please verify first.";
}

bool test_format_helpers(TestContext&) {
  return format_bytes(0) == "0 Bytes" &&
         format_bytes(512) == "512.00 Bytes" &&
         format_bytes(1536) == "1.50 KB" &&
         format_bytes(5ull * 1024 * 1024) == "5.00 MB" &&
         format_speed(2048.0) == "2.00 KB/s" &&
         format_time(42) == "42s" &&
         format_time(125) == "2m 5s" &&
         format_time(3725) == "1h 2m 5s" &&
         format_time(std::numeric_limits<double>::infinity()) == "--";
}

bool test_mime_types(TestContext&) {
  return mime_type_for("movie.MP4") == "video/mp4" &&
         mime_type_for("notes.txt") == "text/plain" &&
         mime_type_for("archive.tar.gz") == "application/gzip" &&
         mime_type_for("blob.unknownext") == "application/octet-stream" &&
         mime_type_for("README") == "application/octet-stream";
}

bool test_user_agent_classification(TestContext&) {
  return classify_user_agent("howl-cli/1.0") == TransferType::Cli &&
         classify_user_agent("Howl-Client/1.0.0") == TransferType::Client &&
         classify_user_agent("Mozilla/5.0 (X11; Linux x86_64)") == TransferType::Browser &&
         classify_user_agent("") == TransferType::Browser;
}

bool test_file_metadata_json(TestContext&) {
  FileMetadata meta;
  meta.id = "a.txt";
  meta.name = "a.txt";
  meta.size = 42;
  meta.mime_type = "text/plain";
  meta.path = "/tmp/a.txt";
  nlohmann::json j = meta;
  auto back = j.get<FileMetadata>();
  return j.value("mimeType", std::string()) == "text/plain" &&
         back.size == 42 && back.mime_type && *back.mime_type == "text/plain";
}

bool test_sha256(TestContext&) {
  Sha256Stream stream;
  stream.update("ab", 2);
  stream.update("c", 1);
  return sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad" &&
         stream.hex_digest() == sha256_hex("abc");
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"parse_range_explicit", test_parse_range_explicit},
    {"parse_range_open_and_suffix", test_parse_range_open_and_suffix},
    {"parse_range_unsatisfiable", test_parse_range_unsatisfiable},
    {"parse_range_malformed", test_parse_range_malformed},
    {"content_disposition_parsing", test_content_disposition_parsing},
    {"content_range_total", test_content_range_total},
    {"attachment_disposition_escapes_name", test_attachment_disposition_escapes_name},
    {"attachment_disposition_plain_name", test_attachment_disposition_plain_name},
    {"url_encoding", test_url_encoding},
    {"status_mapping", test_status_mapping},
    {"error_response_body", test_error_response_body},
    {"format_helpers", test_format_helpers},
    {"mime_types", test_mime_types},
    {"user_agent_classification", test_user_agent_classification},
    {"file_metadata_json", test_file_metadata_json},
    {"sha256", test_sha256}
  };
  return howl::test::run_suite("http message", tests, argc, argv);
}
