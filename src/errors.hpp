#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
  Client,         // malformed request, bad local input
  Auth,           // missing or wrong code / session token
  NotFound,       // unknown file id, expired upload id
  Quota,          // transfer limit reached
  Integrity,      // hash mismatch
  Transport,      // network failure or non-success HTTP reply
  Configuration,  // port or directory unusable at start
  Internal
};

const char* to_string(ErrorKind kind);
int http_status_for(ErrorKind kind);

class HowlError : public std::runtime_error {
public:
  HowlError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }
  int http_status() const { return http_status_for(kind_); }

private:
  ErrorKind kind_;
};
