#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>

// Holds one 6-digit code and the session tokens minted against it.
// Tokens are only meaningful to the instance that issued them.
class VerificationManager {
public:
  struct Result {
    bool valid = false;
    std::optional<std::string> session_token;
  };

  VerificationManager();
  // Fixed code, for callers that already agreed on one.
  explicit VerificationManager(std::string code);

  std::string code() const;
  std::string regenerate_code();

  // Trimmed comparison against the current code, no token issued.
  bool matches(const std::string& candidate) const;

  Result verify_and_create_session(const std::string& candidate);
  bool is_session_verified(const std::string& token) const;
  void clear_sessions();
  std::size_t session_count() const;

  static std::string generate_code();

private:
  mutable std::mutex mutex_;
  std::string code_;
  std::unordered_set<std::string> sessions_;
};
