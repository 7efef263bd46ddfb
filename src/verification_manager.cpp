#include "verification_manager.hpp"

#include "utils.hpp"

#include <random>

VerificationManager::VerificationManager()
  : code_(generate_code()) {}

VerificationManager::VerificationManager(std::string code)
  : code_(trim(code)) {}

std::string VerificationManager::generate_code() {
  static thread_local std::mt19937 rng{std::random_device{}()};
  std::uniform_int_distribution<int> dist(100000, 999999);
  return std::to_string(dist(rng));
}

std::string VerificationManager::code() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return code_;
}

std::string VerificationManager::regenerate_code() {
  std::lock_guard<std::mutex> lock(mutex_);
  code_ = generate_code();
  return code_;
}

bool VerificationManager::matches(const std::string& candidate) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return trim(candidate) == code_;
}

VerificationManager::Result VerificationManager::verify_and_create_session(const std::string& candidate) {
  Result result;
  std::lock_guard<std::mutex> lock(mutex_);
  if(trim(candidate) != code_) return result;
  std::string token;
  do {
    token = random_hex(16);
  } while(sessions_.count(token) != 0);
  sessions_.insert(token);
  result.valid = true;
  result.session_token = token;
  return result;
}

bool VerificationManager::is_session_verified(const std::string& token) const {
  if(token.empty()) return false;
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.count(token) != 0;
}

void VerificationManager::clear_sessions() {
  std::lock_guard<std::mutex> lock(mutex_);
  sessions_.clear();
}

std::size_t VerificationManager::session_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}
