#include "verification_manager.hpp"
#include "test_runner_utils.hpp"

#include <cctype>
#include <set>
#include <string>
#include <vector>

namespace {

using howl::test::TestCase;
using howl::test::TestContext;

bool is_six_digits(const std::string& code) {
  if(code.size() != 6) return false;
  for(char ch : code) {
    if(!std::isdigit(static_cast<unsigned char>(ch))) return false;
  }
  return code[0] != '0';
}

bool test_generated_codes_are_six_digits(TestContext&) {
  for(int i = 0; i < 500; ++i) {
    if(!is_six_digits(VerificationManager::generate_code())) return false;
  }
  VerificationManager manager;
  return is_six_digits(manager.code());
}

bool test_exact_code_mints_unique_tokens(TestContext&) {
  std::set<std::string> tokens;
  for(int round = 0; round < 20; ++round) {
    VerificationManager manager;
    for(int i = 0; i < 5; ++i) {
      auto result = manager.verify_and_create_session(manager.code());
      if(!result.valid || !result.session_token) return false;
      if(result.session_token->size() != 32) return false;
      if(!tokens.insert(*result.session_token).second) return false;
      if(!manager.is_session_verified(*result.session_token)) return false;
    }
    if(manager.session_count() != 5) return false;
  }
  return true;
}

bool test_wrong_code_rejected(TestContext&) {
  VerificationManager manager("123456");
  const std::vector<std::string> wrong = {"", "12345", "1234567", "654321", "12345a", "123 456", "abcdef"};
  for(const auto& candidate : wrong) {
    auto result = manager.verify_and_create_session(candidate);
    if(result.valid || result.session_token) return false;
  }
  return manager.session_count() == 0;
}

bool test_surrounding_whitespace_is_ignored(TestContext&) {
  VerificationManager manager(" 123456\n");
  if(manager.code() != "123456") return false;
  if(!manager.matches("  123456 ")) return false;
  auto result = manager.verify_and_create_session("\t123456\r\n");
  return result.valid && manager.session_count() == 1;
}

bool test_matches_does_not_create_session(TestContext&) {
  VerificationManager manager("111222");
  if(!manager.matches("111222")) return false;
  if(manager.matches("111223")) return false;
  return manager.session_count() == 0;
}

bool test_unknown_tokens_rejected(TestContext&) {
  VerificationManager first("123456");
  VerificationManager second("123456");
  auto result = first.verify_and_create_session("123456");
  if(!result.valid) return false;
  if(second.is_session_verified(*result.session_token)) return false;
  if(first.is_session_verified("")) return false;
  return !first.is_session_verified("not-a-token");
}

bool test_regenerate_keeps_sessions_but_changes_code(TestContext&) {
  VerificationManager manager("123456");
  auto result = manager.verify_and_create_session("123456");
  std::string next;
  for(int i = 0; i < 10 && (next.empty() || next == "123456"); ++i) {
    next = manager.regenerate_code();
  }
  if(next == "123456" || !is_six_digits(next)) return false;
  if(manager.matches("123456")) return false;
  return manager.is_session_verified(*result.session_token);
}

bool test_clear_sessions(TestContext&) {
  VerificationManager manager("123456");
  auto a = manager.verify_and_create_session("123456");
  auto b = manager.verify_and_create_session("123456");
  manager.clear_sessions();
  return manager.session_count() == 0 &&
         !manager.is_session_verified(*a.session_token) &&
         !manager.is_session_verified(*b.session_token);
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"generated_codes_are_six_digits", test_generated_codes_are_six_digits},
    {"exact_code_mints_unique_tokens", test_exact_code_mints_unique_tokens},
    {"wrong_code_rejected", test_wrong_code_rejected},
    {"surrounding_whitespace_is_ignored", test_surrounding_whitespace_is_ignored},
    {"matches_does_not_create_session", test_matches_does_not_create_session},
    {"unknown_tokens_rejected", test_unknown_tokens_rejected},
    {"regenerate_keeps_sessions_but_changes_code", test_regenerate_keeps_sessions_but_changes_code},
    {"clear_sessions", test_clear_sessions}
  };
  return howl::test::run_suite("verification", tests, argc, argv);
}
