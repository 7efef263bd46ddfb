#include "console_prompt.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>

#include <readline/readline.h>
#include <readline/history.h>

#include "utils.hpp"

ConsolePrompt::ConsolePrompt(std::string peer_label, std::shared_ptr<Logger> logger)
  : peer_label_(std::move(peer_label)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("prompt")) {}

std::optional<std::string> ConsolePrompt::read_line(const std::string& prompt) {
  char* line = readline(prompt.c_str());
  if(!line) return std::nullopt;
  std::string result(line);
  if(!result.empty()) add_history(result.c_str());
  free(line);
  return result;
}

bool ConsolePrompt::is_valid_code(const std::string& value) {
  if(value.size() != 6) return false;
  for(char ch : value) {
    if(!std::isdigit(static_cast<unsigned char>(ch))) return false;
  }
  return true;
}

SelectionPrompt::Choice ConsolePrompt::choose(const std::vector<ServiceInfo>& peers) {
  logger_->print("");
  logger_->print("Found {} {}{}:", peers.size(), peer_label_, peers.size() == 1 ? "" : "s");
  for(std::size_t i = 0; i < peers.size(); ++i) {
    const auto& peer = peers[i];
    auto file = peer.txt.find("fileName");
    if(file != peer.txt.end()) {
      logger_->print("  {}) {} ({}:{}) {}", i + 1, peer.display_name(), peer.host, peer.port, file->second);
    } else {
      logger_->print("  {}) {} ({}:{})", i + 1, peer.display_name(), peer.host, peer.port);
    }
  }
  logger_->print("  s) Search again");
  logger_->print("  q) Stay in server mode");

  while(true) {
    auto line = read_line("Select a " + peer_label_ + ": ");
    if(!line) return {Action::Cancel, 0};
    auto answer = to_lower(trim(*line));
    if(answer.empty() || answer == "q") return {Action::Cancel, 0};
    if(answer == "s" || answer == "r") return {Action::SearchAgain, 0};
    char* end = nullptr;
    unsigned long picked = std::strtoul(answer.c_str(), &end, 10);
    if(end && *end == '\0' && picked >= 1 && picked <= peers.size()) {
      return {Action::Select, static_cast<std::size_t>(picked - 1)};
    }
    logger_->print_err("Enter a number between 1 and {}, 's' or 'q'", peers.size());
  }
}

std::optional<std::string> ConsolePrompt::prompt_code(const std::string& message) {
  while(true) {
    auto line = read_line(message + " ");
    if(!line) return std::nullopt;
    auto code = trim(*line);
    if(code.empty() || to_lower(code) == "q") return std::nullopt;
    if(code.size() != 6) {
      logger_->print_err("Verification code must be 6 digits");
      continue;
    }
    if(!is_valid_code(code)) {
      logger_->print_err("Verification code must contain only numbers");
      continue;
    }
    return code;
  }
}
