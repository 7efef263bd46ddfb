#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "log.hpp"
#include "peer_selector.hpp"

// Terminal front end for the selection flow and code entry, on readline.
// Every call blocks, so it belongs on the prompt thread.
class ConsolePrompt : public SelectionPrompt {
public:
  explicit ConsolePrompt(std::string peer_label, std::shared_ptr<Logger> logger = nullptr);

  // Numbered list; a number selects, 's' searches again, 'q' or EOF cancels.
  Choice choose(const std::vector<ServiceInfo>& peers) override;

  // Asks until a 6-digit code is entered. Empty on 'q', blank line or EOF.
  std::optional<std::string> prompt_code(const std::string& message);

  static bool is_valid_code(const std::string& value);

private:
  std::optional<std::string> read_line(const std::string& prompt);

  std::string peer_label_;
  std::shared_ptr<Logger> logger_;
};
