#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps `howl <command> [file] [options]` onto SettingsManager.
//
// Accepted forms: --key value, --key=value, -alias value, bare flags for
// bool settings (optionally followed by an explicit true/false), and "--"
// to end option parsing.
class CommandLineParser {
public:
  explicit CommandLineParser(std::string program = "howl");

  // Throws HowlError(Client) on unknown options, missing or invalid values
  // and surplus positionals.
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void parse(const std::vector<std::string>& args, SettingsManager& settings) const;

  void usage() const;

private:
  std::string program_;
  std::vector<std::string> positionals_;
  std::vector<SettingsManager::OptionInfo> options_;
};
