#include "command_line_parser.hpp"

#include "errors.hpp"
#include "log.hpp"

namespace {

bool looks_like_option(const std::string& token) {
  return token.size() > 1 && token[0] == '-' && token != "--";
}

std::string option_label(const SettingsManager::OptionInfo& option) {
  std::string label = "--" + option.key;
  for(const auto& alias : option.aliases) {
    label += alias.size() == 1 ? ", -" + alias : ", --" + alias;
  }
  if(option.type != "bool") label += " <" + option.type + ">";
  return label;
}

void print_section(const std::vector<SettingsManager::OptionInfo>& options,
                   const std::string& section,
                   const std::string& title) {
  print_out(nullptr, "{}:", title);
  for(const auto& option : options) {
    if(option.section != section) continue;
    std::string line = "  " + option_label(option);
    if(line.size() < 36) line.resize(36, ' ');
    else line += "  ";
    line += option.description;
    if(option.type != "bool" && !option.default_text.empty()) {
      line += " [" + option.default_text + "]";
    }
    print_out(nullptr, "{}", line);
  }
  print_out(nullptr, "");
}

} // namespace

CommandLineParser::CommandLineParser(std::string program)
  : program_(std::move(program)),
    positionals_{"command", "file"},
    options_(SettingsManager().options()) {}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  for(int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
  parse(args, settings);
}

void CommandLineParser::parse(const std::vector<std::string>& args, SettingsManager& settings) const {
  std::size_t next_positional = 0;
  bool options_done = false;

  auto take_positional = [&](const std::string& token){
    if(next_positional >= positionals_.size()) {
      throw HowlError(ErrorKind::Client, "Unexpected argument '" + token + "'");
    }
    settings.set(positionals_[next_positional++], token);
  };

  for(std::size_t i = 0; i < args.size(); ++i) {
    const auto& token = args[i];
    if(options_done || !looks_like_option(token)) {
      take_positional(token);
      continue;
    }
    if(token == "--") {
      options_done = true;
      continue;
    }

    auto name = token.substr(token[1] == '-' ? 2 : 1);
    std::optional<std::string> inline_value;
    auto eq = name.find('=');
    if(eq != std::string::npos) {
      inline_value = name.substr(eq + 1);
      name.erase(eq);
    }

    auto key = settings.resolve_key(name);
    if(!key) throw HowlError(ErrorKind::Client, "Unknown option '" + token + "'");

    if(inline_value) {
      settings.set(*key, *inline_value);
    } else if(settings.is_flag(*key)) {
      // a following true/false belongs to the flag, anything else is the next argument
      if(i + 1 < args.size() && SettingsManager::parse_bool(args[i + 1])) {
        settings.set(*key, args[++i]);
      } else {
        settings.set(*key, "true");
      }
    } else {
      if(i + 1 >= args.size()) {
        throw HowlError(ErrorKind::Client, "Option '" + token + "' needs a value");
      }
      settings.set(*key, args[++i]);
    }
  }
}

void CommandLineParser::usage() const {
  print_out(nullptr, "{} - send a file to a device on the local network", program_);
  print_out(nullptr, "");
  print_out(nullptr, "Usage:");
  print_out(nullptr, "  {} send <file> [options]   serve <file> and upload it to a receiver", program_);
  print_out(nullptr, "  {} receive [options]       accept uploads and download from senders", program_);
  print_out(nullptr, "");
  print_section(options_, "send", "Send options");
  print_section(options_, "receive", "Receive options");
  print_section(options_, "general", "Options");
  print_out(nullptr, "Examples:");
  print_out(nullptr, "  {} send report.pdf --limit 3", program_);
  print_out(nullptr, "  {} receive -o ~/Downloads --upload-verify", program_);
  print_out(nullptr, "");
}
