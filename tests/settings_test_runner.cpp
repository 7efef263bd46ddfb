#include "command_line_parser.hpp"
#include "errors.hpp"
#include "howl_app.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"

#include <string>
#include <vector>

namespace {

using howl::test::TempWorkspace;
using howl::test::TestCase;
using howl::test::TestContext;

bool client_error(const std::function<void()>& fn) {
  try {
    fn();
    return false;
  } catch(const HowlError& e) {
    return e.kind() == ErrorKind::Client;
  }
}

bool test_defaults(TestContext&) {
  SettingsManager settings;
  return settings.get<int>("port") == 0 &&
         settings.get<int>("limit") == 1 &&
         settings.get<std::string>("output") == "./downloads" &&
         !settings.get<bool>("no_verification") &&
         !settings.help_requested() &&
         settings.source("limit") == SettingsManager::Source::Default;
}

bool test_send_command_line(TestContext&) {
  SettingsManager settings;
  CommandLineParser parser;
  parser.parse({"send", "report.pdf", "--limit", "3", "-p", "40100", "--no-verification", "--name=Office PC"}, settings);
  auto options = HowlApp::options_from_settings(settings);
  return options.mode == HowlApp::Mode::Send &&
         options.file == "report.pdf" &&
         options.limit == 3 &&
         options.port == 40100 &&
         !options.require_verification &&
         options.name == "Office PC" &&
         settings.source("limit") == SettingsManager::Source::CommandLine;
}

bool test_receive_command_line(TestContext&) {
  SettingsManager settings;
  CommandLineParser parser;
  parser.parse({"receive", "-o", "/tmp/inbox", "--upload-verify", "--uploads", "0", "--disable-lan", "false"}, settings);
  auto options = HowlApp::options_from_settings(settings);
  return options.mode == HowlApp::Mode::Receive &&
         options.output == "/tmp/inbox" &&
         options.per_file_verification &&
         options.limit == 0 &&
         options.enable_lan;
}

bool test_flag_does_not_swallow_positional(TestContext&) {
  SettingsManager settings;
  CommandLineParser parser;
  parser.parse({"send", "--debug", "notes.txt"}, settings);
  return settings.get<bool>("debug") && settings.get<std::string>("file") == "notes.txt";
}

bool test_double_dash_ends_options(TestContext&) {
  SettingsManager settings;
  CommandLineParser parser;
  parser.parse({"send", "--", "-odd-name.txt"}, settings);
  return settings.get<std::string>("file") == "-odd-name.txt";
}

bool test_rejections(TestContext&) {
  CommandLineParser parser;
  auto parse = [&](std::vector<std::string> args){
    return [&parser, args]{
      SettingsManager settings;
      parser.parse(args, settings);
    };
  };
  return client_error(parse({"send", "a.txt", "--bogus"})) &&
         client_error(parse({"send", "a.txt", "--limit"})) &&
         client_error(parse({"send", "a.txt", "--limit", "many"})) &&
         client_error(parse({"send", "a.txt", "--limit", "-2"})) &&
         client_error(parse({"send", "a.txt", "--port", "70000"})) &&
         client_error(parse({"send", "a.txt", "extra"}));
}

bool test_command_validation(TestContext&) {
  auto options_for = [](std::vector<std::string> args){
    return [args]{
      SettingsManager settings;
      CommandLineParser().parse(args, settings);
      HowlApp::options_from_settings(settings);
    };
  };
  return client_error(options_for({})) &&
         client_error(options_for({"send"})) &&
         client_error(options_for({"fetch"}));
}

bool test_settings_file_roundtrip(TestContext&) {
  TempWorkspace ws("howl-settings");
  const auto path = ws / "settings.json";
  {
    SettingsManager settings;
    settings.set("limit", "5");
    settings.set("output", "/srv/inbox");
    settings.set("file", "not-persisted.txt");
    settings.set("save", "true");
    if(!settings.save_to_file(path)) return false;
  }
  auto doc = nlohmann::json::parse(howl::test::read_file(path));
  SettingsManager loaded;
  if(!loaded.load_from_file(path)) return false;
  return doc.value("limit", 0) == 5 &&
         !doc.contains("file") && !doc.contains("save") && !doc.contains("command") &&
         loaded.get<int>("limit") == 5 &&
         loaded.get<std::string>("output") == "/srv/inbox" &&
         loaded.source("limit") == SettingsManager::Source::File &&
         loaded.get<std::string>("file").empty();
}

bool test_bad_file_entries_are_skipped(TestContext&) {
  TempWorkspace ws("howl-settings-bad");
  const auto path = ws / "settings.json";
  howl::test::write_file(path, R"({"limit": "lots", "port": 40200, "unknown": 1, "file": "x"})");
  SettingsManager settings;
  bool loaded = settings.load_from_file(path);
  howl::test::write_file(ws / "broken.json", "{ nope");
  SettingsManager other;
  return loaded &&
         settings.get<int>("limit") == 1 &&
         settings.get<int>("port") == 40200 &&
         settings.get<std::string>("file").empty() &&
         !other.load_from_file(ws / "broken.json") &&
         !other.load_from_file(ws / "missing.json");
}

bool test_command_line_overrides_file(TestContext&) {
  TempWorkspace ws("howl-settings-override");
  const auto path = ws / "settings.json";
  howl::test::write_file(path, R"({"limit": 4, "debug": true})");
  SettingsManager settings;
  settings.load_from_file(path);
  CommandLineParser().parse({"receive", "--limit", "2"}, settings);
  return settings.get<int>("limit") == 2 && settings.get<bool>("debug");
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"defaults", test_defaults},
    {"send_command_line", test_send_command_line},
    {"receive_command_line", test_receive_command_line},
    {"flag_does_not_swallow_positional", test_flag_does_not_swallow_positional},
    {"double_dash_ends_options", test_double_dash_ends_options},
    {"rejections", test_rejections},
    {"command_validation", test_command_validation},
    {"settings_file_roundtrip", test_settings_file_roundtrip},
    {"bad_file_entries_are_skipped", test_bad_file_entries_are_skipped},
    {"command_line_overrides_file", test_command_line_overrides_file}
  };
  return howl::test::run_suite("settings", tests, argc, argv);
}
