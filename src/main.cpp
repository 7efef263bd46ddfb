#include <cpptrace/cpptrace.hpp>

#include <unistd.h>

#include "command_line_parser.hpp"
#include "errors.hpp"
#include "howl_app.hpp"
#include "log.hpp"
#include "settings_manager.hpp"

int main(int argc, char** argv){
  init_logging(false);
  auto settings = std::make_shared<SettingsManager>();
  settings->load();

  CommandLineParser parser("howl");
  try {
    parser.parse(argc, argv, *settings);
  } catch(const HowlError& e) {
    print_err(nullptr, "{}", e.what());
    parser.usage();
    return 1;
  }
  if(settings->help_requested()) {
    parser.usage();
    return 0;
  }

  const bool debug = settings->get<bool>("debug");
  init_logging(debug);
  auto logger = std::make_shared<Logger>("howl", debug);
  logger->debug("Debug logging enabled");

  if(settings->save_requested()) {
    if(!settings->save()) {
      logger->error("Unable to persist settings to {}", settings->settings_path().string());
    } else {
      logger->print("Settings saved to {}", settings->settings_path().string());
    }
  }

  try {
    auto options = HowlApp::options_from_settings(*settings);
    options.interactive = isatty(STDIN_FILENO) != 0;
    logger->print("howl {} - {}", kHowlVersion, options.mode == HowlApp::Mode::Send ? "send" : "receive");

    auto app = HowlApp::create(options, logger);
    app->start();
    return app->run();
  } catch(const HowlError& e) {
    logger->error("{}", e.what());
    if(e.kind() == ErrorKind::Client) {
      parser.usage();
    }
    return 1;
  } catch(const std::exception& e) {
    logger->error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
