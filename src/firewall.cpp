#include "firewall.hpp"

#include "errors.hpp"

#include <cstdlib>

namespace {
constexpr const char* kRuleName = "Howl File Transfer";
}

bool is_port_available(asio::io_context& io, std::uint16_t port) {
  asio::ip::tcp::acceptor trial(io);
  std::error_code ec;
  asio::ip::tcp::endpoint endpoint(asio::ip::address_v4::any(), port);
  trial.open(endpoint.protocol(), ec);
  if(ec) return false;
  trial.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
  trial.bind(endpoint, ec);
  if(ec) return false;
  trial.listen(asio::socket_base::max_listen_connections, ec);
  std::error_code ignored;
  trial.close(ignored);
  return !ec;
}

std::uint16_t find_available_port(asio::io_context& io, std::uint16_t preferred, Logger* logger) {
  if(preferred > 0) {
    if(is_port_available(io, preferred)) return preferred;
    throw HowlError(ErrorKind::Configuration, "Specified port " + std::to_string(preferred) + " is not available");
  }
  for(std::uint32_t port = kPortRangeStart; port <= kPortRangeEnd; ++port) {
    if(is_port_available(io, static_cast<std::uint16_t>(port))) return static_cast<std::uint16_t>(port);
  }
  log_warn(logger, "No available port in range {}-{}, searching beyond", kPortRangeStart, kPortRangeEnd);
  for(std::uint32_t port = kPortRangeEnd + 1; port <= 65535; ++port) {
    if(is_port_available(io, static_cast<std::uint16_t>(port))) {
      log_warn(logger, "Using port {} outside the default range", port);
      return static_cast<std::uint16_t>(port);
    }
  }
  throw HowlError(ErrorKind::Configuration, "No available port found");
}

bool FirewallHelper::is_windows() {
#ifdef _WIN32
  return true;
#else
  return false;
#endif
}

FirewallResult FirewallHelper::ensure_port_allowed(std::uint16_t port) {
  if(!is_windows()) {
    return {true, "Not Windows, firewall rule not needed"};
  }
  const std::string command =
    std::string("netsh advfirewall firewall add rule name=\"") + kRuleName +
    "\" dir=in action=allow protocol=TCP localport=" + std::to_string(port) + " >NUL 2>&1";
  if(std::system(command.c_str()) == 0) {
    return {true, "Firewall rule added for port " + std::to_string(port)};
  }
  return {false, "Unable to add firewall rule (administrator rights required)"};
}

std::string FirewallHelper::manual_instructions(std::uint16_t port) {
  return "Allow inbound TCP connections on port " + std::to_string(port) +
         " in your firewall, or run once as administrator:\n"
         "  netsh advfirewall firewall add rule name=\"" + std::string(kRuleName) +
         "\" dir=in action=allow protocol=TCP localport=" + std::to_string(port);
}
