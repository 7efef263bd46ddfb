#pragma once

#include <asio.hpp>

#include <cstdint>
#include <string>

#include "log.hpp"

inline constexpr std::uint16_t kPortRangeStart = 40000;
inline constexpr std::uint16_t kPortRangeEnd = 40050;

bool is_port_available(asio::io_context& io, std::uint16_t port);

// A non-zero preferred port must be free, otherwise HowlError(Configuration).
// Without one: 40000, then the rest of 40000-40050, then anything above.
std::uint16_t find_available_port(asio::io_context& io, std::uint16_t preferred, Logger* logger = nullptr);

struct FirewallResult {
  bool success = false;
  std::string message;
};

// Inbound rule management. Only Windows needs a rule; elsewhere every call
// reports success without touching the system.
class FirewallHelper {
public:
  static bool is_windows();
  static FirewallResult ensure_port_allowed(std::uint16_t port);
  static std::string manual_instructions(std::uint16_t port);
};
