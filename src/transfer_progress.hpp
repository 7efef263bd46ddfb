#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "types.hpp"

// Turns byte counts into TransferProgress snapshots. Speed only counts
// bytes moved since the tracker was created, so a resumed transfer does
// not report the bytes it already had.
class ProgressTracker {
public:
  using Clock = std::chrono::steady_clock;

  ProgressTracker(std::string file_id,
                  std::string file_name,
                  std::uint64_t total,
                  std::uint64_t start_byte = 0);

  TransferProgress update(std::uint64_t transferred);
  TransferProgress update(std::uint64_t transferred, Clock::time_point now) const;

  void set_total(std::uint64_t total) { total_ = total; }
  std::uint64_t total() const { return total_; }
  std::uint64_t start_byte() const { return start_byte_; }
  std::uint64_t transferred() const { return transferred_; }

private:
  std::string file_id_;
  std::string file_name_;
  std::uint64_t total_;
  std::uint64_t start_byte_;
  std::uint64_t transferred_;
  Clock::time_point started_;
};
