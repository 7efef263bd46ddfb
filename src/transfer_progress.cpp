#include "transfer_progress.hpp"

#include <limits>

ProgressTracker::ProgressTracker(std::string file_id,
                                 std::string file_name,
                                 std::uint64_t total,
                                 std::uint64_t start_byte)
  : file_id_(std::move(file_id)),
    file_name_(std::move(file_name)),
    total_(total),
    start_byte_(start_byte),
    transferred_(start_byte),
    started_(Clock::now()) {}

TransferProgress ProgressTracker::update(std::uint64_t transferred) {
  transferred_ = transferred;
  return update(transferred, Clock::now());
}

TransferProgress ProgressTracker::update(std::uint64_t transferred, Clock::time_point now) const {
  TransferProgress out;
  out.file_id = file_id_;
  out.file_name = file_name_;
  out.transferred = transferred;
  out.total = total_;
  out.percentage = total_ > 0
    ? static_cast<double>(transferred) / static_cast<double>(total_) * 100.0
    : 100.0;

  const double elapsed_ms = std::chrono::duration<double, std::milli>(now - started_).count();
  const double moved = transferred > start_byte_ ? static_cast<double>(transferred - start_byte_) : 0.0;
  out.speed = elapsed_ms > 0 ? moved / elapsed_ms * 1000.0 : 0.0;

  const double remaining = total_ > transferred ? static_cast<double>(total_ - transferred) : 0.0;
  if(out.speed > 0) {
    out.eta = remaining / out.speed;
  } else {
    out.eta = remaining > 0 ? std::numeric_limits<double>::infinity() : 0.0;
  }
  return out;
}
