#pragma once

#include <functional>
#include <map>
#include <mutex>

#include "signal.hpp"

// Cancellation flag shared between a caller and an in-flight transfer.
class AbortSignal {
public:
  void abort();
  bool aborted() const;

  // Runs immediately (and returns 0) when already aborted.
  SignalHandle subscribe(std::function<void()> callback);
  void unsubscribe(SignalHandle handle);

private:
  mutable std::mutex mutex_;
  bool aborted_ = false;
  SignalHandle next_id_ = 1;
  std::map<SignalHandle, std::function<void()>> callbacks_;
};
