#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <vector>

using SignalHandle = std::size_t;

// Typed callback list. Slots are copied out before emission so a slot may
// connect or disconnect without deadlocking.
template<typename... Args>
class Signal {
public:
  using Slot = std::function<void(Args...)>;

  SignalHandle connect(Slot slot) {
    if(!slot) return 0;
    std::lock_guard<std::mutex> lock(mutex_);
    const auto id = next_id_++;
    slots_.emplace(id, std::move(slot));
    return id;
  }

  void disconnect(SignalHandle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    slots_.erase(handle);
  }

  std::size_t slot_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
  }

  void emit(const Args&... args) const {
    std::vector<Slot> snapshot;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      snapshot.reserve(slots_.size());
      for(const auto& entry : slots_) snapshot.push_back(entry.second);
    }
    for(auto& slot : snapshot) {
      slot(args...);
    }
  }

private:
  mutable std::mutex mutex_;
  std::map<SignalHandle, Slot> slots_;
  std::atomic<SignalHandle> next_id_{1};
};
