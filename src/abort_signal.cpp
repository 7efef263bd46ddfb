#include "abort_signal.hpp"

#include <vector>

void AbortSignal::abort() {
  std::vector<std::function<void()>> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(aborted_) return;
    aborted_ = true;
    for(auto& entry : callbacks_) pending.push_back(std::move(entry.second));
    callbacks_.clear();
  }
  for(auto& callback : pending) callback();
}

bool AbortSignal::aborted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return aborted_;
}

SignalHandle AbortSignal::subscribe(std::function<void()> callback) {
  if(!callback) return 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(!aborted_) {
      auto id = next_id_++;
      callbacks_.emplace(id, std::move(callback));
      return id;
    }
  }
  callback();
  return 0;
}

void AbortSignal::unsubscribe(SignalHandle handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.erase(handle);
}
