#include "peer_selector.hpp"

PeerSelector::PeerSelector(ServiceBrowser& browser, Options options, std::shared_ptr<Logger> logger)
  : browser_(browser),
    options_(options),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("selector")) {}

PeerSelector::~PeerSelector() {
  stop();
}

bool PeerSelector::accepts(const ServiceInfo& info) const {
  return options_.wanted_role == PeerRole::Unknown || info.role() == options_.wanted_role;
}

void PeerSelector::start() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(started_ || stopped_) return;
    started_ = true;
  }
  up_handle_ = browser_.service_up.connect([this](const ServiceInfo& info){ on_service_up(info); });
  down_handle_ = browser_.service_down.connect([this](const ServiceInfo& info){ on_service_down(info); });
  for(const auto& info : browser_.discovered_services()) {
    on_service_up(info);
  }
  browser_.start_discovery();
}

void PeerSelector::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_ = true;
  }
  changed_.notify_all();
  if(up_handle_) browser_.service_up.disconnect(up_handle_);
  if(down_handle_) browser_.service_down.disconnect(down_handle_);
  up_handle_ = 0;
  down_handle_ = 0;
}

bool PeerSelector::stopped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stopped_;
}

void PeerSelector::on_service_up(const ServiceInfo& info) {
  if(!accepts(info)) return;
  bool added = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    added = peers_.count(info.key()) == 0;
    peers_[info.key()] = info;
    if(!first_found_) first_found_ = Clock::now();
  }
  changed_.notify_all();
  if(added) {
    logger_->debug("Found {}", info.display_name());
    peer_found.emit(info);
  }
}

void PeerSelector::on_service_down(const ServiceInfo& info) {
  bool removed = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    removed = peers_.erase(info.key()) > 0;
  }
  changed_.notify_all();
  if(removed) {
    logger_->debug("Lost {}", info.display_name());
    peer_lost.emit(info);
  }
}

std::vector<ServiceInfo> PeerSelector::peers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ServiceInfo> out;
  out.reserve(peers_.size());
  for(const auto& entry : peers_) out.push_back(entry.second);
  return out;
}

bool PeerSelector::wait_for_peer(std::unique_lock<std::mutex>& lock) {
  changed_.wait(lock, [this]{ return stopped_ || !peers_.empty(); });
  return !stopped_;
}

bool PeerSelector::wait_for_menu() {
  std::unique_lock<std::mutex> lock(mutex_);
  while(true) {
    if(!wait_for_peer(lock)) return false;
    const auto show_at = *first_found_ + options_.menu_delay;
    changed_.wait_until(lock, show_at, [this]{ return stopped_; });
    if(stopped_) return false;
    if(!peers_.empty()) return true;
  }
}

bool PeerSelector::search_again() {
  browser_.start_discovery();
  std::unique_lock<std::mutex> lock(mutex_);
  if(stopped_) return false;
  if(peers_.empty()) {
    logger_->debug("Searching until a peer appears");
    return wait_for_peer(lock);
  }
  logger_->debug("Searching for {} ms", options_.research_window.count());
  const auto until = Clock::now() + options_.research_window;
  changed_.wait_until(lock, until, [this]{ return stopped_; });
  return !stopped_;
}

std::optional<ServiceInfo> PeerSelector::run(SelectionPrompt& prompt) {
  if(!wait_for_menu()) return std::nullopt;
  while(true) {
    auto list = peers();
    if(list.empty()) {
      std::unique_lock<std::mutex> lock(mutex_);
      if(!wait_for_peer(lock)) return std::nullopt;
      continue;
    }
    auto choice = prompt.choose(list);
    if(stopped()) return std::nullopt;
    switch(choice.action) {
      case SelectionPrompt::Action::Select:
        if(choice.index < list.size()) return list[choice.index];
        logger_->warn("Selection {} is out of range", choice.index + 1);
        break;
      case SelectionPrompt::Action::SearchAgain:
        if(!search_again()) return std::nullopt;
        break;
      case SelectionPrompt::Action::Cancel:
        return std::nullopt;
    }
  }
}
