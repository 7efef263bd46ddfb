#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstring>
#include <vector>

namespace {
std::shared_ptr<spdlog::logger> g_info_logger;
std::shared_ptr<spdlog::logger> g_error_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::once_flag g_create_once;
std::atomic<bool> g_log_passthrough{true};

void create_loggers() {
  auto info_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  info_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto error_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  error_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");

  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  g_info_logger = std::make_shared<spdlog::logger>("howl.info", std::move(info_sink));
  g_error_logger = std::make_shared<spdlog::logger>("howl.error", std::move(error_sink));
  g_print_logger = std::make_shared<spdlog::logger>("howl.print", std::move(plain_out_sink));
  g_print_err_logger = std::make_shared<spdlog::logger>("howl.print_err", std::move(plain_err_sink));

  g_info_logger->set_level(spdlog::level::info);
  g_info_logger->flush_on(spdlog::level::warn);
  g_error_logger->flush_on(spdlog::level::err);
  g_print_logger->flush_on(spdlog::level::info);
  g_print_err_logger->flush_on(spdlog::level::err);
}

void ensure_loggers() {
  std::call_once(g_create_once, create_loggers);
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

void init_logging(bool verbose) {
  ensure_loggers();
  g_info_logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

Logger::Logger()
  : table_(std::make_shared<ListenerTable>()) {}

Logger::Logger(std::string name, bool debug_enabled)
  : name_(std::move(name)),
    debug_enabled_(debug_enabled),
    table_(std::make_shared<ListenerTable>()) {}

Logger::Logger(std::string name, bool debug_enabled, std::shared_ptr<ListenerTable> parent)
  : name_(std::move(name)),
    debug_enabled_(debug_enabled),
    table_(std::make_shared<ListenerTable>()),
    parent_table_(std::move(parent)) {}

std::shared_ptr<Logger> Logger::child(const std::string& name) const {
  return std::shared_ptr<Logger>(new Logger(name, debug_enabled(), table_));
}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(table_->mutex);
  const auto id = table_->next_id++;
  table_->listeners.emplace(id, std::move(listener));
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(table_->mutex);
  table_->listeners.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(table_->mutex);
  table_->listeners.clear();
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<Listener> snapshot;
  for(const auto& table : {table_, parent_table_}) {
    if(!table) continue;
    std::lock_guard<std::mutex> lock(table->mutex);
    for(const auto& entry : table->listeners) {
      snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& listener : snapshot) {
    try {
      if(listener(channel, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit_to_default("error", "log", spdlog::level::err,
                              fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}

void Logger::fallback(const char* base_channel,
                      const std::string& channel_name,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  detail::emit_to_default(base_channel, channel_name, level, message);
}

namespace detail {

void emit_to_default(const char* base_channel,
                     const std::string& channel_name,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  ensure_loggers();
  if(!log_passthrough()) return;

  spdlog::logger* sink = nullptr;
  if(std::strcmp(base_channel, "print") == 0) {
    sink = g_print_logger.get();
  } else if(std::strcmp(base_channel, "print_err") == 0) {
    sink = g_print_err_logger.get();
  } else if(std::strcmp(base_channel, "error") == 0) {
    sink = g_error_logger.get();
  } else {
    sink = g_info_logger.get();
  }

  if(!sink) return;
  if(std::strcmp(base_channel, "print") == 0 || std::strcmp(base_channel, "print_err") == 0) {
    sink->log(level, message);
  } else if(!channel_name.empty() && channel_name != base_channel) {
    sink->log(level, fmt::format("[{}] {}", channel_name, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
