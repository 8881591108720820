#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <memory>
#include <vector>

namespace {

// Timestamped channels for node logs, bare ones for console text.
struct ConsoleSinks {
  std::shared_ptr<spdlog::logger> log_out;
  std::shared_ptr<spdlog::logger> log_err;
  std::shared_ptr<spdlog::logger> text_out;
  std::shared_ptr<spdlog::logger> text_err;
};

template<typename Sink>
std::shared_ptr<spdlog::logger> make_console(const std::string& name, const std::string& pattern, spdlog::level::level_enum flush_level) {
  auto sink = std::make_shared<Sink>();
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(flush_level);
  return logger;
}

ConsoleSinks& sinks() {
  static ConsoleSinks instance = []{
    const std::string stamped = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
    ConsoleSinks s;
    s.log_out = make_console<spdlog::sinks::stdout_color_sink_mt>("lansync", stamped, spdlog::level::warn);
    s.log_err = make_console<spdlog::sinks::stderr_color_sink_mt>("lansync.err", stamped, spdlog::level::err);
    s.text_out = make_console<spdlog::sinks::stdout_color_sink_mt>("lansync.text", "%v", spdlog::level::info);
    s.text_err = make_console<spdlog::sinks::stderr_color_sink_mt>("lansync.text_err", "%v", spdlog::level::info);
    return s;
  }();
  return instance;
}

std::atomic<bool> g_passthrough{true};

} // namespace

void init(bool verbose) {
  auto& s = sinks();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  s.log_out->set_level(level);
  s.log_err->set_level(spdlog::level::info);
  spdlog::set_default_logger(s.log_out);
  spdlog::set_level(level);
}

void set_log_passthrough(bool enabled) {
  g_passthrough = enabled;
}

bool log_passthrough() {
  return g_passthrough;
}

void log_to_console(const std::string& channel, Logger::Level level, const std::string& message) {
  if(!log_passthrough()) return;
  auto& s = sinks();
  auto& target = level >= spdlog::level::err ? s.log_err : s.log_out;
  if(channel.empty()) {
    target->log(level, message);
  } else {
    target->log(level, "[{}] {}", channel, message);
  }
}

void print_line(bool to_stderr, const std::string& message) {
  auto& s = sinks();
  (to_stderr ? s.text_err : s.text_out)->info(message);
}

void Logger::set_name(std::string name) {
  std::lock_guard lg(m_);
  name_ = std::move(name);
}

std::string Logger::name() const {
  std::lock_guard lg(m_);
  return name_;
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard lg(m_);
  auto handle = next_handle_++;
  listeners_[handle] = Subscription{user_data, std::move(listener)};
  return handle;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard lg(m_);
  listeners_.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard lg(m_);
  listeners_.clear();
}

void Logger::write(Level level, const std::string& message) {
  auto channel = name();
  if(!offer(channel, level, message)) {
    log_to_console(channel, level, message);
  }
}

// Listeners run outside the lock so they may log or detach themselves.
bool Logger::offer(const std::string& channel, Level level, const std::string& message) {
  std::vector<Subscription> current;
  {
    std::lock_guard lg(m_);
    current.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      current.push_back(entry.second);
    }
  }
  bool consumed = false;
  for(const auto& subscription : current) {
    try {
      consumed = subscription.callback(subscription.user_data, channel, level, message) || consumed;
    } catch(const std::exception& e) {
      log_to_console(channel, spdlog::level::warn, fmt::format("log listener threw: {}", e.what()));
    }
  }
  return consumed;
}
