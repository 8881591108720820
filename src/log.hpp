#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>

// Sets up the process-wide console sinks; debug output only when verbose.
void init(bool verbose = false);

// Tests switch this off so node chatter only reaches their listeners.
void set_log_passthrough(bool enabled);
bool log_passthrough();

using LogListenerHandle = std::size_t;

// Named log channel. Messages are offered to the attached listeners first; if
// none of them consumes the message it goes to the shared spdlog sinks.
class Logger {
public:
  using Level = spdlog::level::level_enum;
  using Listener = std::function<bool(void* user_data,
                                      const std::string& channel,
                                      Level level,
                                      const std::string& message)>;

  Logger() = default;
  explicit Logger(std::string name) : name_(std::move(name)) {}

  void set_name(std::string name);
  std::string name() const;

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);
  void clear_listeners();

  void write(Level level, const std::string& message);

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(spdlog::level::debug, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(spdlog::level::info, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(spdlog::level::warn, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(spdlog::level::err, fmt::format(fmt, std::forward<Args>(args)...));
  }

private:
  struct Subscription {
    void* user_data = nullptr;
    Listener callback;
  };

  bool offer(const std::string& channel, Level level, const std::string& message);

  mutable std::mutex m_;
  std::string name_;
  std::map<LogListenerHandle, Subscription> listeners_;
  LogListenerHandle next_handle_ = 1;
};

// Writes to the shared sinks directly, bypassing any Logger.
void log_to_console(const std::string& channel, Logger::Level level, const std::string& message);
void print_line(bool to_stderr, const std::string& message);

// Components hold an optional Logger; a null one falls back to the console.
template<typename... Args>
inline void log_at(Logger* logger, Logger::Level level, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  auto message = fmt::format(fmt, std::forward<Args>(args)...);
  if(logger) {
    logger->write(level, message);
  } else {
    log_to_console("", level, message);
  }
}

template<typename... Args>
inline void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_at(logger, spdlog::level::debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_at(logger, spdlog::level::info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_at(logger, spdlog::level::warn, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_at(logger, spdlog::level::err, fmt, std::forward<Args>(args)...);
}

// Unadorned console output (usage text, settings errors).
template<typename... Args>
inline void print_out(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  print_line(false, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  print_line(true, fmt::format(fmt, std::forward<Args>(args)...));
}
