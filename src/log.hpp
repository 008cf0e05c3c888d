#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace dotsync {

enum class LogFormat { Human, Text, Json };

// Configures the process-wide sinks. Safe to call more than once; the last
// call wins for level and format.
void init_logging(const std::string& level = "info", const std::string& format = "human");

spdlog::level::level_enum parse_log_level(const std::string& level);
LogFormat parse_log_format(const std::string& format);

// When off, records only reach listeners.
void set_log_passthrough(bool enabled);
bool log_passthrough();

struct LogRecord {
  std::string channel;
  spdlog::level::level_enum level;
  std::string message;
};

using LogListenerHandle = std::size_t;

// Named diagnostics channel handed to every component. Listeners see every
// record regardless of the sink level; a listener returning true keeps the
// record away from the default sinks.
class Logger {
public:
  using Listener = std::function<bool(const LogRecord&)>;

  explicit Logger(std::string name = "") : name_(std::move(name)) {}

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  const std::string& name() const { return name_; }

  LogListenerHandle add_listener(Listener listener);
  void remove_listener(LogListenerHandle handle);

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
  void write(spdlog::level::level_enum level, std::string message);
  bool notify(const LogRecord& record);

  struct Binding {
    LogListenerHandle handle = 0;
    Listener callback;
  };

  std::string name_;
  std::mutex listener_mutex_;
  std::vector<Binding> listeners_;
  LogListenerHandle next_handle_ = 1;
};

namespace detail {
void emit_record(const LogRecord& record);
void emit_plain(bool to_stderr, const std::string& message);
} // namespace detail

// Unformatted console output for usage text and similar user-facing output.
template<typename... Args>
inline void print_out(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::emit_plain(false, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::emit_plain(true, fmt::format(fmt, std::forward<Args>(args)...));
}

} // namespace dotsync
