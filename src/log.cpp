#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <memory>

namespace dotsync {

namespace {

struct Sinks {
  std::shared_ptr<spdlog::logger> diag;
  std::shared_ptr<spdlog::logger> out;
  std::shared_ptr<spdlog::logger> err;
};

std::mutex g_sinks_mutex;
Sinks g_sinks;
std::atomic<bool> g_passthrough{true};
std::atomic<LogFormat> g_format{LogFormat::Human};

const char* pattern_for(LogFormat format) {
  switch(format) {
    case LogFormat::Text: return "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
    case LogFormat::Json: return "%v";
    case LogFormat::Human: break;
  }
  return "%^%l%$ %v";
}

std::shared_ptr<spdlog::logger> plain_logger(const char* name, spdlog::sink_ptr sink) {
  sink->set_pattern("%v");
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(spdlog::level::info);
  return logger;
}

// Caller holds g_sinks_mutex.
Sinks& sinks_locked() {
  if(!g_sinks.diag) {
    // Diagnostics always go to stderr so stdout stays clean for usage output.
    auto diag_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    diag_sink->set_pattern(pattern_for(LogFormat::Human));
    g_sinks.diag = std::make_shared<spdlog::logger>("dotsync", std::move(diag_sink));
    g_sinks.diag->set_level(spdlog::level::info);
    g_sinks.diag->flush_on(spdlog::level::warn);

    g_sinks.out = plain_logger("dotsync.out", std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    g_sinks.err = plain_logger("dotsync.err", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  return g_sinks;
}

Sinks sinks() {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  return sinks_locked();
}

std::string iso_timestamp() {
  auto now = std::chrono::system_clock::now();
  auto secs = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
    now.time_since_epoch()).count() % 1000;
  std::tm tm_buf{};
  localtime_r(&secs, &tm_buf);
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm_buf);
  return fmt::format("{}.{:03d}", buffer, static_cast<int>(ms));
}

std::string lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

} // namespace

spdlog::level::level_enum parse_log_level(const std::string& level) {
  auto v = lower(level);
  if(v == "debug") return spdlog::level::debug;
  if(v == "warn" || v == "warning") return spdlog::level::warn;
  if(v == "error") return spdlog::level::err;
  return spdlog::level::info;
}

LogFormat parse_log_format(const std::string& format) {
  auto v = lower(format);
  if(v == "json") return LogFormat::Json;
  if(v == "text") return LogFormat::Text;
  return LogFormat::Human;
}

void init_logging(const std::string& level, const std::string& format) {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  auto& s = sinks_locked();
  auto parsed_format = parse_log_format(format);
  g_format.store(parsed_format, std::memory_order_release);
  s.diag->set_pattern(pattern_for(parsed_format));
  s.diag->set_level(parse_log_level(level));
}

void set_log_passthrough(bool enabled) {
  g_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_passthrough.load(std::memory_order_acquire);
}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto handle = next_handle_++;
  listeners_.push_back({handle, std::move(listener)});
  return handle;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                  [&](const Binding& b){ return b.handle == handle; }),
                   listeners_.end());
}

void Logger::write(spdlog::level::level_enum level, std::string message) {
  LogRecord record{name_, level, std::move(message)};
  if(notify(record)) return;
  detail::emit_record(record);
}

bool Logger::notify(const LogRecord& record) {
  std::vector<Binding> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    snapshot = listeners_;
  }
  bool consumed = false;
  for(const auto& binding : snapshot) {
    try {
      consumed = binding.callback(record) || consumed;
    } catch(const std::exception& e) {
      detail::emit_record({record.channel, spdlog::level::err,
                           fmt::format("log listener failed: {}", e.what())});
    }
  }
  return consumed;
}

namespace detail {

void emit_record(const LogRecord& record) {
  if(!log_passthrough()) return;
  auto diag = sinks().diag;
  if(!diag->should_log(record.level)) return;

  if(g_format.load(std::memory_order_acquire) != LogFormat::Json) {
    diag->log(record.level, record.message);
    return;
  }
  nlohmann::json line;
  line["time"] = iso_timestamp();
  line["level"] = std::string(spdlog::level::to_string_view(record.level).data(),
                              spdlog::level::to_string_view(record.level).size());
  if(!record.channel.empty()) line["logger"] = record.channel;
  line["msg"] = record.message;
  diag->log(record.level, line.dump());
}

void emit_plain(bool to_stderr, const std::string& message) {
  auto s = sinks();
  (to_stderr ? s.err : s.out)->info(message);
}

} // namespace detail

} // namespace dotsync
