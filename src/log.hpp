#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

// Sets up the process-wide sinks. Safe to call more than once; the last call
// decides whether per-resource progress lines are emitted.
void init(bool verbose = false);
// Test runners turn this off to keep the console quiet; listeners still fire.
void set_log_passthrough(bool enabled);
bool log_verbose();

enum class LogSink { build, print, print_err };

using LogListenerHandle = std::size_t;

class Logger {
public:
  using Listener = std::function<bool(const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  explicit Logger(std::string name);

  // A listener returning true swallows the line instead of the console.
  LogListenerHandle add_listener(Listener listener);
  void remove_listener(LogListenerHandle handle);

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogSink::build, spdlog::level::info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogSink::build, spdlog::level::warn, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogSink::build, spdlog::level::err, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    if(!wants_debug()) return;
    log(LogSink::build, spdlog::level::debug, fmt, std::forward<Args>(args)...);
  }

  // One line per resource touched by a build, e.g. "generated: a.txt (3/10)".
  void progress(const char* action, const std::string& path,
                std::size_t index, std::size_t goal) {
    if(!wants_debug()) return;
    log(LogSink::build, spdlog::level::debug, "{}: {} ({}/{})", action, path, index, goal);
  }

  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogSink::print, spdlog::level::info, fmt, std::forward<Args>(args)...);
  }

private:
  // Builds emit a line per file, so skip formatting when nobody would see it.
  bool wants_debug() const {
    return log_verbose() || listener_count_.load(std::memory_order_acquire) > 0;
  }

  template<typename... Args>
  void log(LogSink sink,
           spdlog::level::level_enum level,
           spdlog::format_string_t<Args...> fmt,
           Args&&... args) {
    auto formatted = fmt::format(fmt, std::forward<Args>(args)...);
    if(dispatch(level, formatted)) return;
    if(level == spdlog::level::debug && !log_verbose()) return;
    emit(sink, level, formatted);
  }

  bool dispatch(spdlog::level::level_enum level, const std::string& message);
  void emit(LogSink sink, spdlog::level::level_enum level, const std::string& message) const;

  std::string name_;
  std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, Listener> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
  std::atomic<std::size_t> listener_count_{0};
};

void emit_unnamed(LogSink sink, spdlog::level::level_enum level, const std::string& message);

// Console helpers for code that runs before any strategy logger exists.
template<typename... Args>
inline void log_warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  emit_unnamed(LogSink::build, spdlog::level::warn, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void print_out(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  emit_unnamed(LogSink::print, spdlog::level::info, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  emit_unnamed(LogSink::print_err, spdlog::level::err, fmt::format(fmt, std::forward<Args>(args)...));
}
