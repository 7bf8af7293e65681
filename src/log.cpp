#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <mutex>
#include <vector>

namespace {
std::shared_ptr<spdlog::logger> g_build_logger;
std::shared_ptr<spdlog::logger> g_error_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::mutex g_create_mutex;
std::atomic<bool> g_log_passthrough{true};
std::atomic<bool> g_log_verbose{false};

constexpr const char* kTimestampPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

void create_loggers() {
  std::lock_guard lg(g_create_mutex);
  if(g_build_logger) return;

  auto build_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  build_sink->set_pattern(kTimestampPattern);

  auto error_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  error_sink->set_pattern(kTimestampPattern);

  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");

  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  g_build_logger = std::make_shared<spdlog::logger>("packgen.build", std::move(build_sink));
  g_error_logger = std::make_shared<spdlog::logger>("packgen.error", std::move(error_sink));
  g_print_logger = std::make_shared<spdlog::logger>("packgen.print", std::move(plain_out_sink));
  g_print_err_logger = std::make_shared<spdlog::logger>("packgen.print_err", std::move(plain_err_sink));

  g_build_logger->flush_on(spdlog::level::warn);
  g_error_logger->flush_on(spdlog::level::err);
  g_print_logger->flush_on(spdlog::level::info);
  g_print_err_logger->flush_on(spdlog::level::err);
}

spdlog::logger& sink_for(LogSink sink, spdlog::level::level_enum level) {
  switch(sink) {
    case LogSink::print: return *g_print_logger;
    case LogSink::print_err: return *g_print_err_logger;
    case LogSink::build: break;
  }
  return level >= spdlog::level::err ? *g_error_logger : *g_build_logger;
}

void write_line(LogSink sink,
                const std::string& channel,
                spdlog::level::level_enum level,
                const std::string& message) {
  create_loggers();
  if(!g_log_passthrough.load(std::memory_order_acquire)) return;
  auto& target = sink_for(sink, level);
  if(channel.empty()) {
    target.log(level, message);
  } else {
    target.log(level, fmt::format("[{}] {}", channel, message));
  }
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_verbose() {
  return g_log_verbose.load(std::memory_order_acquire);
}

void init(bool verbose) {
  create_loggers();
  g_log_verbose.store(verbose, std::memory_order_release);

  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_build_logger->set_level(level);
  g_error_logger->set_level(spdlog::level::info);
  g_print_logger->set_level(spdlog::level::info);
  g_print_err_logger->set_level(spdlog::level::info);
}

void emit_unnamed(LogSink sink, spdlog::level::level_enum level, const std::string& message) {
  write_line(sink, std::string(), level, message);
}

Logger::Logger(std::string name) : name_(std::move(name)) {}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard lg(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  listener_count_.store(listeners_.size(), std::memory_order_release);
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard lg(listener_mutex_);
  listeners_.erase(handle);
  listener_count_.store(listeners_.size(), std::memory_order_release);
}

bool Logger::dispatch(spdlog::level::level_enum level, const std::string& message) {
  if(listener_count_.load(std::memory_order_acquire) == 0) return false;
  std::vector<Listener> snapshot;
  {
    std::lock_guard lg(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& listener : snapshot) {
    try {
      if(listener(name_, level, message)) handled = true;
    } catch(const std::exception& e) {
      write_line(LogSink::build, name_, spdlog::level::err,
                 fmt::format("log listener failed: {}", e.what()));
    }
  }
  return handled;
}

void Logger::emit(LogSink sink, spdlog::level::level_enum level, const std::string& message) const {
  write_line(sink, name_, level, message);
}
