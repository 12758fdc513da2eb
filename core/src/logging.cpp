#include <chrono>
#include <iostream>
#include <railog/logging.hpp>

namespace railog {

  std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
      case LogLevel::Trace:
        return "TRACE";
      case LogLevel::Debug:
        return "DEBUG";
      case LogLevel::Info:
        return "INFO";
      case LogLevel::Warn:
        return "WARN";
      case LogLevel::Error:
        return "ERROR";
      case LogLevel::Critical:
        return "CRITICAL";
    }
    return "UNKNOWN";
  }

  Logger::Logger(std::ostream& sink, LogLevel level) : sink_(&sink), level_(level) {}

  void Logger::set_level(LogLevel level) noexcept {
    std::lock_guard lock(mutex_);
    level_ = level;
  }

  LogLevel Logger::level() const noexcept {
    std::lock_guard lock(mutex_);
    return level_;
  }

  bool Logger::enabled(LogLevel level) const noexcept {
    std::lock_guard lock(mutex_);
    return static_cast<int>(level) >= static_cast<int>(level_);
  }

  void Logger::set_sink(std::ostream& sink) noexcept {
    std::lock_guard lock(mutex_);
    sink_ = &sink;
  }

  void Logger::log(LogLevel level, std::string_view message) {
    std::lock_guard lock(mutex_);
    if (static_cast<int>(level) < static_cast<int>(level_)) return;

    auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    *sink_ << std::format("[{:%Y-%m-%d %H:%M:%S}] [{}] {}\n", now, to_string(level), message);
    sink_->flush();
  }

  Logger& default_logger() {
    static Logger logger(std::cerr);
    return logger;
  }

}  // namespace railog
