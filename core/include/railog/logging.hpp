#pragma once
#include <format>
#include <iosfwd>
#include <mutex>
#include <string_view>
#include <utility>

namespace railog {

  enum class LogLevel { Trace = 0, Debug, Info, Warn, Error, Critical };

  [[nodiscard]] std::string_view to_string(LogLevel level) noexcept;

  /**
   * Leveled, timestamped logger.
   *
   * Diagnostics go here (stderr by default); the tool's own progress and
   * summary output is written to stdout by the commands.
   */
  class Logger {
  public:
    explicit Logger(std::ostream& sink, LogLevel level = LogLevel::Info);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;
    [[nodiscard]] bool enabled(LogLevel level) const noexcept;

    // Redirect output; the stream must outlive its use by the logger
    void set_sink(std::ostream& sink) noexcept;

    void log(LogLevel level, std::string_view message);

  private:
    mutable std::mutex mutex_;
    std::ostream* sink_;
    LogLevel level_;
  };

  // Process-wide logger writing to stderr, configured once by the CLI
  Logger& default_logger();

  template <typename... Args>
  void log_at(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
    auto& logger = default_logger();
    if (!logger.enabled(level)) return;
    logger.log(level, std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args> void log_debug(std::format_string<Args...> fmt, Args&&... args) {
    log_at(LogLevel::Debug, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args> void log_info(std::format_string<Args...> fmt, Args&&... args) {
    log_at(LogLevel::Info, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args> void log_warn(std::format_string<Args...> fmt, Args&&... args) {
    log_at(LogLevel::Warn, fmt, std::forward<Args>(args)...);
  }

}  // namespace railog
