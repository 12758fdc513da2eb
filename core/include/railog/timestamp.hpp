#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace railog {

  using Clock = std::chrono::system_clock;
  using TimePoint = Clock::time_point;

  // Parses a syslog-style prefix ("Oct 17 08:15:02 host ...") as local time in
  // the year of `now`. Returns empty for any other layout.
  [[nodiscard]] std::optional<TimePoint> parse_syslog_timestamp(std::string_view line,
                                                                TimePoint now);

  // Lenient variant used by ingestion: unparseable lines are treated as `now`
  [[nodiscard]] TimePoint record_timestamp(std::string_view line, TimePoint now);

  struct LogRecord {
    std::string raw;
    TimePoint timestamp;
    std::string canonical;
  };

}  // namespace railog
