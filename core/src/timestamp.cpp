#include <ctime>
#include <iomanip>
#include <locale>
#include <railog/timestamp.hpp>
#include <sstream>
#include <string>

namespace railog {

  namespace {

    // First `n` whitespace-separated fields, joined by single spaces
    std::string leading_fields(std::string_view line, int n) {
      std::string out;
      size_t pos = 0;
      for (int field = 0; field < n; ++field) {
        pos = line.find_first_not_of(" \t", pos);
        if (pos == std::string_view::npos) break;
        size_t end = line.find_first_of(" \t", pos);
        if (end == std::string_view::npos) end = line.size();
        if (!out.empty()) out += ' ';
        out.append(line.substr(pos, end - pos));
        pos = end;
      }
      return out;
    }

    int local_year(TimePoint now) {
      std::time_t t = Clock::to_time_t(now);
      std::tm local{};
      localtime_r(&t, &local);
      return local.tm_year + 1900;
    }

  }  // namespace

  std::optional<TimePoint> parse_syslog_timestamp(std::string_view line, TimePoint now) {
    std::string stamp = leading_fields(line, 3);
    if (stamp.empty()) return std::nullopt;
    stamp += ' ';
    stamp += std::to_string(local_year(now));

    std::tm tm{};
    std::istringstream in(stamp);
    in.imbue(std::locale::classic());
    in >> std::get_time(&tm, "%b %d %H:%M:%S %Y");
    if (in.fail()) return std::nullopt;
    // Reject trailing garbage ("08:15:02x")
    if (in.peek() != std::char_traits<char>::eof()) return std::nullopt;

    const int mday = tm.tm_mday;
    const int mon = tm.tm_mon;
    tm.tm_isdst = -1;
    std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    // mktime silently normalizes impossible dates (Feb 30 -> Mar 2)
    if (tm.tm_mday != mday || tm.tm_mon != mon) return std::nullopt;

    return Clock::from_time_t(t);
  }

  TimePoint record_timestamp(std::string_view line, TimePoint now) {
    return parse_syslog_timestamp(line, now).value_or(now);
  }

}  // namespace railog
