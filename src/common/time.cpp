#include "devchain/common/time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace devchain::common {

std::string format_rfc3339(const Timestamp timestamp) {
  const auto t = Clock::to_time_t(timestamp);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

std::optional<Timestamp> parse_rfc3339(const std::string &value) {
  std::tm tm{};
  std::istringstream in(value);
  in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (in.fail()) {
    return std::nullopt;
  }

#ifdef _WIN32
  const std::time_t parsed = _mkgmtime(&tm);
#else
  const std::time_t parsed = timegm(&tm);
#endif
  if (parsed == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  return Clock::from_time_t(parsed);
}

std::int64_t age_in_days(const Timestamp then, const Timestamp now) {
  if (now <= then) {
    return 0;
  }
  return std::chrono::duration_cast<std::chrono::hours>(now - then).count() / 24;
}

} // namespace devchain::common
