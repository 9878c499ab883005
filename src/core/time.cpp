#include "scru128/core/time.h"

#include <iomanip>
#include <sstream>

namespace scru128::core {

std::string format_iso8601_millis(std::uint64_t unix_millis) {
  using namespace std::chrono;

  const sys_time<milliseconds> tp{milliseconds{static_cast<std::int64_t>(unix_millis)}};
  const auto midnight = floor<days>(tp);
  const year_month_day ymd{midnight};
  const hh_mm_ss<milliseconds> hms{tp - midnight};

  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << '-' << std::setw(2)
      << static_cast<unsigned>(ymd.month()) << '-' << std::setw(2)
      << static_cast<unsigned>(ymd.day()) << 'T' << std::setw(2) << hms.hours().count() << ':'
      << std::setw(2) << hms.minutes().count() << ':' << std::setw(2) << hms.seconds().count()
      << '.' << std::setw(3) << hms.subseconds().count() << 'Z';
  return oss.str();
}

}  // namespace scru128::core
