#include "io/TimeUtil.hpp"
#include "models/Errors.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>

int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

double parse_iso8601(const std::string &text) {
  int y = 0, mo = 0, d = 0, h = 0, mi = 0;
  double s = 0.0;
  int consumed = 0;
  if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%lf%n", &y, &mo, &d, &h,
                  &mi, &s, &consumed) < 6 ||
      mo < 1 || mo > 12 || d < 1 || d > 31 || h > 23 || mi > 59 || s < 0 ||
      s >= 61)
    throw DecodeError("malformed timestamp '" + text + "'");

  double offset_s = 0.0;
  const char *zone = text.c_str() + consumed;
  if (*zone == '+' || *zone == '-') {
    int zh = 0, zm = 0;
    if (std::sscanf(zone + 1, "%2d:%2d", &zh, &zm) != 2 &&
        std::sscanf(zone + 1, "%2d%2d", &zh, &zm) != 2)
      throw DecodeError("malformed zone in timestamp '" + text + "'");
    offset_s = (zh * 3600.0 + zm * 60.0) * (*zone == '-' ? -1 : 1);
  } else if (*zone != '\0' && *zone != 'Z') {
    throw DecodeError("malformed timestamp '" + text + "'");
  }

  const double days = static_cast<double>(days_from_civil(y, mo, d));
  return days * 86400.0 + h * 3600.0 + mi * 60.0 + s - offset_s;
}

std::string format_iso8601(double unix_seconds) {
  int64_t t = static_cast<int64_t>(std::floor(unix_seconds));
  int64_t z = (t >= 0 ? t : t - 86399) / 86400;
  int64_t secs = t - z * 86400;
  // civil_from_days
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  int64_t y = static_cast<int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  y += m <= 2;

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02dZ",
                static_cast<long long>(y), m, d, static_cast<int>(secs / 3600),
                static_cast<int>((secs % 3600) / 60),
                static_cast<int>(secs % 60));
  return buf;
}
