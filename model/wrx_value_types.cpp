#include "wrx_value_types.h"
#include <cmath>
#include <sstream>

namespace {

  const double MINUTE = 60.0;
  const double HOUR = 60.0 * MINUTE;
  const double DAY = 24.0 * HOUR;

  // 2.0 prints as "2", 1.5 as "1.5"
  wrx_string format_number(double v)
  {
    std::ostringstream out;
    if (std::floor(v) == v && std::fabs(v) < 1e15) {
      out << static_cast<long long>(v);
    } else {
      out << v;
    }
    return out.str();
  }

}

double wrx_duration::as_secs() const
{
  switch (unit) {
    case wrx_duration_unit::seconds: return factor;
    case wrx_duration_unit::minutes: return factor * MINUTE;
    case wrx_duration_unit::hours: return factor * HOUR;
    case wrx_duration_unit::days: return factor * DAY;
    case wrx_duration_unit::weeks: return factor * 7.0 * DAY;
    case wrx_duration_unit::months: return factor * 30.0 * DAY;
    case wrx_duration_unit::years: return factor * 365.0 * DAY;
  }
  return factor;
}

bool wrx_duration::from_code(const wrx_string& code, double factor, wrx_duration& out)
{
  wrx_duration_unit unit;
  if (code == "s") unit = wrx_duration_unit::seconds;
  else if (code == "m" || code == "min") unit = wrx_duration_unit::minutes;
  else if (code == "h") unit = wrx_duration_unit::hours;
  else if (code == "d") unit = wrx_duration_unit::days;
  else if (code == "w" || code == "wo") unit = wrx_duration_unit::weeks;
  else if (code == "M" || code == "mo") unit = wrx_duration_unit::months;
  else if (code == "a" || code == "y") unit = wrx_duration_unit::years;
  else return false;

  out = wrx_duration(unit, factor);
  return true;
}

wrx_string wrx_duration::to_string() const
{
  bool one = std::fabs(factor - 1.0) < 1e-9;
  wrx_string prefix = one ? wrx_string() : format_number(factor);

  switch (unit) {
    case wrx_duration_unit::seconds: return prefix + "s";
    case wrx_duration_unit::minutes: return prefix + "m";
    case wrx_duration_unit::hours: return prefix + "h";
    case wrx_duration_unit::days: return prefix + "d";
    case wrx_duration_unit::weeks: return one ? wrx_string("w") : prefix + "wo";
    case wrx_duration_unit::months: return prefix + "mo";
    case wrx_duration_unit::years: return prefix + "a";
  }
  return prefix;
}

wrx_string wrx_quantity::to_string() const
{
  return format_number(value) + " " + unit;
}
