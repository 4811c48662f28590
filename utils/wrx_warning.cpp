#include "wrx_warning.h"
#include <algorithm>

const char* to_string(wrx_warning_kind kind)
{
  switch (kind) {
    case wrx_warning_kind::unexpected_text_state: return "unexpectedTextState";
    case wrx_warning_kind::value_without_label: return "valueWithoutLabel";
    case wrx_warning_kind::invalid_date_format: return "invalidDateFormat";
    case wrx_warning_kind::could_not_find_usage_location: return "couldNotFindUsageLocation";
    case wrx_warning_kind::missing_locations: return "missingLocations";
  }
  return "unknown";
}

void wrx_warnings::add(wrx_warning_kind kind, const wrx_string& message)
{
  wrx_warning warning;
  warning.kind = kind;
  warning.water_right_no = no;
  warning.message = message;
  items.push_back(std::move(warning));
}

void wrx_warnings::add_missing_locations(const std::vector<uint64_t>& usage_location_nos)
{
  std::vector<wrx_string> nos;
  for (uint64_t n : usage_location_nos) {
    nos.push_back(std::to_string(n));
  }

  wrx_warning warning;
  warning.kind = wrx_warning_kind::missing_locations;
  warning.water_right_no = no;
  warning.message = "in the report " + wrx_string(std::to_string(no)) +
                    " the usage locations [" + wrx_string(", ").join(nos) + "] are missing";
  warning.missing_locations = usage_location_nos;
  items.push_back(std::move(warning));
}

std::vector<wrx_warning> wrx_warnings::take()
{
  std::vector<wrx_warning> out;
  out.swap(items);
  return out;
}

size_t wrx_warnings::count(wrx_warning_kind kind) const
{
  return static_cast<size_t>(std::count_if(items.begin(), items.end(),
    [kind](const wrx_warning& w) { return w.kind == kind; }));
}
