#include "wrx_water_right.h"

bool parse_department(const wrx_string& text, wrx_department& out)
{
  if (text.size() != 1) {
    return false;
  }

  switch (text[0]) {
    case 'A': out = wrx_department::A; return true;
    case 'B': out = wrx_department::B; return true;
    case 'C': out = wrx_department::C; return true;
    case 'D': out = wrx_department::D; return true;
    case 'E': out = wrx_department::E; return true;
    case 'F': out = wrx_department::F; return true;
    case 'K': out = wrx_department::K; return true;
    case 'L': out = wrx_department::L; return true;
    default: return false;
  }
}

wrx_string to_string(wrx_department department)
{
  switch (department) {
    case wrx_department::A: return "A";
    case wrx_department::B: return "B";
    case wrx_department::C: return "C";
    case wrx_department::D: return "D";
    case wrx_department::E: return "E";
    case wrx_department::F: return "F";
    case wrx_department::K: return "K";
    case wrx_department::L: return "L";
  }
  return "?";
}

bool has_injection_limits(wrx_department department)
{
  return department == wrx_department::B ||
         department == wrx_department::C ||
         department == wrx_department::F;
}

size_t wrx_water_right::usage_location_count() const
{
  size_t count = 0;
  for (const auto& entry : legal_departments) {
    count += entry.second.usage_locations.size();
  }
  return count;
}
