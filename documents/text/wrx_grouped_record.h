#ifndef WRX_GROUPED_RECORD_H
#define WRX_GROUPED_RECORD_H

#include "wrx_key_value.h"
#include <optional>

// Sentinel keys marking section boundaries
extern const char* const WRX_DEPARTMENT_KEY;       // "Abteilung:"
extern const char* const WRX_USAGE_LOCATION_KEY;   // "Nutzungsort Lfd. Nr.:"

struct wrx_department_group
{
  wrx_string label;
  std::vector<wrx_key_values> usage_locations;
};

struct wrx_grouped_record
{
  wrx_key_values root;
  std::vector<wrx_department_group> departments;
  std::optional<wrx_string> annotation;
};

// Splits the key-value stream into root pairs, departments with their usage
// locations and the trailing annotation.
class wrx_segmenter
{
  wrx_trailing_flush trailing;

public:
  explicit wrx_segmenter(wrx_trailing_flush trailing = wrx_trailing_flush::always);

  // Throws wrx_structure_error when a department does not start with its sentinel
  wrx_grouped_record segment(wrx_key_values pairs) const;

private:
  std::vector<wrx_key_values> group_usage_locations(wrx_key_values& pairs, size_t& pos) const;
};

// Inverse of segment: root pairs, then per department its sentinel pair and
// usage location pairs, then the annotation as a dangling label
wrx_key_values flatten(const wrx_grouped_record& record);

#endif // WRX_GROUPED_RECORD_H
