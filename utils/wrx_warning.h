#ifndef WRX_WARNING_H
#define WRX_WARNING_H

#include "wrx_string.h"
#include "wrx_exceptions.h"
#include <vector>

enum class wrx_warning_kind
{
  unexpected_text_state,          // BT inside a block, Tm/Tf/rg/Tj/ET outside one
  value_without_label,            // value fragment with no pair to continue
  invalid_date_format,
  could_not_find_usage_location,  // no table row for a parsed usage location
  missing_locations               // table rows no usage location matched
};

const char* to_string(wrx_warning_kind kind);

struct wrx_warning
{
  wrx_warning_kind kind = wrx_warning_kind::unexpected_text_state;
  wrx_water_right_no water_right_no = 0;
  wrx_string message;
  std::vector<uint64_t> missing_locations;
};

// Warnings collected while one document is parsed. Every stage of the
// pipeline writes into the same list, the pool merges it afterwards.
class wrx_warnings
{
  wrx_water_right_no no;
  std::vector<wrx_warning> items;
public:
  explicit wrx_warnings(wrx_water_right_no no = 0) : no(no) {}

  void add(wrx_warning_kind kind, const wrx_string& message);
  void add_missing_locations(const std::vector<uint64_t>& usage_location_nos);

  wrx_water_right_no water_right_no() const { return no; }
  const std::vector<wrx_warning>& list() const { return items; }
  std::vector<wrx_warning> take();

  size_t size() const { return items.size(); }
  bool empty() const { return items.empty(); }
  size_t count(wrx_warning_kind kind) const;
};

#endif // WRX_WARNING_H
