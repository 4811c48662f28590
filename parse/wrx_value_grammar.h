#ifndef WRX_VALUE_GRAMMAR_H
#define WRX_VALUE_GRAMMAR_H

#include "../model/wrx_value_types.h"
#include <optional>
#include <vector>

// Value at index, trimmed. Missing, blank and "-" values are absent.
std::optional<wrx_string> sanitize_value(const std::vector<wrx_string>& values, size_t index);
std::optional<wrx_string> sanitize(const std::optional<wrx_string>& value);

// "<value> <measurement>/<factor><time code>", e.g. "12 m³/2a"
bool parse_rate(const wrx_string& text, wrx_rate_value& out);
wrx_or_fallback<wrx_rate_value> parse_rate_or_fallback(const wrx_string& text);

// Spaces are removed before matching "<letters><digits>". Text that does
// not match is kept as the fallback.
wrx_or_fallback<wrx_land_record> parse_land_record(const wrx_string& text);

struct wrx_usage_location_header
{
  wrx_string serial;
  bool active = false;
  bool real = false;
};

// "<serial> (<aktiv|inaktiv>, <real|virtuell>)"
bool parse_usage_location_header(const wrx_string& text, wrx_usage_location_header& out);

enum class wrx_date_result
{
  normalized,
  invalid
};

// "d.m.y" becomes "y-m-d", any other shape stays untouched and is invalid
wrx_date_result normalize_date(wrx_string& date);

// Both throw wrx_format_error naming the field
uint64_t parse_u64(const wrx_string& text, const wrx_string& field);
double parse_number(const wrx_string& text, const wrx_string& field);

#endif // WRX_VALUE_GRAMMAR_H
