#ifndef WRX_CONFIG_H
#define WRX_CONFIG_H

#include "wrx_string.h"
#include <map>

// Role a font plays in the report layout. Labels start a key-value pair,
// values are appended to the current pair.
enum class wrx_font_role
{
  none,
  label,
  value
};

// What the segmenter does with the usage location still collected when a
// department ends
enum class wrx_trailing_flush
{
  always,     // emit it even when it holds no pairs
  non_empty   // drop it when it holds no pairs
};

// Font name to role lookup. The reports carry no markup, so the font
// resource name is the only structural signal.
class wrx_font_roles
{
  std::map<wrx_string, wrx_font_role> roles;
public:
  // F1 labels, F2 and F3 values
  wrx_font_roles();

  void set(const wrx_string& font, wrx_font_role role);
  wrx_font_role role_of(const wrx_string& font) const;
  void clear();
  size_t size() const { return roles.size(); }
};

struct wrx_parser_config
{
  wrx_font_roles font_roles;
  wrx_string text_encoding = "WinAnsiEncoding";
  wrx_trailing_flush trailing_usage_location = wrx_trailing_flush::always;
  // 0 picks the hardware concurrency
  unsigned workers = 0;
  bool verbose = false;

  // Reads the WRX_* variables, unset variables keep the defaults
  static wrx_parser_config from_environment();
};

#endif // WRX_CONFIG_H
