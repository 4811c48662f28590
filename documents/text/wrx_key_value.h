#ifndef WRX_KEY_VALUE_H
#define WRX_KEY_VALUE_H

#include "wrx_text_block.h"
#include "../../utils/wrx_config.h"
#include <utility>
#include <vector>

// A label and the value texts that followed it. An empty value list marks a
// dangling label.
typedef std::pair<wrx_string, std::vector<wrx_string>> wrx_key_value_pair;
typedef std::vector<wrx_key_value_pair> wrx_key_values;

// Groups text blocks into key-value pairs by font role.
//
// A label block starts a new pair, a value block is appended to the current
// pair, also across page breaks. A value block opening a page in a column
// where a label sat is joined to that label's last value instead. Value
// blocks before the first label are dropped with a warning.
class wrx_key_value_grouper
{
  const wrx_font_roles& roles;
  wrx_warnings& warnings;

public:
  wrx_key_value_grouper(const wrx_font_roles& roles, wrx_warnings& warnings);

  wrx_key_values group(std::vector<wrx_text_block> blocks) const;
};

#endif // WRX_KEY_VALUE_H
