#include "wrx_root_parser.h"
#include "wrx_value_grammar.h"

wrx_string describe_values(const std::vector<wrx_string>& values)
{
  std::vector<wrx_string> quoted;
  for (const auto& v : values) {
    quoted.push_back("\"" + v + "\"");
  }
  return "[" + wrx_string(", ").join(quoted) + "]";
}

namespace {

  // "Kennziffer" holds "<external identifier> (<status>)"
  void parse_identifier(const wrx_string& value, wrx_water_right& water_right)
  {
    std::vector<wrx_string> split = value.rsplitn(" ", 2);
    const wrx_string& state = split[0];
    if (state.size() < 2) {
      throw wrx_format_error("'Kennziffer' has no enclosed status: " + value);
    }
    water_right.status = state.substr(1, state.size() - 2);
    if (split.size() > 1) {
      water_right.external_identifier = split[1];
    }
  }

}

void parse_root(const wrx_key_values& items, wrx_water_right& water_right)
{
  for (const auto& item : items) {
    const wrx_string& key = item.first;
    std::optional<wrx_string> value = sanitize_value(item.second, 0);

    if (key == "Wasserbuchbehörde") {
      water_right.water_authority = value;
    } else if (key == "Kennziffer" && value) {
      parse_identifier(*value, water_right);
    } else if (key == "erteilt durch /" || key == "abweichend" || key == "und betrifft Rechtsabteilungen") {
      // layout labels without a value of their own
    } else if (key == "eingetragen durch:") {
      water_right.registering_authority = value;
    } else if (key == "erteilt durch:") {
      water_right.granting_authority = value;
    } else if (key == "erteilt am:") {
      water_right.valid_from = value;
    } else if (key == "erstmalig erteilt am:" || key == "erstmalig ertellt am:") {
      // TODO: drop the misspelled label once the published reports are corrected
      water_right.initially_granted = value;
    } else if (key == "Aktenzeichen:") {
      water_right.file_reference = value;
    } else if (key == "Das Recht ist befristet bis") {
      water_right.valid_until = value;
    } else if (key == "Betreff:") {
      water_right.subject = value;
    } else {
      throw wrx_unknown_key_error("root", key, describe_values(item.second));
    }
  }
}
