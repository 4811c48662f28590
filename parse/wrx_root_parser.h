#ifndef WRX_ROOT_PARSER_H
#define WRX_ROOT_PARSER_H

#include "../documents/text/wrx_key_value.h"
#include "../model/wrx_water_right.h"

// Fills the water right metadata from the pairs before the first department.
// Throws wrx_unknown_key_error for keys outside the report vocabulary.
void parse_root(const wrx_key_values& items, wrx_water_right& water_right);

// Quoted value list for error messages
wrx_string describe_values(const std::vector<wrx_string>& values);

#endif // WRX_ROOT_PARSER_H
