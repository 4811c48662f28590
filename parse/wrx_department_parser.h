#ifndef WRX_DEPARTMENT_PARSER_H
#define WRX_DEPARTMENT_PARSER_H

#include "../documents/text/wrx_grouped_record.h"
#include "../model/wrx_water_right.h"

// "<abbreviation> [-] <description>"
wrx_legal_department parse_department_label(const wrx_string& label);

void parse_departments(const std::vector<wrx_department_group>& departments, wrx_water_right& water_right);

void parse_usage_location(const wrx_key_values& items, wrx_usage_location& usage_location,
                          wrx_department department);

// "Erlaubniswert:" value, "<kind> <value> <unit>"
void parse_allowance_value(const wrx_string& value, wrx_usage_location& usage_location,
                           wrx_department department);

#endif // WRX_DEPARTMENT_PARSER_H
