#ifndef WRX_JSON_H
#define WRX_JSON_H

#include "../../model/wrx_water_right.h"
#include "../../processing/wrx_parse_pool.h"
#include "../../utils/wrx_warning.h"

// nlohmann::json stays out of the header, everything is handed out as text.
//
// Field names are camelCase. Absent optionals, empty rate records, empty
// injection limits and empty dam targets are left out.
//
// indent < 0 writes compact JSON, otherwise pretty printed with that indent.

wrx_string to_json(const wrx_water_right& water_right, int indent = -1);
wrx_string to_json(const std::vector<wrx_water_right>& water_rights, int indent = -1);
wrx_string to_json(const std::vector<wrx_warning>& warnings, int indent = -1);

// Counts, failed and broken reports by number, and the warnings
wrx_string to_json(const wrx_parse_summary& summary, int indent = -1);

#endif // WRX_JSON_H
