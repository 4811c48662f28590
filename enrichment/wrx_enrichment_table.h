#ifndef WRX_ENRICHMENT_TABLE_H
#define WRX_ENRICHMENT_TABLE_H

#include "../model/wrx_water_right.h"
#include "../utils/wrx_warning.h"
#include <map>
#include <optional>
#include <vector>

// One row of the spreadsheet extract, one usage location of one water right
struct wrx_table_row
{
  wrx_water_right_no no = 0;                       // "Wasserrecht Nr."
  std::optional<wrx_string> rights_holder;
  std::optional<wrx_string> valid_until;
  std::optional<wrx_string> status;
  std::optional<wrx_string> valid_from;
  std::optional<wrx_string> legal_title;
  std::optional<wrx_string> water_authority;
  std::optional<wrx_string> granting_authority;
  std::optional<wrx_string> date_of_change;
  std::optional<wrx_string> file_reference;
  std::optional<wrx_string> external_identifier;
  std::optional<wrx_string> subject;
  std::optional<wrx_string> address;

  uint64_t usage_location_no = 0;                  // "Nutzungsort Nr."
  std::optional<wrx_string> usage_location;        // usage location name
  wrx_string legal_department;
  std::optional<wrx_string> legal_purpose;         // "<code> <name>"
  std::optional<wrx_string> county;
  std::optional<wrx_string> river_basin;
  std::optional<wrx_string> groundwater_body;
  std::optional<wrx_string> flood_area;
  std::optional<wrx_string> water_protection_area;
  std::optional<uint64_t> utm_easting;
  std::optional<uint64_t> utm_northing;
};

// Read-only row table the parsed reports are completed from. Fill it before
// handing it to the workers, enrich() is safe to call concurrently.
class wrx_enrichment_table
{
  std::vector<wrx_table_row> rows;
  std::map<wrx_water_right_no, std::vector<size_t>> by_no;

public:
  wrx_enrichment_table() = default;
  explicit wrx_enrichment_table(std::vector<wrx_table_row> rows);

  // Blank and "-" cells become absent, zero coordinates become absent
  void add_row(wrx_table_row row);

  const std::vector<wrx_table_row>& get_rows() const { return rows; }
  std::vector<const wrx_table_row*> rows_for(wrx_water_right_no no) const;
  size_t size() const { return rows.size(); }

  // Fills absent fields of the water right and its usage locations. Usage
  // locations are matched by name, then by both UTM coordinates, every row is
  // used at most once. Returns true when the table has rows for the water right.
  bool enrich(wrx_water_right& water_right, wrx_warnings& warnings) const;
};

void sanitize_row(wrx_table_row& row);

#endif // WRX_ENRICHMENT_TABLE_H
