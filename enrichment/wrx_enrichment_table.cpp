#include "wrx_enrichment_table.h"
#include "../parse/wrx_value_grammar.h"

namespace {

  template <typename T>
  void update_if_none(std::optional<T>& target, const std::optional<T>& source)
  {
    if (!target) {
      target = source;
    }
  }

  bool matches_name(const wrx_usage_location& usage_location, const wrx_table_row& row)
  {
    return usage_location.name && row.usage_location && *row.usage_location == *usage_location.name;
  }

  bool matches_coordinates(const wrx_usage_location& usage_location, const wrx_table_row& row)
  {
    return usage_location.utm_easting && row.utm_easting == usage_location.utm_easting &&
           usage_location.utm_northing && row.utm_northing == usage_location.utm_northing;
  }

  void fill_usage_location(wrx_usage_location& usage_location, const wrx_table_row& row)
  {
    if (!usage_location.no) {
      usage_location.no = row.usage_location_no;
    }
    if (!usage_location.legal_purpose && row.legal_purpose) {
      std::vector<wrx_string> parts = row.legal_purpose->splitn(" ", 2);
      if (parts.size() == 2) {
        usage_location.legal_purpose = std::make_pair(parts[0], parts[1]);
      }
    }
    update_if_none(usage_location.county, row.county);
    update_if_none(usage_location.river_basin, row.river_basin);
    update_if_none(usage_location.groundwater_body, row.groundwater_body);
    update_if_none(usage_location.flood_area, row.flood_area);
    update_if_none(usage_location.water_protection_area, row.water_protection_area);
    update_if_none(usage_location.utm_easting, row.utm_easting);
    update_if_none(usage_location.utm_northing, row.utm_northing);
  }

}

void sanitize_row(wrx_table_row& row)
{
  std::optional<wrx_string>* cells[] = {
    &row.rights_holder, &row.valid_until, &row.status, &row.valid_from,
    &row.legal_title, &row.water_authority, &row.granting_authority,
    &row.date_of_change, &row.file_reference, &row.external_identifier,
    &row.subject, &row.address, &row.usage_location, &row.legal_purpose,
    &row.county, &row.river_basin, &row.groundwater_body, &row.flood_area,
    &row.water_protection_area
  };
  for (auto* cell : cells) {
    *cell = sanitize(*cell);
  }

  if (row.utm_easting && *row.utm_easting == 0) row.utm_easting.reset();
  if (row.utm_northing && *row.utm_northing == 0) row.utm_northing.reset();
}

wrx_enrichment_table::wrx_enrichment_table(std::vector<wrx_table_row> initial_rows)
{
  for (auto& row : initial_rows) {
    add_row(std::move(row));
  }
}

void wrx_enrichment_table::add_row(wrx_table_row row)
{
  sanitize_row(row);
  by_no[row.no].push_back(rows.size());
  rows.push_back(std::move(row));
}

std::vector<const wrx_table_row*> wrx_enrichment_table::rows_for(wrx_water_right_no no) const
{
  std::vector<const wrx_table_row*> out;
  auto it = by_no.find(no);
  if (it == by_no.end()) {
    return out;
  }
  for (size_t index : it->second) {
    out.push_back(&rows[index]);
  }
  return out;
}

bool wrx_enrichment_table::enrich(wrx_water_right& water_right, wrx_warnings& warnings) const
{
  std::vector<const wrx_table_row*> relevant = rows_for(water_right.no);
  if (relevant.empty()) {
    return false;
  }

  for (const auto* row : relevant) {
    update_if_none(water_right.holder, row->rights_holder);
    update_if_none(water_right.valid_until, row->valid_until);
    update_if_none(water_right.status, row->status);
    update_if_none(water_right.valid_from, row->valid_from);
    update_if_none(water_right.legal_title, row->legal_title);
    update_if_none(water_right.water_authority, row->water_authority);
    update_if_none(water_right.granting_authority, row->granting_authority);
    update_if_none(water_right.last_change, row->date_of_change);
    update_if_none(water_right.file_reference, row->file_reference);
    update_if_none(water_right.external_identifier, row->external_identifier);
    update_if_none(water_right.address, row->address);
  }

  // unconsumed rows by usage location number
  std::map<uint64_t, const wrx_table_row*> open_rows;
  for (const auto* row : relevant) {
    open_rows[row->usage_location_no] = row;
  }

  for (auto& entry : water_right.legal_departments) {
    for (auto& usage_location : entry.second.usage_locations) {
      auto match = open_rows.end();
      for (auto it = open_rows.begin(); it != open_rows.end(); ++it) {
        if (matches_name(usage_location, *it->second)) {
          match = it;
          break;
        }
      }
      if (match == open_rows.end()) {
        for (auto it = open_rows.begin(); it != open_rows.end(); ++it) {
          if (matches_coordinates(usage_location, *it->second)) {
            match = it;
            break;
          }
        }
      }

      if (match == open_rows.end()) {
        warnings.add(wrx_warning_kind::could_not_find_usage_location,
                     "could not find usage location no for report " +
                     wrx_string(std::to_string(water_right.no)) + ", enrichment may be missing values");
        continue;
      }

      fill_usage_location(usage_location, *match->second);
      open_rows.erase(match);
    }
  }

  if (!open_rows.empty()) {
    std::vector<uint64_t> missing;
    for (const auto& entry : open_rows) {
      missing.push_back(entry.first);
    }
    warnings.add_missing_locations(missing);
  }

  return true;
}
