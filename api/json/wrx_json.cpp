#include "wrx_json.h"
#include <nlohmann/json.hpp>
#include <iostream>

using nlohmann::json;

namespace {

  json rate_to_nlohmann(const wrx_or_fallback<wrx_rate_value>& rate)
  {
    if (rate.is_fallback()) {
      return rate.get_fallback().to_std_const();
    }
    const wrx_rate_value& r = rate.get_expected();
    return json::array({ r.value, r.measurement.to_std_const(), r.per.to_string().to_std_const() });
  }

  json rates_to_nlohmann(const wrx_rate_record& rates)
  {
    json arr = json::array();
    for (const auto& rate : rates) {
      arr.push_back(rate_to_nlohmann(rate));
    }
    return arr;
  }

  json quantity_to_nlohmann(const wrx_quantity& q)
  {
    return json::array({ q.value, q.unit.to_std_const() });
  }

  json code_to_nlohmann(const wrx_single_or_pair<uint64_t, wrx_string>& code)
  {
    if (code.is_pair()) {
      return json::array({ code.first(), code.second().to_std_const() });
    }
    return json::array({ code.first() });
  }

  json numbered_name_to_nlohmann(const wrx_numbered_name& name)
  {
    return json::array({ name.first, name.second.to_std_const() });
  }

  void put(json& obj, const char* key, const std::optional<wrx_string>& value)
  {
    if (value) {
      obj[key] = value->to_std_const();
    }
  }

  template <typename T>
  void put(json& obj, const char* key, const std::optional<T>& value)
  {
    if (value) {
      obj[key] = *value;
    }
  }

  void put_rates(json& obj, const char* key, const wrx_rate_record& rates)
  {
    if (!rates.empty()) {
      obj[key] = rates_to_nlohmann(rates);
    }
  }

  json usage_location_to_nlohmann(const wrx_usage_location& ul)
  {
    json obj = json::object();
    put(obj, "no", ul.no);
    put(obj, "serial", ul.serial);
    put(obj, "active", ul.active);
    put(obj, "real", ul.real);
    put(obj, "name", ul.name);
    if (ul.legal_purpose) {
      obj["legalPurpose"] = json::array({ ul.legal_purpose->first.to_std_const(),
                                          ul.legal_purpose->second.to_std_const() });
    }
    if (ul.map_excerpt) obj["mapExcerpt"] = code_to_nlohmann(*ul.map_excerpt);
    if (ul.municipal_area) obj["municipalArea"] = numbered_name_to_nlohmann(*ul.municipal_area);
    put(obj, "county", ul.county);
    if (ul.land_record) {
      if (ul.land_record->is_fallback()) {
        obj["landRecord"] = ul.land_record->get_fallback().to_std_const();
      } else {
        const wrx_land_record& record = ul.land_record->get_expected();
        obj["landRecord"] = { { "district", record.district.to_std_const() }, { "field", record.field } };
      }
    }
    put(obj, "plot", ul.plot);
    if (ul.maintenance_association) {
      obj["maintenanceAssociation"] = numbered_name_to_nlohmann(*ul.maintenance_association);
    }
    if (ul.eu_survey_area) obj["euSurveyArea"] = numbered_name_to_nlohmann(*ul.eu_survey_area);
    if (ul.catchment_area_code) obj["catchmentAreaCode"] = code_to_nlohmann(*ul.catchment_area_code);
    put(obj, "regulationCitation", ul.regulation_citation);

    put_rates(obj, "withdrawalRates", ul.withdrawal_rates);
    put_rates(obj, "pumpingRates", ul.pumping_rates);
    put_rates(obj, "injectionRates", ul.injection_rates);
    put_rates(obj, "wasteWaterFlowVolume", ul.waste_water_flow_volume);

    put(obj, "riverBasin", ul.river_basin);
    put(obj, "groundwaterBody", ul.groundwater_body);
    put(obj, "waterBody", ul.water_body);
    put(obj, "floodArea", ul.flood_area);
    put(obj, "waterProtectionArea", ul.water_protection_area);

    if (!ul.dam_target_levels.empty()) {
      json targets = json::object();
      if (ul.dam_target_levels.default_level) targets["default"] = quantity_to_nlohmann(*ul.dam_target_levels.default_level);
      if (ul.dam_target_levels.steady) targets["steady"] = quantity_to_nlohmann(*ul.dam_target_levels.steady);
      if (ul.dam_target_levels.max) targets["max"] = quantity_to_nlohmann(*ul.dam_target_levels.max);
      obj["damTargetLevels"] = targets;
    }

    put_rates(obj, "fluidDischarge", ul.fluid_discharge);
    put_rates(obj, "rainSupplement", ul.rain_supplement);
    if (ul.irrigation_area) obj["irrigationArea"] = quantity_to_nlohmann(*ul.irrigation_area);

    if (ul.ph_values) {
      json ph = json::object();
      put(ph, "min", ul.ph_values->min);
      put(ph, "max", ul.ph_values->max);
      obj["pHValues"] = ph;
    }

    if (!ul.injection_limits.empty()) {
      json limits = json::array();
      for (const auto& limit : ul.injection_limits) {
        limits.push_back(json::array({ limit.first.to_std_const(), quantity_to_nlohmann(limit.second) }));
      }
      obj["injectionLimits"] = limits;
    }

    put(obj, "utmEasting", ul.utm_easting);
    put(obj, "utmNorthing", ul.utm_northing);
    return obj;
  }

  json water_right_to_nlohmann(const wrx_water_right& wr)
  {
    json obj = json::object();
    obj["no"] = wr.no;
    put(obj, "holder", wr.holder);
    put(obj, "validUntil", wr.valid_until);
    put(obj, "status", wr.status);
    put(obj, "validFrom", wr.valid_from);
    put(obj, "legalTitle", wr.legal_title);
    put(obj, "waterAuthority", wr.water_authority);
    put(obj, "registeringAuthority", wr.registering_authority);
    put(obj, "grantingAuthority", wr.granting_authority);
    put(obj, "initiallyGranted", wr.initially_granted);
    put(obj, "lastChange", wr.last_change);
    put(obj, "fileReference", wr.file_reference);
    put(obj, "externalIdentifier", wr.external_identifier);
    put(obj, "subject", wr.subject);
    put(obj, "address", wr.address);

    json departments = json::object();
    for (const auto& entry : wr.legal_departments) {
      const wrx_legal_department& department = entry.second;
      json locations = json::array();
      for (const auto& ul : department.usage_locations) {
        locations.push_back(usage_location_to_nlohmann(ul));
      }
      departments[to_string(entry.first).to_std_const()] = {
        { "description", department.description.to_std_const() },
        { "abbreviation", to_string(department.abbreviation).to_std_const() },
        { "usageLocations", locations }
      };
    }
    obj["legalDepartments"] = departments;

    put(obj, "annotation", wr.annotation);
    return obj;
  }

  json warning_to_nlohmann(const wrx_warning& warning)
  {
    json obj = {
      { "kind", to_string(warning.kind) },
      { "waterRightNo", warning.water_right_no },
      { "message", warning.message.to_std_const() }
    };
    if (!warning.missing_locations.empty()) {
      obj["missingLocations"] = warning.missing_locations;
    }
    return obj;
  }

  json failures_to_nlohmann(const std::map<wrx_water_right_no, wrx_string>& failures)
  {
    json obj = json::object();
    for (const auto& entry : failures) {
      obj[std::to_string(entry.first)] = entry.second.to_std_const();
    }
    return obj;
  }

  wrx_string dump(const json& j, int indent)
  {
    try {
      // invalid UTF-8 in report text is replaced instead of aborting the dump
      return wrx_string(j.dump(indent, ' ', false, json::error_handler_t::replace));
    } catch (const json::type_error& e) {
      std::cerr << "[JSON] Serialization failed: " << e.what() << std::endl;
      return wrx_string();
    }
  }

}

wrx_string to_json(const wrx_water_right& water_right, int indent)
{
  return dump(water_right_to_nlohmann(water_right), indent);
}

wrx_string to_json(const std::vector<wrx_water_right>& water_rights, int indent)
{
  json arr = json::array();
  for (const auto& water_right : water_rights) {
    arr.push_back(water_right_to_nlohmann(water_right));
  }
  return dump(arr, indent);
}

wrx_string to_json(const std::vector<wrx_warning>& warnings, int indent)
{
  json arr = json::array();
  for (const auto& warning : warnings) {
    arr.push_back(warning_to_nlohmann(warning));
  }
  return dump(arr, indent);
}

wrx_string to_json(const wrx_parse_summary& summary, int indent)
{
  json warnings = json::array();
  for (const auto& warning : summary.warnings) {
    warnings.push_back(warning_to_nlohmann(warning));
  }

  json obj = {
    { "successful", summary.enriched.size() },
    { "pdfOnly", summary.pdf_only.size() },
    { "fullyParsed", summary.fully_parsed() },
    { "parsedWithWarnings", summary.parsed_with_warnings() },
    { "parsingIssues", failures_to_nlohmann(summary.failed) },
    { "broken", failures_to_nlohmann(summary.broken) },
    { "warnings", warnings }
  };
  return dump(obj, indent);
}
