#include "wrx_department_parser.h"
#include "wrx_root_parser.h"
#include "wrx_value_grammar.h"
#include <set>

namespace {

  bool is_separator(const wrx_string& token)
  {
    return token == "-" || token == "\xE2\x80\x93" || token == "\xE2\x80\x94" || token == ":";
  }

  // "123 Name" fields, both parts or nothing
  std::optional<wrx_numbered_name> numbered_name(const wrx_string& key,
                                                 const std::optional<wrx_string>& first,
                                                 const std::optional<wrx_string>& second,
                                                 const std::vector<wrx_string>& values)
  {
    if (!first && !second) {
      return std::nullopt;
    }
    if (!first || !second) {
      throw wrx_unknown_key_error("usage location", key, describe_values(values));
    }
    return wrx_numbered_name(parse_u64(*first, key), *second);
  }

  // Map excerpt and catchment area code, a code with an optional name
  std::optional<wrx_single_or_pair<uint64_t, wrx_string>> code_or_pair(const wrx_string& key,
                                                                       const std::optional<wrx_string>& first,
                                                                       const std::optional<wrx_string>& second,
                                                                       const std::vector<wrx_string>& values)
  {
    if (!first && !second) {
      return std::nullopt;
    }
    if (!first) {
      throw wrx_unknown_key_error("usage location", key, describe_values(values));
    }
    uint64_t code = parse_u64(first->remove(" "), key);
    if (!second) {
      return wrx_single_or_pair<uint64_t, wrx_string>::single(code);
    }
    return wrx_single_or_pair<uint64_t, wrx_string>::pair(code, *second);
  }

  // Keys read as "<code> <name>", every other key reads a single value
  size_t value_limit(const wrx_string& key)
  {
    static const std::set<wrx_string> two_value_keys = {
      "Top. Karte 1:25.000:",
      "Gemeindegebiet:",
      "Unterhaltungsverband:",
      "EU-Bearbeitungsgebiet:",
      "Einzugsgebietskennzahl:"
    };
    return two_value_keys.count(key) ? 2 : 1;
  }

  wrx_quantity quantity(const wrx_string& value, const wrx_string& unit, const wrx_string& kind)
  {
    wrx_quantity q;
    q.value = parse_number(value, kind);
    q.unit = unit;
    return q;
  }

}

wrx_legal_department parse_department_label(const wrx_string& raw_label)
{
  wrx_string label = raw_label.trim();
  std::vector<wrx_string> parts = label.splitn(" ", 3);

  wrx_legal_department department;
  if (parts[0].empty() || !parse_department(parts[0], department.abbreviation)) {
    throw wrx_format_error("unknown legal department abbreviation \"" + parts[0] + "\"");
  }

  // the abbreviation is usually followed by a dash before the description
  wrx_string description;
  if (parts.size() >= 2) {
    description = label.substr(parts[0].size() + 1);
    if (is_separator(parts[1])) {
      description = parts.size() == 3 ? parts[2] : wrx_string();
    }
  }

  description = description.trim();
  if (description.empty()) {
    throw wrx_format_error("department is missing description: \"" + label + "\"");
  }
  department.description = description;
  return department;
}

void parse_departments(const std::vector<wrx_department_group>& departments, wrx_water_right& water_right)
{
  for (const auto& group : departments) {
    wrx_legal_department department = parse_department_label(group.label);

    for (const auto& items : group.usage_locations) {
      wrx_usage_location usage_location;
      parse_usage_location(items, usage_location, department.abbreviation);
      department.usage_locations.push_back(std::move(usage_location));
    }

    // a department split over two sections keeps its first description
    auto it = water_right.legal_departments.find(department.abbreviation);
    if (it == water_right.legal_departments.end()) {
      water_right.legal_departments.emplace(department.abbreviation, std::move(department));
    } else {
      auto& locations = it->second.usage_locations;
      for (auto& usage_location : department.usage_locations) {
        locations.push_back(std::move(usage_location));
      }
    }
  }
}

void parse_usage_location(const wrx_key_values& items, wrx_usage_location& usage_location,
                          wrx_department department)
{
  for (const auto& item : items) {
    const wrx_string& key = item.first;
    const std::vector<wrx_string>& values = item.second;
    if (values.size() > value_limit(key)) {
      throw wrx_unknown_key_error("usage location", key, describe_values(values));
    }
    std::optional<wrx_string> first = sanitize_value(values, 0);
    std::optional<wrx_string> second = sanitize_value(values, 1);

    if (key == WRX_USAGE_LOCATION_KEY && first) {
      wrx_usage_location_header header;
      if (!parse_usage_location_header(*first, header)) {
        throw wrx_format_error("'Nutzungsort' has invalid format: " + *first);
      }
      usage_location.serial = header.serial;
      usage_location.active = header.active;
      usage_location.real = header.real;
    } else if (key == "Bezeichnung:") {
      if (first) {
        usage_location.name = first->replaced("\n", " ");
      } else {
        usage_location.name.reset();
      }
    } else if (key == "Rechtszweck:" && first) {
      std::vector<wrx_string> parts = first->splitn(" ", 2);
      if (parts.size() == 2) {
        usage_location.legal_purpose = std::make_pair(parts[0], parts[1]);
      } else {
        usage_location.legal_purpose.reset();
      }
    } else if (key == "East und North:" && first) {
      usage_location.utm_easting = parse_u64(*first, key);
    } else if (key == "(ETRS89/UTM 32N)" && first) {
      usage_location.utm_northing = parse_u64(*first, key);
    } else if (key == "Top. Karte 1:25.000:") {
      auto code = code_or_pair(key, first, second, values);
      if (code) usage_location.map_excerpt = code;
    } else if (key == "Gemeindegebiet:") {
      auto area = numbered_name(key, first, second, values);
      if (area) usage_location.municipal_area = area;
    } else if (key == "Gemarkung, Flur:" && (first || !second)) {
      if (first) usage_location.land_record = parse_land_record(*first);
    } else if (key == "Unterhaltungsverband:") {
      auto association = numbered_name(key, first, second, values);
      if (association) usage_location.maintenance_association = association;
    } else if (key == "Flurstück:" && (first || !second)) {
      if (first) usage_location.plot = first;
    } else if (key == "EU-Bearbeitungsgebiet:") {
      auto area = numbered_name(key, first, second, values);
      if (area) usage_location.eu_survey_area = area;
    } else if (key == "Gewässer:") {
      usage_location.water_body = first;
    } else if (key == "Einzugsgebietskennzahl:") {
      auto code = code_or_pair(key, first, second, values);
      if (code) usage_location.catchment_area_code = code;
    } else if (key == "Verordnungszitat:") {
      usage_location.regulation_citation = first;
    } else if (key == "Erlaubniswert:" && first) {
      parse_allowance_value(*first, usage_location, department);
    } else {
      throw wrx_unknown_key_error("usage location", key, describe_values(values));
    }
  }
}

void parse_allowance_value(const wrx_string& value, wrx_usage_location& usage_location,
                           wrx_department department)
{
  std::vector<wrx_string> split = value.rsplitn(" ", 3);
  if (split[0].empty()) {
    throw wrx_format_error("'Erlaubniswert' has no unit: " + value);
  }
  if (split.size() < 2) {
    throw wrx_format_error("'Erlaubniswert' has no value: " + value);
  }
  if (split.size() < 3) {
    throw wrx_format_error("'Erlaubniswert' has no specifier: " + value);
  }

  const wrx_string& unit = split[0];
  const wrx_string& amount = split[1];
  wrx_string kind = split[2].trim();
  if (kind.ends_with(":")) {
    kind = kind.substr(0, kind.size() - 1).trim();
  }

  wrx_or_fallback<wrx_rate_value> rate = parse_rate_or_fallback(amount + " " + unit);

  if (kind == "Entnahmemenge") {
    usage_location.withdrawal_rates.insert(rate);
  } else if (kind == "Förderleistung") {
    usage_location.pumping_rates.insert(rate);
  } else if (kind == "Einleitungsmenge") {
    usage_location.injection_rates.insert(rate);
  } else if (kind == "Stauziel, bezogen auf NN") {
    usage_location.dam_target_levels.default_level = quantity(amount, unit, kind);
  } else if (kind == "Stauziel (Höchststau), bezogen auf NN") {
    usage_location.dam_target_levels.max = quantity(amount, unit, kind);
  } else if (kind == "Stauziel (Dauerstau), bezogen auf NN") {
    usage_location.dam_target_levels.steady = quantity(amount, unit, kind);
  } else if (kind == "Abwasservolumenstrom, Sekunde" ||
             kind == "Abwasservolumenstrom, RW, Sekunde" ||
             kind == "Abwasservolumenstrom, Std." ||
             kind == "Abwasservolumenstrom, Tag" ||
             kind == "Abwasservolumenstrom, Jahr" ||
             kind == "Abwasservolumenstrom, RW, Jahr") {
    usage_location.waste_water_flow_volume.insert(rate);
  } else if (kind == "Beregnungsfläche") {
    usage_location.irrigation_area = quantity(amount, unit, kind);
  } else if (kind == "Zusatzregen") {
    usage_location.rain_supplement.insert(rate);
  } else if (kind == "Ableitungsmenge") {
    usage_location.fluid_discharge.insert(rate);
  } else if (has_injection_limits(department)) {
    usage_location.injection_limits.emplace_back(kind, quantity(amount, unit, kind));
  } else {
    throw wrx_format_error("unknown allowance value: \"" + kind + "\"");
  }
}
