#ifndef WRX_WATER_RIGHT_H
#define WRX_WATER_RIGHT_H

#include "wrx_value_types.h"
#include "../utils/wrx_exceptions.h"
#include <map>
#include <vector>

// The legal departments a water right is split into
enum class wrx_department
{
  A,  // Entnahme von Wasser oder Entnahmen fester Stoffe aus oberirdischen Gewässern
  B,  // Einbringen und Einleiten von Stoffen in oberirdische und Küstengewässer
  C,  // Aufstauen und Absenken oberirdischer Gewässer
  D,  // Andere Einwirkung auf oberirdische Gewässer
  E,  // Entnahme, Zutageförderung, Zutageleiten und Ableiten von Grundwasser
  F,  // Andere Nutzungen und Einwirkungen auf das Grundwasser
  K,  // Zwangsrechte
  L   // Fischereirechte
};

bool parse_department(const wrx_string& text, wrx_department& out);
wrx_string to_string(wrx_department department);

// Departments whose unknown allowance kinds are injection limits
bool has_injection_limits(wrx_department department);

// One "Nutzungsort" of a water right
struct wrx_usage_location
{
  std::optional<uint64_t> no;                     // "Nutzungsort Nr."
  std::optional<wrx_string> serial;               // "Nutzungsort Lfd. Nr."
  std::optional<bool> active;                     // aktiv / inaktiv
  std::optional<bool> real;                       // real / virtuell
  std::optional<wrx_string> name;                 // "Bezeichnung"
  std::optional<std::pair<wrx_string, wrx_string>> legal_purpose;
  std::optional<wrx_single_or_pair<uint64_t, wrx_string>> map_excerpt;   // "Top. Karte 1:25.000"
  std::optional<wrx_numbered_name> municipal_area;
  std::optional<wrx_string> county;
  std::optional<wrx_or_fallback<wrx_land_record>> land_record;
  std::optional<wrx_string> plot;                 // "Flurstück"
  std::optional<wrx_numbered_name> maintenance_association;
  std::optional<wrx_numbered_name> eu_survey_area;
  std::optional<wrx_single_or_pair<uint64_t, wrx_string>> catchment_area_code;
  std::optional<wrx_string> regulation_citation;

  wrx_rate_record withdrawal_rates;               // "Entnahmemenge"
  wrx_rate_record pumping_rates;                  // "Förderleistung"
  wrx_rate_record injection_rates;                // "Einleitungsmenge"
  wrx_rate_record waste_water_flow_volume;        // "Abwasservolumenstrom"

  std::optional<wrx_string> river_basin;
  std::optional<wrx_string> groundwater_body;
  std::optional<wrx_string> water_body;           // "Gewässer"
  std::optional<wrx_string> flood_area;
  std::optional<wrx_string> water_protection_area;

  wrx_dam_targets dam_target_levels;              // "Stauziel"
  wrx_rate_record fluid_discharge;                // "Ableitungsmenge"
  wrx_rate_record rain_supplement;                // "Zusatzregen"
  std::optional<wrx_quantity> irrigation_area;    // "Beregnungsfläche"
  std::optional<wrx_ph_values> ph_values;
  std::vector<std::pair<wrx_string, wrx_quantity>> injection_limits;

  std::optional<uint64_t> utm_easting;
  std::optional<uint64_t> utm_northing;
};

struct wrx_legal_department
{
  wrx_string description;
  wrx_department abbreviation = wrx_department::A;
  std::vector<wrx_usage_location> usage_locations;
};

struct wrx_water_right
{
  wrx_water_right_no no = 0;

  std::optional<wrx_string> holder;
  std::optional<wrx_string> valid_until;
  std::optional<wrx_string> status;
  std::optional<wrx_string> valid_from;
  std::optional<wrx_string> legal_title;
  std::optional<wrx_string> water_authority;
  std::optional<wrx_string> registering_authority;
  std::optional<wrx_string> granting_authority;
  std::optional<wrx_string> initially_granted;
  std::optional<wrx_string> last_change;
  std::optional<wrx_string> file_reference;
  std::optional<wrx_string> external_identifier;
  std::optional<wrx_string> subject;
  std::optional<wrx_string> address;

  std::map<wrx_department, wrx_legal_department> legal_departments;

  std::optional<wrx_string> annotation;             // "Bemerkung"

  wrx_water_right() = default;
  explicit wrx_water_right(wrx_water_right_no no) : no(no) {}

  size_t usage_location_count() const;
};

#endif // WRX_WATER_RIGHT_H
