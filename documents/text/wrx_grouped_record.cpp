#include "wrx_grouped_record.h"
#include "../../utils/wrx_exceptions.h"
#include <algorithm>

const char* const WRX_DEPARTMENT_KEY = "Abteilung:";
const char* const WRX_USAGE_LOCATION_KEY = "Nutzungsort Lfd. Nr.:";

wrx_segmenter::wrx_segmenter(wrx_trailing_flush trailing)
  : trailing(trailing)
{
}

wrx_grouped_record wrx_segmenter::segment(wrx_key_values pairs) const
{
  wrx_grouped_record record;

  // dangling labels at the end form the annotation
  std::vector<wrx_string> annotation;
  while (!pairs.empty() && pairs.back().second.empty()) {
    annotation.push_back(std::move(pairs.back().first));
    pairs.pop_back();
  }
  if (!annotation.empty()) {
    std::reverse(annotation.begin(), annotation.end());
    record.annotation = wrx_string(" ").join(annotation);
  }

  size_t pos = 0;
  while (pos < pairs.size() && pairs[pos].first != WRX_DEPARTMENT_KEY) {
    record.root.push_back(std::move(pairs[pos]));
    pos++;
  }

  while (pos < pairs.size()) {
    wrx_key_value_pair& sentinel = pairs[pos];
    if (sentinel.first != WRX_DEPARTMENT_KEY) {
      throw wrx_structure_error("expected '" + wrx_string(WRX_DEPARTMENT_KEY) +
                                "', got '" + sentinel.first + "'");
    }
    pos++;

    wrx_department_group department;
    department.label = wrx_string("").join(sentinel.second);
    department.usage_locations = group_usage_locations(pairs, pos);
    record.departments.push_back(std::move(department));
  }

  return record;
}

std::vector<wrx_key_values> wrx_segmenter::group_usage_locations(wrx_key_values& pairs, size_t& pos) const
{
  std::vector<wrx_key_values> usage_locations;
  wrx_key_values current;

  while (pos < pairs.size() && pairs[pos].first != WRX_DEPARTMENT_KEY) {
    if (pairs[pos].first == WRX_USAGE_LOCATION_KEY && !current.empty()) {
      usage_locations.push_back(std::move(current));
      current = wrx_key_values();
    }
    current.push_back(std::move(pairs[pos]));
    pos++;
  }

  if (!current.empty() || trailing == wrx_trailing_flush::always) {
    usage_locations.push_back(std::move(current));
  }
  return usage_locations;
}

wrx_key_values flatten(const wrx_grouped_record& record)
{
  wrx_key_values pairs = record.root;

  for (const auto& department : record.departments) {
    pairs.emplace_back(WRX_DEPARTMENT_KEY, std::vector<wrx_string>{department.label});
    for (const auto& usage_location : department.usage_locations) {
      pairs.insert(pairs.end(), usage_location.begin(), usage_location.end());
    }
  }

  if (record.annotation) {
    pairs.emplace_back(*record.annotation, std::vector<wrx_string>());
  }
  return pairs;
}
