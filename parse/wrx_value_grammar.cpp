#include "wrx_value_grammar.h"
#include "../utils/wrx_exceptions.h"
#include <regex>

namespace {

  const std::regex& unit_pattern()
  {
    static const std::regex pattern(R"(^([^/]+)/([\d.,]*)(\w+)$)");
    return pattern;
  }

  const std::regex& land_record_pattern()
  {
    static const std::regex pattern(R"(^(\D+)\s*(\d+)$)");
    return pattern;
  }

  const std::regex& usage_location_pattern()
  {
    static const std::regex pattern(R"(^(.*) \((\w+), (\w+)\)$)");
    return pattern;
  }

}

std::optional<wrx_string> sanitize(const std::optional<wrx_string>& value)
{
  if (!value) {
    return std::nullopt;
  }
  wrx_string trimmed = value->trim();
  if (trimmed.empty() || trimmed == "-") {
    return std::nullopt;
  }
  return trimmed;
}

std::optional<wrx_string> sanitize_value(const std::vector<wrx_string>& values, size_t index)
{
  if (index >= values.size()) {
    return std::nullopt;
  }
  return sanitize(values[index]);
}

bool parse_rate(const wrx_string& text, wrx_rate_value& out)
{
  std::vector<wrx_string> parts = text.splitn(" ", 2);
  if (parts.size() < 2) {
    return false;
  }

  double value = 0;
  if (!parts[0].to_double(value)) {
    return false;
  }

  std::smatch m;
  const std::string& unit = parts[1].to_std_const();
  if (!std::regex_match(unit, m, unit_pattern())) {
    return false;
  }

  double factor = 1;
  if (!wrx_string(m[2].str()).to_double(factor)) {
    factor = 1;
  }

  wrx_duration per;
  if (!wrx_duration::from_code(m[3].str(), factor, per)) {
    return false;
  }

  out.value = value;
  out.measurement = m[1].str();
  out.per = per;
  return true;
}

wrx_or_fallback<wrx_rate_value> parse_rate_or_fallback(const wrx_string& text)
{
  wrx_rate_value rate;
  if (parse_rate(text, rate)) {
    return wrx_or_fallback<wrx_rate_value>::expected(rate);
  }
  return wrx_or_fallback<wrx_rate_value>::fallback(text);
}

wrx_or_fallback<wrx_land_record> parse_land_record(const wrx_string& text)
{
  wrx_string stripped = text.remove(" ");

  std::smatch m;
  if (std::regex_match(stripped.to_std_const(), m, land_record_pattern())) {
    uint64_t field = 0;
    if (wrx_string(m[2].str()).to_u64(field) && field <= UINT32_MAX) {
      wrx_land_record record;
      record.district = m[1].str();
      record.field = static_cast<uint32_t>(field);
      return wrx_or_fallback<wrx_land_record>::expected(record);
    }
  }
  return wrx_or_fallback<wrx_land_record>::fallback(stripped);
}

bool parse_usage_location_header(const wrx_string& text, wrx_usage_location_header& out)
{
  std::smatch m;
  if (!std::regex_match(text.to_std_const(), m, usage_location_pattern())) {
    return false;
  }
  out.serial = m[1].str();
  out.active = m[2].str() == "aktiv";
  out.real = m[3].str() == "real";
  return true;
}

wrx_date_result normalize_date(wrx_string& date)
{
  std::vector<wrx_string> parts = date.split(".");
  if (parts.size() != 3) {
    return wrx_date_result::invalid;
  }
  date = parts[2] + "-" + parts[1] + "-" + parts[0];
  return wrx_date_result::normalized;
}

uint64_t parse_u64(const wrx_string& text, const wrx_string& field)
{
  uint64_t value = 0;
  if (!text.to_u64(value)) {
    throw wrx_format_error("'" + field + "' is not a number: " + text);
  }
  return value;
}

double parse_number(const wrx_string& text, const wrx_string& field)
{
  double value = 0;
  if (!text.to_double(value)) {
    throw wrx_format_error("'" + field + "' is not a number: " + text);
  }
  return value;
}
