#ifndef WRX_VALUE_TYPES_H
#define WRX_VALUE_TYPES_H

#include "../utils/wrx_string.h"
#include <cstdint>
#include <optional>
#include <set>
#include <utility>
#include <variant>

// ============================================================================
// VALUE TYPES
// ============================================================================
//
// Typed field values of a water right. Fields whose text may not follow the
// expected grammar are stored as wrx_or_fallback, which keeps the original
// text verbatim when the grammar does not match.
//
// ============================================================================

enum class wrx_duration_unit
{
  seconds,
  minutes,
  hours,
  days,
  weeks,
  months,   // 30 days
  years     // 365 days
};

// Time base of a rate, e.g. "2a" is two years
class wrx_duration
{
public:
  wrx_duration_unit unit;
  double factor;

  wrx_duration() : unit(wrx_duration_unit::seconds), factor(1) {}
  wrx_duration(wrx_duration_unit unit, double factor) : unit(unit), factor(factor) {}

  // Rough conversion, imprecise above weeks
  double as_secs() const;

  // s, m|min, h, d, w|wo, M|mo, a|y
  static bool from_code(const wrx_string& code, double factor, wrx_duration& out);

  // "a" for a factor of one, "2a" otherwise
  wrx_string to_string() const;

  bool operator==(const wrx_duration& other) const { return as_secs() == other.as_secs(); }
  bool operator!=(const wrx_duration& other) const { return !(*this == other); }
  bool operator<(const wrx_duration& other) const { return as_secs() < other.as_secs(); }
};

// A value per time, e.g. 12 m³ per 2 years
template <typename T>
struct wrx_rate
{
  T value{};
  wrx_string measurement;
  wrx_duration per;

  bool operator==(const wrx_rate& other) const
  {
    return per == other.per && value == other.value;
  }

  bool operator!=(const wrx_rate& other) const { return !(*this == other); }

  // Time base first. Equal time bases fall back to the value so rates that
  // differ only in value both stay in a rate record.
  bool operator<(const wrx_rate& other) const
  {
    if (per < other.per) return true;
    if (other.per < per) return false;
    return value < other.value;
  }
};

struct wrx_quantity
{
  double value = 0;
  wrx_string unit;

  bool operator==(const wrx_quantity& other) const { return value == other.value && unit == other.unit; }
  bool operator!=(const wrx_quantity& other) const { return !(*this == other); }

  wrx_string to_string() const;
};

// Typed value or the original text it could not be parsed from
template <typename T>
class wrx_or_fallback
{
  std::variant<T, wrx_string> data;

  explicit wrx_or_fallback(std::variant<T, wrx_string> v) : data(std::move(v)) {}

public:
  static wrx_or_fallback expected(T value)
  {
    return wrx_or_fallback(std::variant<T, wrx_string>(std::in_place_index<0>, std::move(value)));
  }

  static wrx_or_fallback fallback(wrx_string text)
  {
    return wrx_or_fallback(std::variant<T, wrx_string>(std::in_place_index<1>, std::move(text)));
  }

  bool is_expected() const { return data.index() == 0; }
  bool is_fallback() const { return data.index() == 1; }

  const T& get_expected() const { return std::get<0>(data); }
  const wrx_string& get_fallback() const { return std::get<1>(data); }

  bool operator==(const wrx_or_fallback& other) const { return data == other.data; }
  bool operator!=(const wrx_or_fallback& other) const { return !(data == other.data); }
  // expected values sort before fallbacks
  bool operator<(const wrx_or_fallback& other) const { return data < other.data; }
};

// A single code or a code with its name
template <typename A, typename B = A>
class wrx_single_or_pair
{
  std::variant<A, std::pair<A, B>> data;

  explicit wrx_single_or_pair(std::variant<A, std::pair<A, B>> v) : data(std::move(v)) {}

public:
  static wrx_single_or_pair single(A a)
  {
    return wrx_single_or_pair(std::variant<A, std::pair<A, B>>(std::in_place_index<0>, std::move(a)));
  }

  static wrx_single_or_pair pair(A a, B b)
  {
    return wrx_single_or_pair(std::variant<A, std::pair<A, B>>(
      std::in_place_index<1>, std::make_pair(std::move(a), std::move(b))));
  }

  bool is_pair() const { return data.index() == 1; }

  const A& first() const
  {
    return is_pair() ? std::get<1>(data).first : std::get<0>(data);
  }

  // only valid for pairs
  const B& second() const { return std::get<1>(data).second; }

  bool operator==(const wrx_single_or_pair& other) const { return data == other.data; }
  bool operator!=(const wrx_single_or_pair& other) const { return !(data == other.data); }
};

// "Gemarkung, Flur", register district and field number
struct wrx_land_record
{
  wrx_string district;
  uint32_t field = 0;

  bool operator==(const wrx_land_record& other) const { return district == other.district && field == other.field; }
  bool operator<(const wrx_land_record& other) const
  {
    if (district < other.district) return true;
    if (other.district < district) return false;
    return field < other.field;
  }
};

struct wrx_ph_values
{
  std::optional<uint64_t> min;
  std::optional<uint64_t> max;
};

struct wrx_dam_targets
{
  std::optional<wrx_quantity> default_level;
  std::optional<wrx_quantity> steady;   // "Dauerstau"
  std::optional<wrx_quantity> max;      // "Höchststau"

  bool empty() const { return !default_level && !steady && !max; }
};

typedef wrx_rate<double> wrx_rate_value;
typedef std::set<wrx_or_fallback<wrx_rate_value>> wrx_rate_record;
typedef std::pair<uint64_t, wrx_string> wrx_numbered_name;

#endif // WRX_VALUE_TYPES_H
