#include "wrx_config.h"
#include "wrx_env.h"
#include <iostream>

wrx_font_roles::wrx_font_roles()
{
  roles["F1"] = wrx_font_role::label;
  roles["F2"] = wrx_font_role::value;
  roles["F3"] = wrx_font_role::value;
}

void wrx_font_roles::set(const wrx_string& font, wrx_font_role role)
{
  roles[font] = role;
}

wrx_font_role wrx_font_roles::role_of(const wrx_string& font) const
{
  auto it = roles.find(font);
  if (it == roles.end()) {
    return wrx_font_role::none;
  }
  return it->second;
}

void wrx_font_roles::clear()
{
  roles.clear();
}

namespace {

  std::vector<wrx_string> font_list(const wrx_string& raw)
  {
    std::vector<wrx_string> fonts;
    for (const auto& part : raw.split(",")) {
      wrx_string font = part.trim();
      if (!font.empty()) {
        fonts.push_back(font);
      }
    }
    return fonts;
  }

  bool is_true(const wrx_string& raw)
  {
    wrx_string v = raw.trim().lower();
    return v == "1" || v == "true" || v == "yes" || v == "on";
  }

}

wrx_parser_config wrx_parser_config::from_environment()
{
  wrx_parser_config config;

  wrx_string label_fonts = env_or("WRX_LABEL_FONTS", "");
  wrx_string value_fonts = env_or("WRX_VALUE_FONTS", "");
  if (!label_fonts.empty() || !value_fonts.empty()) {
    config.font_roles.clear();
    for (const auto& font : font_list(label_fonts.empty() ? wrx_string("F1") : label_fonts)) {
      config.font_roles.set(font, wrx_font_role::label);
    }
    for (const auto& font : font_list(value_fonts.empty() ? wrx_string("F2,F3") : value_fonts)) {
      config.font_roles.set(font, wrx_font_role::value);
    }
  }

  wrx_string encoding = env_or("WRX_TEXT_ENCODING", "").trim();
  if (!encoding.empty()) {
    config.text_encoding = encoding;
  }

  wrx_string flush = env_or("WRX_TRAILING_USAGE_LOCATION", "").trim().lower();
  if (flush == "non_empty") {
    config.trailing_usage_location = wrx_trailing_flush::non_empty;
  } else if (!flush.empty() && flush != "always") {
    std::cerr << "[CONFIG] Unknown WRX_TRAILING_USAGE_LOCATION '" << flush
              << "', using 'always'" << std::endl;
  }

  wrx_string workers = env_or("WRX_WORKERS", "").trim();
  if (!workers.empty()) {
    uint64_t n = 0;
    if (workers.to_u64(n)) {
      config.workers = static_cast<unsigned>(n);
    } else {
      std::cerr << "[CONFIG] WRX_WORKERS is not a number: " << workers << std::endl;
    }
  }

  config.verbose = is_true(env_or("WRX_VERBOSE", "false"));
  return config;
}
