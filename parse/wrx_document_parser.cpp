#include "wrx_document_parser.h"
#include "wrx_department_parser.h"
#include "wrx_root_parser.h"
#include "wrx_value_grammar.h"
#include <iostream>

wrx_document_parser::wrx_document_parser(const wrx_parser_config& config)
  : config(config)
{
}

wrx_water_right wrx_document_parser::parse(wrx_water_right_no no, wrx_pdf_document& document,
                                           wrx_warnings& warnings) const
{
  document.set_text_encoding(config.text_encoding);
  std::vector<wrx_page_events> pages = document.read_pages();
  if (config.verbose) {
    std::cout << "[PDF] Report " << no << ": " << pages.size() << " pages, "
              << document.get_skipped_operators() << " operators skipped" << std::endl;
  }
  return parse(no, pages, warnings);
}

wrx_water_right wrx_document_parser::parse(wrx_water_right_no no, const std::vector<wrx_page_events>& pages,
                                           wrx_warnings& warnings) const
{
  std::vector<wrx_text_block> blocks = wrx_text_block_assembler::assemble(pages, warnings);
  if (config.verbose) {
    std::cout << "[TEXT BLOCK] Report " << no << ": " << blocks.size() << " blocks" << std::endl;
  }

  wrx_key_value_grouper grouper(config.font_roles, warnings);
  return parse(no, grouper.group(std::move(blocks)));
}

wrx_water_right wrx_document_parser::parse(wrx_water_right_no no, const wrx_key_values& pairs) const
{
  wrx_segmenter segmenter(config.trailing_usage_location);
  wrx_grouped_record record = segmenter.segment(pairs);

  wrx_water_right water_right(no);
  parse_root(record.root, water_right);
  parse_departments(record.departments, water_right);
  water_right.annotation = record.annotation;
  return water_right;
}

namespace {

  const char* const ANNOTATION_LABEL = "Bemerkung:";

  std::optional<uint64_t> zero_is_none(const std::optional<uint64_t>& v)
  {
    if (v && *v == 0) {
      return std::nullopt;
    }
    return v;
  }

}

void post_process(wrx_water_right& water_right, wrx_warnings& warnings)
{
  if (water_right.annotation) {
    wrx_string& annotation = *water_right.annotation;
    wrx_string prefix = wrx_string(ANNOTATION_LABEL) + " ";
    if (annotation == ANNOTATION_LABEL) {
      water_right.annotation.reset();
    } else if (annotation.starts_with(prefix)) {
      annotation = annotation.substr(prefix.size());
    }
  }

  // a registering authority without a granting one granted the right itself
  if (water_right.registering_authority && !water_right.granting_authority) {
    water_right.granting_authority = water_right.registering_authority;
  }

  std::optional<wrx_string>* dates[] = {
    &water_right.valid_until,
    &water_right.valid_from,
    &water_right.initially_granted,
    &water_right.last_change
  };
  for (auto* date : dates) {
    if (!*date) {
      continue;
    }
    if (normalize_date(**date) == wrx_date_result::invalid) {
      warnings.add(wrx_warning_kind::invalid_date_format,
                   "a date in " + wrx_string(std::to_string(water_right.no)) +
                   " has an invalid format: " + **date);
    }
  }

  for (auto& entry : water_right.legal_departments) {
    for (auto& usage_location : entry.second.usage_locations) {
      usage_location.utm_easting = zero_is_none(usage_location.utm_easting);
      usage_location.utm_northing = zero_is_none(usage_location.utm_northing);
    }
  }
}
