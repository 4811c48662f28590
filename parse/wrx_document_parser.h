#ifndef WRX_DOCUMENT_PARSER_H
#define WRX_DOCUMENT_PARSER_H

#include "../documents/pdf/wrx_pdf_reader.h"
#include "../documents/text/wrx_grouped_record.h"
#include "../model/wrx_water_right.h"
#include "../utils/wrx_config.h"
#include "../utils/wrx_warning.h"

// ============================================================================
// DOCUMENT PARSER
// ============================================================================
//
// Runs the stages of one report strictly in order:
//
//   drawing events -> text blocks -> key-value pairs -> grouped record
//                  -> wrx_water_right
//
// Structural problems throw a wrx_parse_error, anomalies the record survives
// are added to the warnings passed in.
//
// ============================================================================

class wrx_document_parser
{
  wrx_parser_config config;

public:
  explicit wrx_document_parser(const wrx_parser_config& config = wrx_parser_config());

  wrx_water_right parse(wrx_water_right_no no, wrx_pdf_document& document, wrx_warnings& warnings) const;
  wrx_water_right parse(wrx_water_right_no no, const std::vector<wrx_page_events>& pages,
                        wrx_warnings& warnings) const;
  wrx_water_right parse(wrx_water_right_no no, const wrx_key_values& pairs) const;

  const wrx_parser_config& get_config() const { return config; }
};

// Cleanup after enrichment: annotation prefix, granting authority, ISO dates
// and zero UTM coordinates
void post_process(wrx_water_right& water_right, wrx_warnings& warnings);

#endif // WRX_DOCUMENT_PARSER_H
