#ifndef WRX_TEXT_ENCODING_H
#define WRX_TEXT_ENCODING_H

#include "../../utils/wrx_string.h"
#include <memory>
#include <string>

namespace PoDoFo {
  class PdfEncoding;
}

// Decodes single byte PDF string operands to UTF-8 with one of PoDoFo's
// predefined simple encodings. The water right reports use WinAnsiEncoding.
class wrx_text_decoder
{
public:
  // Throws wrx_encoding_error for names PoDoFo has no predefined map for
  explicit wrx_text_decoder(const wrx_string& encoding_name);
  ~wrx_text_decoder();

  wrx_text_decoder(const wrx_text_decoder&) = delete;
  wrx_text_decoder& operator=(const wrx_text_decoder&) = delete;

  wrx_string decode(const std::string& raw) const;

  const wrx_string& name() const { return encoding_name; }

  // WinAnsiEncoding, MacRomanEncoding, MacExpertEncoding, StandardEncoding
  static bool is_supported(const wrx_string& encoding_name);

private:
  wrx_string encoding_name;
  std::unique_ptr<PoDoFo::PdfEncoding> encoding;
};

#endif // WRX_TEXT_ENCODING_H
