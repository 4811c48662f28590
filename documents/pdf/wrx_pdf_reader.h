#ifndef WRX_PDF_READER_H
#define WRX_PDF_READER_H

#include "wrx_drawing_event.h"
#include <memory>
#include <vector>

namespace PoDoFo {
  class PdfMemDocument;
  class PdfPage;
}

// A loaded report. Owns the PoDoFo document and turns each page's content
// stream into the text related drawing events.
class wrx_pdf_document
{
private:
  std::unique_ptr<PoDoFo::PdfMemDocument> m_pdf;
  std::vector<char> pdf_data_buffer;  // LoadFromBuffer keeps pointing into this
  wrx_string encoding;
  size_t skipped_operators = 0;

public:
  wrx_pdf_document();
  ~wrx_pdf_document();
  wrx_pdf_document(wrx_pdf_document&& other) noexcept;
  wrx_pdf_document& operator=(wrx_pdf_document&& other) noexcept;

  // Both throw wrx_load_error
  void load_file(const wrx_string& path);
  void load_buffer(const std::string& data);

  bool is_loaded() const { return m_pdf != nullptr; }
  size_t page_count() const;

  // Encoding name attached to every show_text event
  void set_text_encoding(const wrx_string& name) { encoding = name; }
  const wrx_string& text_encoding() const { return encoding; }

  wrx_page_events read_page(size_t index);
  std::vector<wrx_page_events> read_pages();

  // Operators dropped because PoDoFo flagged them or their operands were unusable
  size_t get_skipped_operators() const { return skipped_operators; }

private:
  void read_page_content(PoDoFo::PdfPage& page, wrx_page_events& events);
};

#endif // WRX_PDF_READER_H
