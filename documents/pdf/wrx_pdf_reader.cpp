#include "wrx_pdf_reader.h"
#include "../../utils/wrx_exceptions.h"

#include <podofo/podofo.h>
#include <fstream>
#include <iostream>
#include <iterator>

using namespace PoDoFo;

const char* to_operator_name(wrx_drawing_event_type type)
{
  switch (type) {
    case wrx_drawing_event_type::begin_text: return "BT";
    case wrx_drawing_event_type::set_position: return "Tm";
    case wrx_drawing_event_type::set_font: return "Tf";
    case wrx_drawing_event_type::set_fill_color: return "rg";
    case wrx_drawing_event_type::show_text: return "Tj";
    case wrx_drawing_event_type::end_text: return "ET";
  }
  return "?";
}

wrx_pdf_document::wrx_pdf_document()
  : encoding("WinAnsiEncoding")
{
}

wrx_pdf_document::~wrx_pdf_document() = default;
wrx_pdf_document::wrx_pdf_document(wrx_pdf_document&& other) noexcept = default;
wrx_pdf_document& wrx_pdf_document::operator=(wrx_pdf_document&& other) noexcept = default;

void wrx_pdf_document::load_file(const wrx_string& path)
{
  std::ifstream file(path.c_str(), std::ios::binary);
  if (!file.is_open()) {
    throw wrx_load_error("could not open report " + path);
  }

  std::string data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  load_buffer(data);
}

void wrx_pdf_document::load_buffer(const std::string& data)
{
  m_pdf.reset();
  pdf_data_buffer.assign(data.begin(), data.end());

  auto pdf = std::make_unique<PdfMemDocument>();
  try {
    bufferview buffer(pdf_data_buffer.data(), pdf_data_buffer.size());
    pdf->LoadFromBuffer(buffer);
  } catch (const std::exception& e) {
    pdf_data_buffer.clear();
    throw wrx_load_error(wrx_string("PDF loading failed: ") + e.what());
  }
  m_pdf = std::move(pdf);
}

size_t wrx_pdf_document::page_count() const
{
  if (!m_pdf) {
    return 0;
  }
  return m_pdf->GetPages().GetCount();
}

std::vector<wrx_page_events> wrx_pdf_document::read_pages()
{
  std::vector<wrx_page_events> pages;
  size_t count = page_count();
  pages.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    pages.push_back(read_page(i));
  }
  return pages;
}

wrx_page_events wrx_pdf_document::read_page(size_t index)
{
  if (!m_pdf) {
    throw wrx_load_error("no report loaded");
  }
  if (index >= page_count()) {
    throw wrx_load_error("page index out of range");
  }

  wrx_page_events events;
  try {
    auto& page = m_pdf->GetPages().GetPageAt(static_cast<unsigned>(index));
    read_page_content(page, events);
  } catch (const PdfError& e) {
    throw wrx_load_error(wrx_string("could not read page content: ") + e.what());
  }
  return events;
}

void wrx_pdf_document::read_page_content(PdfPage& page, wrx_page_events& events)
{
  PdfContentReaderArgs args;
  args.Flags = PdfContentReaderFlags::None;
  PdfContentStreamReader reader(page, args);

  PdfContent content;
  while (reader.TryReadNext(content)) {
    if (content.Type != PdfContentType::Operator) {
      continue;
    }
    if (content.Warnings != PdfContentWarnings::None) {
      skipped_operators++;
      continue;
    }

    // content.Stack is indexed from the last operand
    switch (content.Operator) {
      case PdfOperator::BT:
        events.push_back(wrx_drawing_event::begin_text());
        break;

      case PdfOperator::ET:
        events.push_back(wrx_drawing_event::end_text());
        break;

      case PdfOperator::Tf: {
        if (content.Stack.size() < 2 || !content.Stack[1].IsName() || !content.Stack[0].IsNumberOrReal()) {
          skipped_operators++;
          break;
        }
        std::string family(content.Stack[1].GetName().GetString());
        events.push_back(wrx_drawing_event::set_font(wrx_string(family), content.Stack[0].GetReal()));
        break;
      }

      case PdfOperator::Tm: {
        if (content.Stack.size() < 6 || !content.Stack[1].IsNumberOrReal() || !content.Stack[0].IsNumberOrReal()) {
          skipped_operators++;
          break;
        }
        events.push_back(wrx_drawing_event::set_position(content.Stack[1].GetReal(), content.Stack[0].GetReal()));
        break;
      }

      case PdfOperator::rg: {
        if (content.Stack.size() < 3 || !content.Stack[2].IsNumberOrReal() ||
            !content.Stack[1].IsNumberOrReal() || !content.Stack[0].IsNumberOrReal()) {
          skipped_operators++;
          break;
        }
        events.push_back(wrx_drawing_event::set_fill_color(
          content.Stack[2].GetReal(), content.Stack[1].GetReal(), content.Stack[0].GetReal()));
        break;
      }

      case PdfOperator::Tj:
      case PdfOperator::Quote:
      case PdfOperator::DoubleQuote: {
        if (content.Stack.empty() || !content.Stack[0].IsString()) {
          skipped_operators++;
          break;
        }
        std::string raw(content.Stack[0].GetString().GetRawData());
        events.push_back(wrx_drawing_event::show_text(raw, encoding));
        break;
      }

      case PdfOperator::TJ: {
        if (content.Stack.empty() || !content.Stack[0].IsArray()) {
          skipped_operators++;
          break;
        }
        // kerning numbers carry no text, the string parts form one fragment
        std::string raw;
        const PdfArray& arr = content.Stack[0].GetArray();
        for (unsigned i = 0; i < arr.size(); i++) {
          const PdfObject& item = arr[i];
          if (item.IsString()) {
            raw += std::string(item.GetString().GetRawData());
          }
        }
        events.push_back(wrx_drawing_event::show_text(raw, encoding));
        break;
      }

      default:
        break;
    }
  }
}
