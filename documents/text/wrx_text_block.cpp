#include "wrx_text_block.h"

void append_fragment(std::optional<wrx_string>& content, const wrx_string& fragment)
{
  if (fragment.empty()) {
    return;
  }
  if (!content) {
    content = fragment;
    return;
  }

  switch (content->last()) {
    case '-':
    case '/':
      *content += fragment;
      break;
    case '.':
    case ';':
      *content += wrx_string("\n") + fragment;
      break;
    default:
      *content += wrx_string(" ") + fragment;
      break;
  }
}

wrx_text_block_assembler::wrx_text_block_assembler(wrx_warnings& warnings)
  : warnings(warnings)
{
}

const wrx_text_decoder& wrx_text_block_assembler::decoder_for(const wrx_string& encoding)
{
  auto it = decoders.find(encoding);
  if (it == decoders.end()) {
    it = decoders.emplace(encoding, std::make_unique<wrx_text_decoder>(encoding)).first;
  }
  return *it->second;
}

void wrx_text_block_assembler::unexpected(const wrx_drawing_event& event, const char* state)
{
  warnings.add(wrx_warning_kind::unexpected_text_state,
               wrx_string(state) + ", got '" + to_operator_name(event.type) + "'");
}

void wrx_text_block_assembler::consume(const wrx_drawing_event& event)
{
  if (!open) {
    switch (event.type) {
      case wrx_drawing_event_type::begin_text:
        open = wrx_text_block();
        open->page = page;
        break;
      case wrx_drawing_event_type::set_position:
      case wrx_drawing_event_type::set_font:
      case wrx_drawing_event_type::set_fill_color:
      case wrx_drawing_event_type::show_text:
      case wrx_drawing_event_type::end_text:
        unexpected(event, "no text block opened");
        break;
    }
    return;
  }

  wrx_text_block& block = *open;
  switch (event.type) {
    case wrx_drawing_event_type::begin_text:
      unexpected(event, "text block did already begin");
      break;

    // only the first position, font and color of a block count
    case wrx_drawing_event_type::set_position:
      if (!block.x && !block.y) {
        block.x = event.x;
        block.y = event.y;
      }
      break;

    case wrx_drawing_event_type::set_font:
      if (!block.font_family && !block.font_size) {
        block.font_family = event.font_family;
        block.font_size = event.font_size;
      }
      break;

    case wrx_drawing_event_type::set_fill_color:
      if (!block.fill_color) {
        block.fill_color = wrx_fill_color{event.r, event.g, event.b};
      }
      break;

    case wrx_drawing_event_type::show_text:
      append_fragment(block.content, decoder_for(event.encoding).decode(event.raw));
      break;

    case wrx_drawing_event_type::end_text:
      blocks.push_back(std::move(block));
      open.reset();
      break;
  }
}

std::vector<wrx_text_block> wrx_text_block_assembler::finish()
{
  if (open) {
    warnings.add(wrx_warning_kind::unexpected_text_state, "text block never ended, dropped");
    open.reset();
  }

  std::vector<wrx_text_block> out;
  out.swap(blocks);
  return out;
}

std::vector<wrx_text_block> wrx_text_block_assembler::assemble(const std::vector<wrx_page_events>& pages,
                                                               wrx_warnings& warnings)
{
  wrx_text_block_assembler assembler(warnings);
  for (size_t i = 0; i < pages.size(); ++i) {
    assembler.begin_page(i);
    for (const auto& event : pages[i]) {
      assembler.consume(event);
    }
  }
  return assembler.finish();
}

bool wrx_column_index::lookup(double x, size_t& pair_index) const
{
  auto it = last_pair.find(column_of(x));
  if (it == last_pair.end()) {
    return false;
  }
  pair_index = it->second;
  return true;
}
