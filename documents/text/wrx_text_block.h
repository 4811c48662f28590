#ifndef WRX_TEXT_BLOCK_H
#define WRX_TEXT_BLOCK_H

#include "../pdf/wrx_drawing_event.h"
#include "../pdf/wrx_text_encoding.h"
#include "../../utils/wrx_warning.h"
#include <map>
#include <memory>
#include <optional>
#include <vector>

struct wrx_fill_color
{
  double r = 0;
  double g = 0;
  double b = 0;
};

// Text of one BT/ET region with the first position, font and color set in it
struct wrx_text_block
{
  size_t page = 0;
  std::optional<double> x;
  std::optional<double> y;
  std::optional<wrx_string> font_family;
  std::optional<double> font_size;
  std::optional<wrx_fill_color> fill_color;
  // absent only when every fragment decoded to empty text
  std::optional<wrx_string> content;
};

// Appends a decoded fragment to the pending block content.
// "-" and "/" glue the fragment directly, "." and ";" end a displayed line,
// anything else is separated by a single space.
void append_fragment(std::optional<wrx_string>& content, const wrx_string& fragment);

// Turns drawing events into text blocks. At most one block is open at a time,
// events arriving in the wrong state are dropped with a warning.
class wrx_text_block_assembler
{
  wrx_warnings& warnings;
  std::map<wrx_string, std::unique_ptr<wrx_text_decoder>> decoders;
  std::optional<wrx_text_block> open;
  std::vector<wrx_text_block> blocks;
  size_t page = 0;

public:
  explicit wrx_text_block_assembler(wrx_warnings& warnings);

  // Blocks started after this call belong to the given page
  void begin_page(size_t page_index) { page = page_index; }

  void consume(const wrx_drawing_event& event);

  // Returns the finished blocks. A block still open is dropped with a warning.
  std::vector<wrx_text_block> finish();

  static std::vector<wrx_text_block> assemble(const std::vector<wrx_page_events>& pages, wrx_warnings& warnings);

private:
  const wrx_text_decoder& decoder_for(const wrx_string& encoding);
  void unexpected(const wrx_drawing_event& event, const char* state);
};

// Most recent key-value pair per column. Columns are x coordinates truncated
// to whole points, so fragments on a following page in the same visual column
// find the pair they continue.
class wrx_column_index
{
  std::map<long, size_t> last_pair;
public:
  static long column_of(double x) { return static_cast<long>(x); }

  void record(double x, size_t pair_index) { last_pair[column_of(x)] = pair_index; }
  bool lookup(double x, size_t& pair_index) const;

  size_t size() const { return last_pair.size(); }
  void clear() { last_pair.clear(); }
};

#endif // WRX_TEXT_BLOCK_H
