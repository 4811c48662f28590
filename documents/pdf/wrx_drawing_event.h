#ifndef WRX_DRAWING_EVENT_H
#define WRX_DRAWING_EVENT_H

#include "../../utils/wrx_string.h"
#include <string>
#include <vector>

enum class wrx_drawing_event_type
{
  begin_text,
  set_position,
  set_font,
  set_fill_color,
  show_text,
  end_text
};

// One text related content stream operator. Only the fields belonging to
// the event type are meaningful.
struct wrx_drawing_event
{
  wrx_drawing_event_type type = wrx_drawing_event_type::begin_text;

  // set_position
  double x = 0;
  double y = 0;

  // set_font
  wrx_string font_family;
  double font_size = 0;

  // set_fill_color
  double r = 0;
  double g = 0;
  double b = 0;

  // show_text, raw string bytes as stored in the content stream
  std::string raw;
  wrx_string encoding;

  static wrx_drawing_event begin_text()
  {
    wrx_drawing_event e;
    e.type = wrx_drawing_event_type::begin_text;
    return e;
  }

  static wrx_drawing_event end_text()
  {
    wrx_drawing_event e;
    e.type = wrx_drawing_event_type::end_text;
    return e;
  }

  static wrx_drawing_event set_position(double x, double y)
  {
    wrx_drawing_event e;
    e.type = wrx_drawing_event_type::set_position;
    e.x = x;
    e.y = y;
    return e;
  }

  static wrx_drawing_event set_font(const wrx_string& family, double size)
  {
    wrx_drawing_event e;
    e.type = wrx_drawing_event_type::set_font;
    e.font_family = family;
    e.font_size = size;
    return e;
  }

  static wrx_drawing_event set_fill_color(double r, double g, double b)
  {
    wrx_drawing_event e;
    e.type = wrx_drawing_event_type::set_fill_color;
    e.r = r;
    e.g = g;
    e.b = b;
    return e;
  }

  static wrx_drawing_event show_text(const std::string& raw, const wrx_string& encoding)
  {
    wrx_drawing_event e;
    e.type = wrx_drawing_event_type::show_text;
    e.raw = raw;
    e.encoding = encoding;
    return e;
  }
};

typedef std::vector<wrx_drawing_event> wrx_page_events;

const char* to_operator_name(wrx_drawing_event_type type);

#endif // WRX_DRAWING_EVENT_H
