#pragma once

#include "backend.hpp"
#include "color.hpp"
#include "color_cache.hpp"
#include "shape.hpp"

#include <string>
#include <variant>
#include <vector>

namespace saftbar {

enum class alignment { left, center, right };

struct text_shape {
  std::string text;
};

struct powerline_shape {
  powerline_fill fill;
  powerline_direction direction;
};

struct octagon_shape {
  powerline_fill fill;
  powerline_direction direction;
};

using content_shape = std::variant<text_shape, powerline_shape, octagon_shape>;

content_shape make_separator (powerline_style style, powerline_fill fill, powerline_direction direction);

struct content_item {
  rgba_t fg;
  rgba_t bg;
  content_shape shape;
};

// Where drawing starts for content of the given total width. Content wider
// than the monitor is not clamped, callers must not overflow the monitor.
uint32_t start_offset (alignment align, uint32_t monitor_width, uint32_t content_width);

class layout_engine {
public:
  layout_engine (pixel_surface& surface, text_metrics& text, gc_cache& colors, uint32_t height);

  std::vector<uint32_t> measure (const std::vector<content_item>& items) const;

  // Lays items out on d and draws them: background first, then foreground,
  // one item after the other.
  void draw (drawable_t d, uint32_t monitor_width, alignment align, const std::vector<content_item>& items);

private:
  uint32_t item_width (const content_item& item) const;
  uint32_t baseline () const;
  void fill_shape (drawable_t d, uint32_t x, powerline_style style, powerline_fill fill,
      powerline_direction direction, rgba_t color);

  pixel_surface& surface;
  text_metrics& text;
  gc_cache& colors;
  uint32_t height;
};

}
