#include "layout.hpp"

#include <numeric>

namespace saftbar {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

}

content_shape
make_separator (powerline_style style, powerline_fill fill, powerline_direction direction)
{
  if (style == powerline_style::octagon)
    return octagon_shape{fill, direction};
  return powerline_shape{fill, direction};
}

uint32_t
start_offset (alignment align, uint32_t monitor_width, uint32_t content_width)
{
  switch (align) {
    case alignment::left: return 0;
    case alignment::center: return (monitor_width - content_width) / 2;
    case alignment::right: return monitor_width - content_width;
  }
  return 0;
}

layout_engine::layout_engine (pixel_surface& surface, text_metrics& text, gc_cache& colors, uint32_t height)
  : surface(surface), text(text), colors(colors), height(height)
{
}

uint32_t
layout_engine::item_width (const content_item& item) const
{
  return std::visit(overloaded {
    [this](const text_shape& s) { return text.measure(s.text); },
    [this](const powerline_shape&) { return shape_width(height, powerline_style::powerline); },
    [this](const octagon_shape&) { return shape_width(height, powerline_style::octagon); },
  }, item.shape);
}

std::vector<uint32_t>
layout_engine::measure (const std::vector<content_item>& items) const
{
  std::vector<uint32_t> widths;
  widths.reserve(items.size());
  for (auto& item : items)
    widths.push_back(item_width(item));
  return widths;
}

uint32_t
layout_engine::baseline () const
{
  // The glyphs are centered when the overhang is even, otherwise they sit
  // half a pixel high.
  const uint32_t font_height = text.ascent() + text.descent();
  if (font_height >= height)
    return text.ascent();
  return (height - font_height) / 2 + text.ascent();
}

void
layout_engine::fill_shape (drawable_t d, uint32_t x, powerline_style style, powerline_fill fill,
    powerline_direction direction, rgba_t color)
{
  const gcontext_t gc = colors.get(color);
  for (auto& poly : shape_polys(height, x, style, fill, direction))
    surface.fill_poly(d, gc, poly);
}

void
layout_engine::draw (drawable_t d, uint32_t monitor_width, alignment align, const std::vector<content_item>& items)
{
  // Every gc of this pass exists before the first fill
  for (auto& item : items) {
    colors.ensure(item.bg);
    if (!std::holds_alternative<text_shape>(item.shape))
      colors.ensure(item.fg);
  }

  const std::vector<uint32_t> widths = measure(items);
  const uint32_t total = std::accumulate(widths.begin(), widths.end(), uint32_t(0));
  uint32_t cursor = start_offset(align, monitor_width, total);

  for (size_t i = 0; i < items.size(); i++) {
    const content_item& item = items[i];
    const uint32_t width = widths[i];

    surface.fill_rect(d, colors.get(item.bg), cursor, 0, width, height);

    std::visit(overloaded {
      [&](const text_shape& s) {
        text.draw(s.text, d, item.fg, baseline(), cursor);
      },
      [&](const powerline_shape& s) {
        fill_shape(d, cursor, powerline_style::powerline, s.fill, s.direction, item.fg);
      },
      [&](const octagon_shape& s) {
        fill_shape(d, cursor, powerline_style::octagon, s.fill, s.direction, item.fg);
      },
    }, item.shape);

    cursor += width;
  }
}

}
