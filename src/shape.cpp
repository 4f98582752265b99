#include "shape.hpp"

namespace saftbar {

namespace {

std::vector<polygon_t>
shape_powerline (uint32_t h, uint32_t xl, powerline_direction direction, powerline_fill fill)
{
  // Truncating: for odd heights the upper half is one row taller, which keeps
  // the stroke equally thick at the top and the bottom.
  const uint32_t h_2 = h / 2;
  const uint32_t xr = xl + shape_width(h, powerline_style::powerline);
  const uint32_t yt = 0;
  const uint32_t yb = h;

  if (direction == powerline_direction::left) {
    if (fill == powerline_fill::full)
      return {{ {xl, yt + h_2}, {xl, yb - h_2 - 1}, {xr, yb}, {xr, yt}, {xr - 1, yt} }};

    return {
      { {xl, yt + h_2}, {xl, yt + h_2 + 1}, {xr, yt}, {xr - 1, yt} },
      { {xl, yb - h_2 - 1}, {xr, yb}, {xr, yb - 1}, {xl + 1, yb - h_2 - 1} },
    };
  }

  if (fill == powerline_fill::full)
    return {{ {xl, yb}, {xr, yb - h_2 - 1}, {xr, yt + h_2}, {xl + 1, yt}, {xl, yt} }};

  return {
    { {xl, yt}, {xr, yt + h_2 + 1}, {xr, yt + h_2}, {xl + 1, yt} },
    { {xl, yb}, {xr, yb - h_2 - 1}, {xr - 1, yb - h_2 - 1}, {xl, yb - 1} },
  };
}

std::vector<polygon_t>
shape_octagon (uint32_t h, uint32_t xl, powerline_direction direction, powerline_fill fill)
{
  // One less than the quarter for the cut, exactly a quarter would land on
  // the first row of the straight part.
  const uint32_t h_4 = h / 4;
  const uint32_t xr = xl + shape_width(h, powerline_style::octagon);
  const uint32_t yt = 0;
  const uint32_t yb = h;

  if (direction == powerline_direction::left) {
    if (fill == powerline_fill::full)
      return {{ {xl, yt + h_4}, {xl, yb - h_4 - 1}, {xr, yb}, {xr, yt}, {xr - 1, yt} }};

    return {
      { {xl, yt + h_4}, {xl, yt + h_4 + 1}, {xr, yt}, {xr - 1, yt} },
      { {xl, yt + h_4}, {xl, yb - h_4}, {xl + 1, yb - h_4}, {xl + 1, yt + h_4} },
      { {xl, yb - h_4 - 1}, {xr, yb}, {xr, yb - 1}, {xl + 1, yb - h_4 - 1} },
    };
  }

  if (fill == powerline_fill::full)
    return {{ {xl, yb}, {xr, yb - h_4 - 1}, {xr, yt + h_4}, {xl + 1, yt}, {xl, yt} }};

  return {
    { {xl, yt}, {xr, yt + h_4 + 1}, {xr, yt + h_4}, {xl + 1, yt} },
    { {xr - 1, yt + h_4}, {xr - 1, yb - h_4}, {xr, yb - h_4}, {xr, yt + h_4} },
    { {xl, yb}, {xr, yb - h_4 - 1}, {xr - 1, yb - h_4 - 1}, {xl, yb - 1} },
  };
}

}

uint32_t
shape_width (uint32_t height, powerline_style style)
{
  switch (style) {
    case powerline_style::powerline: return (height + 1) / 2;
    case powerline_style::octagon: return height / 4 + 1;
  }
  return 0;
}

std::vector<polygon_t>
shape_polys (uint32_t height, uint32_t xl, powerline_style style,
    powerline_fill fill, powerline_direction direction)
{
  switch (style) {
    case powerline_style::powerline: return shape_powerline(height, xl, direction, fill);
    case powerline_style::octagon: return shape_octagon(height, xl, direction, fill);
  }
  return {};
}

}
