#pragma once

#include <cstdint>
#include <vector>

namespace saftbar {

enum class powerline_style { powerline, octagon };
enum class powerline_fill { full, no };
enum class powerline_direction { left, right };

struct point_t {
  uint32_t x, y;

  bool operator== (const point_t& o) const { return x == o.x && y == o.y; }
};

using polygon_t = std::vector<point_t>;

// Horizontal space a separator takes for the given bar height.
uint32_t shape_width (uint32_t height, powerline_style style);

// Polygons of a separator whose left edge sits at xl. Coordinates are
// relative to the top left corner of the bar, height must be at least 1.
std::vector<polygon_t> shape_polys (uint32_t height, uint32_t xl, powerline_style style,
    powerline_fill fill, powerline_direction direction);

}
