#pragma once

#include <cstdint>
#include <vector>

namespace saftbar {

struct rect_t {
  uint32_t x, y, w, h;

  bool operator== (const rect_t& o) const { return x == o.x && y == o.y && w == o.w && h == o.h; }
  bool operator!= (const rect_t& o) const { return !(*this == o); }
};

// Does outer contain inner? Equal rectangles contain each other.
bool rect_inside (const rect_t& inner, const rect_t& outer);

// Left to right, then top to bottom by the bottom edge.
bool rect_less (const rect_t& a, const rect_t& b);

// Drops every output whose area lies within another one (clones, mirrors)
// and orders the rest. Of two identical outputs only the first survives.
std::vector<rect_t> resolve_monitor_regions (const std::vector<rect_t>& outputs);

}
