#include "geometry.hpp"

#include <algorithm>

namespace saftbar {

bool
rect_inside (const rect_t& inner, const rect_t& outer)
{
  return inner.x >= outer.x && inner.x + inner.w <= outer.x + outer.w &&
    inner.y >= outer.y && inner.y + inner.h <= outer.y + outer.h;
}

bool
rect_less (const rect_t& a, const rect_t& b)
{
  if (a.x != b.x)
    return a.x < b.x;
  return a.y + a.h < b.y + b.h;
}

std::vector<rect_t>
resolve_monitor_regions (const std::vector<rect_t>& outputs)
{
  std::vector<rect_t> valid;

  for (size_t i = 0; i < outputs.size(); i++) {
    bool contained = false;

    for (size_t j = 0; j < outputs.size() && !contained; j++) {
      if (i == j || !rect_inside(outputs[i], outputs[j]))
        continue;
      // Identical clones would knock each other out, keep the earlier one
      contained = outputs[i] != outputs[j] || j < i;
    }

    if (!contained)
      valid.push_back(outputs[i]);
  }

  std::stable_sort(valid.begin(), valid.end(), rect_less);
  return valid;
}

}
