#include "color_cache.hpp"
#include "common.hpp"
#include "error.hpp"

#include <iomanip>
#include <sstream>

namespace saftbar {

gc_cache::gc_cache (gc_provider& provider, drawable_t reference)
  : provider(provider), reference(reference)
{
}

gc_cache::~gc_cache ()
{
  for (auto& entry : gcs)
    provider.free_gc(entry.second);
}

void
gc_cache::ensure (rgba_t color)
{
  if (gcs.count(color))
    return;

  gcs.emplace(color, provider.create_gc(reference, color.v));
  LG_DBUG("Cached gc for color #" << std::hex << std::setw(8) << std::setfill('0') << color.v << std::dec);
}

gcontext_t
gc_cache::get (rgba_t color) const
{
  auto it = gcs.find(color);
  if (it == gcs.end()) {
    std::ostringstream ss;
    ss << "Color #" << std::hex << std::setw(8) << std::setfill('0') << color.v << " is not cached";
    throw error::local(ss.str());
  }
  return it->second;
}

}
