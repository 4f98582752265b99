#include "bar.hpp"
#include "common.hpp"
#include "error.hpp"
#include "geometry.hpp"

namespace saftbar {

bar::bar (backend& b, const bar_options& options)
  : b(b)
{
  bh = options.height ? options.height : b.ascent() + b.descent();
  if (!bh)
    throw error::local("Bar height must not be zero");

  const std::vector<rect_t> regions = resolve_monitor_regions(b.query_outputs());
  if (regions.empty()) {
    LG_WARN("No usable output found, nothing will be drawn");
    return;
  }

  try {
    for (auto& region : regions) {
      if (bh > region.h)
        throw error::local("The bar doesn't fit the output at " + std::to_string(region.x) + "," + std::to_string(region.y));

      surface_t surface = b.create_surface(region, bh, options.bottom);
      mon_list.push_back(monitor_t{region.x, region.y, region.w, surface});
      LG_DBUG("Monitor at " << region.x << "," << region.y << " width " << region.w);
    }

    // For WM that support EWMH atoms
    for (auto& mon : mon_list)
      b.set_dock_hints(mon.surface, mon.x, mon.width, bh, options.wm_name, options.bottom);

    // The pixmaps carry the 32 bit depth, the root window may not
    const drawable_t reference = mon_list.front().surface.pixmap;
    clear_gc = b.create_gc(reference, options.clear_color.v);
    colors = std::make_unique<gc_cache>(b, reference);
    engine = std::make_unique<layout_engine>(b, b, *colors, bh);

    for (auto& mon : mon_list) {
      b.fill_rect(mon.surface.pixmap, clear_gc, 0, 0, mon.width, bh);
      b.map_surface(mon.surface);
    }

    b.flush();
  } catch (...) {
    // The destructor doesn't run for a half built bar
    release();
    throw;
  }
}

bar::~bar ()
{
  release();
}

void
bar::release ()
{
  engine.reset();
  colors.reset();
  if (clear_gc)
    b.free_gc(clear_gc);
  clear_gc = 0;
  for (auto& mon : mon_list)
    b.destroy_surface(mon.surface);
  mon_list.clear();
}

void
bar::clear ()
{
  for (auto& mon : mon_list)
    b.fill_rect(mon.surface.pixmap, clear_gc, 0, 0, mon.width, bh);
}

void
bar::draw (size_t monitor_index, alignment align, const std::vector<content_item>& items)
{
  if (monitor_index >= mon_list.size())
    throw error::local("No monitor with index " + std::to_string(monitor_index));

  const monitor_t& mon = mon_list[monitor_index];
  engine->draw(mon.surface.pixmap, mon.width, align, items);
}

void
bar::present ()
{
  for (auto& mon : mon_list)
    b.copy_area(mon.surface.pixmap, mon.surface.window, clear_gc, mon.width, bh);
}

void
bar::flush ()
{
  b.flush();
}

}
