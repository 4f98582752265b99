#pragma once

#include "color.hpp"
#include "geometry.hpp"
#include "shape.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace saftbar {

// Server side resource ids, same width as xcb's.
using xid_t = uint32_t;
using drawable_t = xid_t;
using gcontext_t = xid_t;

// Visible window and the pixmap it is painted from.
struct surface_t {
  xid_t window;
  xid_t pixmap;
};

class geometry_provider {
public:
  virtual ~geometry_provider() = default;
  // Areas of the active outputs, unfiltered.
  virtual std::vector<rect_t> query_outputs () = 0;
};

class surface_provider {
public:
  virtual ~surface_provider() = default;
  // A window of the given height at the top (or bottom) of region.
  virtual surface_t create_surface (const rect_t& region, uint32_t height, bool bottom) = 0;
  virtual void set_dock_hints (const surface_t& surface, uint32_t x, uint32_t width,
      uint32_t height, const std::string& name, bool bottom) = 0;
  virtual void map_surface (const surface_t& surface) = 0;
  virtual void destroy_surface (const surface_t& surface) = 0;
};

class gc_provider {
public:
  virtual ~gc_provider() = default;
  // A context drawing with the packed pixel value as foreground, usable on
  // drawables of the same depth as reference.
  virtual gcontext_t create_gc (drawable_t reference, uint32_t pixel) = 0;
  virtual void free_gc (gcontext_t gc) = 0;
};

class pixel_surface {
public:
  virtual ~pixel_surface() = default;
  virtual void fill_rect (drawable_t d, gcontext_t gc, uint32_t x, uint32_t y, uint32_t w, uint32_t h) = 0;
  virtual void fill_poly (drawable_t d, gcontext_t gc, const polygon_t& points) = 0;
  virtual void copy_area (drawable_t src, drawable_t dst, gcontext_t gc, uint32_t w, uint32_t h) = 0;
  // Sends everything queued and reports the first rejected request.
  virtual void flush () = 0;
};

class text_metrics {
public:
  virtual ~text_metrics() = default;
  // Advance width of the utf-8 run in pixels.
  virtual uint32_t measure (const std::string& text) = 0;
  virtual uint32_t ascent () const = 0;
  virtual uint32_t descent () const = 0;
  virtual void draw (const std::string& text, drawable_t d, rgba_t color, uint32_t baseline, uint32_t x) = 0;
};

// Everything the bar needs from the display server.
class backend : public geometry_provider, public surface_provider, public gc_provider,
    public pixel_surface, public text_metrics {
};

struct event_t {
  enum kind_t { redraw, button, key, other, interrupted, closed };

  kind_t kind;
  xid_t window;
  uint32_t x;
  uint32_t detail;
};

class event_source {
public:
  virtual ~event_source() = default;
  // Blocks until the next event arrives.
  virtual event_t next_event () = 0;
};

}
