#pragma once

#include "backend.hpp"
#include "font.hpp"

#include <xcb/xcb.h>

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace saftbar {

// The X server side of the bar: one xcb connection implementing every
// backend interface. Drawing requests are sent checked and verified in
// flush(), setup requests are verified right away.
class x_connection : public backend, public event_source {
public:
  // Connects to $DISPLAY. dock sets override redirect on the windows for
  // WMs without EWMH support.
  explicit x_connection (bool dock = false);
  ~x_connection ();

  x_connection (const x_connection&) = delete;
  x_connection& operator= (const x_connection&) = delete;

  // Fonts are tried in load order. Returns false if the server has no font
  // matching pattern.
  bool load_font (const std::string& pattern);
  // Loads "fixed" if nothing was loaded and gives every font the height of
  // the tallest one. Throws if no font could be opened.
  void finish_fonts ();
  // 1 based index into the loaded fonts, -1 for automatic selection.
  void set_font_index (int index);

  // geometry_provider
  std::vector<rect_t> query_outputs () override;

  // surface_provider
  surface_t create_surface (const rect_t& region, uint32_t height, bool bottom) override;
  void set_dock_hints (const surface_t& surface, uint32_t x, uint32_t width,
      uint32_t height, const std::string& name, bool bottom) override;
  void map_surface (const surface_t& surface) override;
  void destroy_surface (const surface_t& surface) override;

  // gc_provider
  gcontext_t create_gc (drawable_t reference, uint32_t pixel) override;
  void free_gc (gcontext_t gc) override;

  // pixel_surface
  void fill_rect (drawable_t d, gcontext_t gc, uint32_t x, uint32_t y, uint32_t w, uint32_t h) override;
  void fill_poly (drawable_t d, gcontext_t gc, const polygon_t& points) override;
  void copy_area (drawable_t src, drawable_t dst, gcontext_t gc, uint32_t w, uint32_t h) override;
  void flush () override;

  // text_metrics
  uint32_t measure (const std::string& text) override;
  uint32_t ascent () const override;
  uint32_t descent () const override;
  void draw (const std::string& text, drawable_t d, rgba_t color, uint32_t baseline, uint32_t x) override;

  // event_source
  event_t next_event () override;

private:
  xcb_visualid_t get_visual ();
  std::vector<rect_t> get_randr_outputs ();
  std::vector<rect_t> get_xinerama_outputs ();
  void intern_atoms ();
  void check (xcb_void_cookie_t cookie, const char *what);
  void check_later (xcb_void_cookie_t cookie, const char *what);
  event_t translate (xcb_generic_event_t *ev);

  xcb_connection_t *c = nullptr;
  xcb_screen_t *scr = nullptr;
  xcb_visualid_t visual = 0;
  uint8_t depth = 0;
  xcb_colormap_t colormap = 0;
  bool dock;

  std::vector<font_p> font_list;
  int font_index = -1;
  xcb_gcontext_t text_gc = 0;

  std::vector<xcb_atom_t> atom_list;
  std::map<xcb_window_t, std::pair<int16_t, int16_t>> positions;
  std::vector<std::pair<xcb_void_cookie_t, const char *>> pending;
};

}
