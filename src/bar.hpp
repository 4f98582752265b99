#pragma once

#include "backend.hpp"
#include "color.hpp"
#include "color_cache.hpp"
#include "layout.hpp"

#include <memory>
#include <string>
#include <vector>

namespace saftbar {

struct monitor_t {
  uint32_t x, y, width;
  surface_t surface;
};

struct bar_options {
  // Zero picks the font height.
  uint32_t height = 0;
  bool bottom = false;
  std::string wm_name = "saftbar";
  rgba_t clear_color = BLACK;
};

// One strip per monitor region. Drawing goes to offscreen pixmaps which
// present() copies onto the windows.
class bar {
public:
  bar (backend& b, const bar_options& options);
  ~bar ();

  bar (const bar&) = delete;
  bar& operator= (const bar&) = delete;

  uint32_t height () const { return bh; }
  const std::vector<monitor_t>& monitors () const { return mon_list; }

  void clear ();
  void draw (size_t monitor_index, alignment align, const std::vector<content_item>& items);
  void present ();
  void flush ();

private:
  void release ();

  backend& b;
  uint32_t bh;
  std::vector<monitor_t> mon_list;
  gcontext_t clear_gc = 0;
  std::unique_ptr<gc_cache> colors;
  std::unique_ptr<layout_engine> engine;
};

}
