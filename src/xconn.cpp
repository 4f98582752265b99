#include "xconn.hpp"
#include "common.hpp"
#include "error.hpp"
#include "utf.hpp"

#include <xcb/randr.h>
#if WITH_XINERAMA
#include <xcb/xinerama.h>
#endif

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <poll.h>

namespace saftbar {

namespace {

enum {
  NET_WM_WINDOW_TYPE,
  NET_WM_WINDOW_TYPE_DOCK,
  NET_WM_DESKTOP,
  NET_WM_STRUT_PARTIAL,
  NET_WM_STRUT,
  NET_WM_STATE,
  NET_WM_STATE_STICKY,
  NET_WM_STATE_ABOVE,
};

const char *atom_names[] = {
  "_NET_WM_WINDOW_TYPE",
  "_NET_WM_WINDOW_TYPE_DOCK",
  "_NET_WM_DESKTOP",
  "_NET_WM_STRUT_PARTIAL",
  "_NET_WM_STRUT",
  "_NET_WM_STATE",
  // Leave those at the end since are batch-set
  "_NET_WM_STATE_STICKY",
  "_NET_WM_STATE_ABOVE",
};

// PolyText16 carries the length of a text item in one byte
const size_t max_text_item = 254;

}

x_connection::x_connection (bool dock)
  : dock(dock)
{
  c = xcb_connect(nullptr, nullptr);
  if (int err = xcb_connection_has_error(c)) {
    xcb_disconnect(c);
    c = nullptr;
    throw error::connection(err);
  }

  // Grab infos from the first screen
  scr = xcb_setup_roots_iterator(xcb_get_setup(c)).data;

  // Try to get a RGBA visual and build the colormap for that
  visual = get_visual();

  colormap = xcb_generate_id(c);
  try {
    check(xcb_create_colormap_checked(c, XCB_COLORMAP_ALLOC_NONE, colormap, scr->root, visual), "CreateColormap");
  } catch (...) {
    xcb_disconnect(c);
    c = nullptr;
    throw;
  }

  LG_DBUG("Connected, visual " << visual << " depth " << int(depth));
}

x_connection::~x_connection ()
{
  if (!c)
    return;

  if (text_gc)
    xcb_free_gc(c, text_gc);
  for (auto& font : font_list)
    xcb_close_font(c, font->ptr);
  xcb_free_colormap(c, colormap);
  xcb_disconnect(c);
}

xcb_visualid_t
x_connection::get_visual ()
{
  xcb_depth_iterator_t iter = xcb_screen_allowed_depths_iterator(scr);

  // Try to find a RGBA visual
  while (iter.rem) {
    if (iter.data->depth == 32 && xcb_depth_visuals_length(iter.data)) {
      depth = 32;
      return xcb_depth_visuals(iter.data)->visual_id;
    }

    xcb_depth_next(&iter);
  }

  // Fallback to the default one
  LG_WARN("No 32 bit visual, transparency is not available");
  depth = scr->root_depth;
  return scr->root_visual;
}

bool
x_connection::load_font (const std::string& pattern)
{
  font_p font = font_load(c, pattern);
  if (!font) {
    LG_WARN("Could not load font \"" << pattern << "\"");
    return false;
  }

  LG_DBUG("Loaded font \"" << pattern << "\", ascent " << font->ascent << " descent " << font->descent);
  font_list.emplace_back(std::move(font));
  return true;
}

void
x_connection::finish_fonts ()
{
  // Try to load a default font
  if (font_list.empty())
    load_font("fixed");

  // We tried and failed hard, there's something wrong
  if (font_list.empty())
    throw error::local("No usable font");

  // To make the alignment uniform, find maximum height
  int maxh = 0;
  for (auto& font : font_list)
    maxh = std::max(maxh, font->height);
  for (auto& font : font_list)
    font->height = maxh;
}

void
x_connection::set_font_index (int index)
{
  // Otherwise just fallback to the automatic font selection
  if (index != -1 && (index < 1 || size_t(index) > font_list.size())) {
    LG_WARN("Invalid font index " << index);
    index = -1;
  }
  font_index = index;
}

std::vector<rect_t>
x_connection::get_randr_outputs ()
{
  std::vector<rect_t> rects;

  xcb_randr_get_screen_resources_current_reply_t *rres_reply = xcb_randr_get_screen_resources_current_reply(c,
      xcb_randr_get_screen_resources_current(c, scr->root), nullptr);

  if (!rres_reply)
    throw error::local("Failed to get current randr screen resources");

  int num = xcb_randr_get_screen_resources_current_outputs_length(rres_reply);
  xcb_randr_output_t *outputs = xcb_randr_get_screen_resources_current_outputs(rres_reply);

  for (int i = 0; i < num; i++) {
    xcb_randr_get_output_info_reply_t *oi_reply = xcb_randr_get_output_info_reply(c,
        xcb_randr_get_output_info(c, outputs[i], XCB_CURRENT_TIME), nullptr);

    // Output disconnected or not attached to any CRTC ?
    if (!oi_reply || oi_reply->crtc == XCB_NONE || oi_reply->connection != XCB_RANDR_CONNECTION_CONNECTED) {
      free(oi_reply);
      continue;
    }

    xcb_randr_get_crtc_info_reply_t *ci_reply = xcb_randr_get_crtc_info_reply(c,
        xcb_randr_get_crtc_info(c, oi_reply->crtc, XCB_CURRENT_TIME), nullptr);
    free(oi_reply);

    if (!ci_reply) {
      free(rres_reply);
      throw error::local("Failed to get RandR crtc info");
    }

    // RandR reports rotated outputs with their rotated size already
    if (ci_reply->x < 0 || ci_reply->y < 0)
      LG_WARN("Skipping output at negative position " << ci_reply->x << "," << ci_reply->y)
    else if (ci_reply->width && ci_reply->height)
      rects.push_back(rect_t{uint32_t(ci_reply->x), uint32_t(ci_reply->y), ci_reply->width, ci_reply->height});

    free(ci_reply);
  }

  free(rres_reply);
  return rects;
}

#if WITH_XINERAMA
std::vector<rect_t>
x_connection::get_xinerama_outputs ()
{
  std::vector<rect_t> rects;

  xcb_xinerama_query_screens_reply_t *xqs_reply = xcb_xinerama_query_screens_reply(c,
      xcb_xinerama_query_screens_unchecked(c), nullptr);
  if (!xqs_reply)
    throw error::local("Failed to query Xinerama screens");

  for (xcb_xinerama_screen_info_iterator_t iter = xcb_xinerama_query_screens_screen_info_iterator(xqs_reply);
      iter.rem; xcb_xinerama_screen_info_next(&iter)) {
    if (iter.data->x_org < 0 || iter.data->y_org < 0 || !iter.data->width || !iter.data->height)
      continue;
    rects.push_back(rect_t{uint32_t(iter.data->x_org), uint32_t(iter.data->y_org),
        iter.data->width, iter.data->height});
  }

  free(xqs_reply);
  return rects;
}
#endif

std::vector<rect_t>
x_connection::query_outputs ()
{
  // Check if RandR is present
  const xcb_query_extension_reply_t *qe_reply = xcb_get_extension_data(c, &xcb_randr_id);
  if (qe_reply && qe_reply->present)
    return get_randr_outputs();

#if WITH_XINERAMA
  qe_reply = xcb_get_extension_data(c, &xcb_xinerama_id);

  // Check if Xinerama extension is present and active
  if (qe_reply && qe_reply->present) {
    xcb_xinerama_is_active_reply_t *xia_reply = xcb_xinerama_is_active_reply(c, xcb_xinerama_is_active(c), nullptr);
    bool active = xia_reply && xia_reply->state;
    free(xia_reply);

    if (active)
      return get_xinerama_outputs();
  }
#endif

  // If no RandR outputs or Xinerama screens, fall back to using whole screen
  LG_DBUG("Neither RandR nor Xinerama, using the whole screen");
  return { rect_t{0, 0, scr->width_in_pixels, scr->height_in_pixels} };
}

surface_t
x_connection::create_surface (const rect_t& region, uint32_t height, bool bottom)
{
  const int16_t x = region.x;
  const int16_t y = bottom ? region.y + region.h - height : region.y;

  xcb_window_t window = xcb_generate_id(c);
  uint32_t window_values[] = { 0, 0, dock, XCB_EVENT_MASK_EXPOSURE | XCB_EVENT_MASK_BUTTON_PRESS | XCB_EVENT_MASK_KEY_PRESS, colormap };
  check(xcb_create_window_checked(c, depth, window, scr->root,
      x, y, region.w, height, 0,
      XCB_WINDOW_CLASS_INPUT_OUTPUT, visual,
      XCB_CW_BACK_PIXEL | XCB_CW_BORDER_PIXEL | XCB_CW_OVERRIDE_REDIRECT | XCB_CW_EVENT_MASK | XCB_CW_COLORMAP,
      window_values), "CreateWindow");

  xcb_pixmap_t pixmap = xcb_generate_id(c);
  try {
    check(xcb_create_pixmap_checked(c, depth, pixmap, window, region.w, height), "CreatePixmap");
  } catch (...) {
    xcb_destroy_window(c, window);
    throw;
  }

  positions[window] = std::make_pair(x, y);
  return surface_t{window, pixmap};
}

void
x_connection::intern_atoms ()
{
  const int atoms = sizeof(atom_names) / sizeof(char *);
  xcb_intern_atom_cookie_t atom_cookie[atoms];

  // As suggested fetch all the cookies first (yum!) and then retrieve the
  // atoms to exploit the async'ness
  for (int i = 0; i < atoms; i++)
    atom_cookie[i] = xcb_intern_atom(c, 0, strlen(atom_names[i]), atom_names[i]);

  std::vector<xcb_atom_t> list;
  for (int i = 0; i < atoms; i++) {
    xcb_intern_atom_reply_t *atom_reply = xcb_intern_atom_reply(c, atom_cookie[i], nullptr);
    if (!atom_reply) {
      // Drain the remaining replies
      for (int j = i + 1; j < atoms; j++)
        free(xcb_intern_atom_reply(c, atom_cookie[j], nullptr));
      throw error::local(std::string("Failed to intern ") + atom_names[i]);
    }
    list.push_back(atom_reply->atom);
    free(atom_reply);
  }

  atom_list = std::move(list);
}

void
x_connection::set_dock_hints (const surface_t& surface, uint32_t x, uint32_t width,
    uint32_t height, const std::string& name, bool bottom)
{
  if (atom_list.empty())
    intern_atoms();

  // Prepare the strut array
  uint32_t strut[12] = {0};
  if (!bottom) {
    strut[2] = height;
    strut[8] = x;
    strut[9] = x + width - 1;
  } else {
    strut[3]  = height;
    strut[10] = x;
    strut[11] = x + width - 1;
  }
  const uint32_t all_desktops = 0xffffffff;

  // WM_CLASS is instance and class, both null terminated
  const std::string wm_class = name + '\0' + name + '\0';
  const xcb_window_t win = surface.window;

  check(xcb_change_property_checked(c, XCB_PROP_MODE_REPLACE, win, atom_list[NET_WM_WINDOW_TYPE], XCB_ATOM_ATOM, 32, 1, &atom_list[NET_WM_WINDOW_TYPE_DOCK]), "ChangeProperty _NET_WM_WINDOW_TYPE");
  check(xcb_change_property_checked(c, XCB_PROP_MODE_APPEND,  win, atom_list[NET_WM_STATE], XCB_ATOM_ATOM, 32, 2, &atom_list[NET_WM_STATE_STICKY]), "ChangeProperty _NET_WM_STATE");
  check(xcb_change_property_checked(c, XCB_PROP_MODE_REPLACE, win, atom_list[NET_WM_DESKTOP], XCB_ATOM_CARDINAL, 32, 1, &all_desktops), "ChangeProperty _NET_WM_DESKTOP");
  check(xcb_change_property_checked(c, XCB_PROP_MODE_REPLACE, win, atom_list[NET_WM_STRUT_PARTIAL], XCB_ATOM_CARDINAL, 32, 12, strut), "ChangeProperty _NET_WM_STRUT_PARTIAL");
  check(xcb_change_property_checked(c, XCB_PROP_MODE_REPLACE, win, atom_list[NET_WM_STRUT], XCB_ATOM_CARDINAL, 32, 4, strut), "ChangeProperty _NET_WM_STRUT");
  check(xcb_change_property_checked(c, XCB_PROP_MODE_REPLACE, win, XCB_ATOM_WM_NAME, XCB_ATOM_STRING, 8, name.size(), name.c_str()), "ChangeProperty WM_NAME");
  check(xcb_change_property_checked(c, XCB_PROP_MODE_REPLACE, win, XCB_ATOM_WM_CLASS, XCB_ATOM_STRING, 8, wm_class.size(), wm_class.data()), "ChangeProperty WM_CLASS");
}

void
x_connection::map_surface (const surface_t& surface)
{
  check(xcb_map_window_checked(c, surface.window), "MapWindow");

  // Make sure that the window really gets in the place it's supposed to be
  // Some WM such as Openbox need this
  auto it = positions.find(surface.window);
  if (it != positions.end()) {
    uint32_t tmp[] = { uint32_t(it->second.first), uint32_t(it->second.second) };
    check_later(xcb_configure_window_checked(c, surface.window, XCB_CONFIG_WINDOW_X | XCB_CONFIG_WINDOW_Y, tmp), "ConfigureWindow");
  }
}

void
x_connection::destroy_surface (const surface_t& surface)
{
  xcb_free_pixmap(c, surface.pixmap);
  xcb_destroy_window(c, surface.window);
  positions.erase(surface.window);
}

gcontext_t
x_connection::create_gc (drawable_t reference, uint32_t pixel)
{
  xcb_gcontext_t gc = xcb_generate_id(c);
  check(xcb_create_gc_checked(c, gc, reference, XCB_GC_FOREGROUND, &pixel), "CreateGC");
  return gc;
}

void
x_connection::free_gc (gcontext_t gc)
{
  xcb_free_gc(c, gc);
}

void
x_connection::fill_rect (drawable_t d, gcontext_t gc, uint32_t x, uint32_t y, uint32_t w, uint32_t h)
{
  xcb_rectangle_t rect{ int16_t(x), int16_t(y), uint16_t(w), uint16_t(h) };
  check_later(xcb_poly_fill_rectangle_checked(c, d, gc, 1, &rect), "PolyFillRectangle");
}

void
x_connection::fill_poly (drawable_t d, gcontext_t gc, const polygon_t& points)
{
  std::vector<xcb_point_t> pts;
  pts.reserve(points.size());
  for (auto& p : points)
    pts.push_back(xcb_point_t{ int16_t(p.x), int16_t(p.y) });

  check_later(xcb_fill_poly_checked(c, d, gc, XCB_POLY_SHAPE_COMPLEX, XCB_COORD_MODE_ORIGIN,
      pts.size(), pts.data()), "FillPoly");
}

void
x_connection::copy_area (drawable_t src, drawable_t dst, gcontext_t gc, uint32_t w, uint32_t h)
{
  check_later(xcb_copy_area_checked(c, src, dst, gc, 0, 0, 0, 0, w, h), "CopyArea");
}

void
x_connection::flush ()
{
  xcb_flush(c);

  // If connection is in error state, then it has been shut down.
  if (int err = xcb_connection_has_error(c)) {
    pending.clear();
    throw error::connection(err);
  }

  std::vector<std::pair<xcb_void_cookie_t, const char *>> batch;
  batch.swap(pending);

  xcb_generic_error_t *first = nullptr;
  const char *what = nullptr;
  for (auto& req : batch) {
    xcb_generic_error_t *err = xcb_request_check(c, req.first);
    if (!err)
      continue;
    if (first) {
      LG_DBUG(req.second << " failed too, X error " << int(err->error_code));
      free(err);
      continue;
    }
    first = err;
    what = req.second;
  }

  if (first) {
    error e = error::request(what, first->error_code, first->major_code, first->minor_code);
    free(first);
    throw e;
  }
}

uint32_t
x_connection::measure (const std::string& text)
{
  uint32_t width = 0;
  for (uint16_t ch : utf8_to_ucs2(text)) {
    if (const font_t *font = select_drawable_font(font_list, font_index, ch))
      width += font_char_width(*font, ch);
  }
  return width;
}

uint32_t
x_connection::ascent () const
{
  int asc = 0;
  for (auto& font : font_list)
    asc = std::max(asc, font->ascent);
  return asc;
}

uint32_t
x_connection::descent () const
{
  int desc = 0;
  for (auto& font : font_list)
    desc = std::max(desc, font->descent);
  return desc;
}

void
x_connection::draw (const std::string& text, drawable_t d, rgba_t color, uint32_t baseline, uint32_t x)
{
  if (!text_gc) {
    text_gc = xcb_generate_id(c);
    check(xcb_create_gc_checked(c, text_gc, d, XCB_GC_FOREGROUND, &color.v), "CreateGC");
  }

  const std::vector<uint16_t> ucs = utf8_to_ucs2(text);
  font_t *cur_font = nullptr;
  std::vector<uint16_t> run;
  int16_t run_x = x;
  int16_t pos_x = x;

  auto flush_run = [&]() {
    if (run.empty())
      return;
    check_later(xcb_poly_text_16_simple(c, d, text_gc, run_x, baseline, run.size(), run.data()), "PolyText16");
    run.clear();
  };

  for (uint16_t ch : ucs) {
    font_t *font = select_drawable_font(font_list, font_index, ch);
    if (!font)
      continue;

    if (font != cur_font || run.size() == max_text_item) {
      flush_run();
      if (font != cur_font) {
        uint32_t values[] = { color.v, font->ptr };
        check_later(xcb_change_gc_checked(c, text_gc, XCB_GC_FOREGROUND | XCB_GC_FONT, values), "ChangeGC");
        cur_font = font;
      }
      run_x = pos_x;
    }

    // xcb accepts string in UCS-2 BE, so swap
    run.push_back((ch >> 8) | (ch << 8));
    pos_x += font_char_width(*font, ch);
  }

  flush_run();
}

event_t
x_connection::translate (xcb_generic_event_t *ev)
{
  switch (ev->response_type & 0x7F) {
    case 0: {
      // Replies to unchecked requests end up here
      xcb_generic_error_t *err = reinterpret_cast<xcb_generic_error_t *>(ev);
      LG_ERR("X error " << int(err->error_code) << " for request " << int(err->major_code) << "." << err->minor_code);
      return event_t{event_t::other, 0, 0, 0};
    }
    case XCB_EXPOSE: {
      xcb_expose_event_t *expose_ev = reinterpret_cast<xcb_expose_event_t *>(ev);
      if (expose_ev->count == 0)
        return event_t{event_t::redraw, expose_ev->window, 0, 0};
      return event_t{event_t::other, expose_ev->window, 0, 0};
    }
    case XCB_BUTTON_PRESS: {
      xcb_button_press_event_t *press_ev = reinterpret_cast<xcb_button_press_event_t *>(ev);
      return event_t{event_t::button, press_ev->event, uint32_t(std::max<int16_t>(press_ev->event_x, 0)), press_ev->detail};
    }
    case XCB_KEY_PRESS: {
      xcb_key_press_event_t *key_ev = reinterpret_cast<xcb_key_press_event_t *>(ev);
      return event_t{event_t::key, key_ev->event, uint32_t(std::max<int16_t>(key_ev->event_x, 0)), key_ev->detail};
    }
  }
  return event_t{event_t::other, 0, 0, 0};
}

event_t
x_connection::next_event ()
{
  for (;;) {
    if (xcb_generic_event_t *ev = xcb_poll_for_event(c)) {
      event_t e = translate(ev);
      free(ev);
      return e;
    }

    if (xcb_connection_has_error(c))
      return event_t{event_t::closed, 0, 0, 0};

    pollfd pollin = { xcb_get_file_descriptor(c), POLLIN, 0 };
    if (poll(&pollin, 1, -1) < 0) {
      if (errno == EINTR)
        return event_t{event_t::interrupted, 0, 0, 0};
      throw error::local(std::string("poll failed: ") + strerror(errno));
    }
  }
}

void
x_connection::check (xcb_void_cookie_t cookie, const char *what)
{
  if (xcb_generic_error_t *err = xcb_request_check(c, cookie)) {
    error e = error::request(what, err->error_code, err->major_code, err->minor_code);
    free(err);
    throw e;
  }
}

void
x_connection::check_later (xcb_void_cookie_t cookie, const char *what)
{
  pending.emplace_back(cookie, what);
}

}
