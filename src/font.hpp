#pragma once

#include <xcb/xcb.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace saftbar {

struct font_t {
  xcb_font_t ptr;
  int ascent, descent, height, width;
  // Glyph rows (first byte) and columns (second byte) the font covers.
  // Single byte fonts have a single row 0.
  uint8_t min_byte1, max_byte1;
  uint16_t min_byte2, max_byte2;
  // Row major, one entry per column of every row. Empty when all glyphs
  // share the same metrics.
  std::vector<xcb_charinfo_t> width_lut;
};
using font_p = std::unique_ptr<font_t>;

// Opens the core font matching pattern, nullptr if the server has none.
font_p font_load (xcb_connection_t *c, const std::string& pattern);

bool font_has_glyph (const font_t& font, uint16_t ch);
// Advance width of ch, 0 when the font has no such glyph.
int font_char_width (const font_t& font, uint16_t ch);

// The font forced by index (1 based, -1 for automatic) if it has the glyph,
// otherwise the first one that does. nullptr if no font can draw ch.
font_t *select_drawable_font (const std::vector<font_p>& fonts, int index, uint16_t ch);

// PolyText16 with a single text item of at most 254 big endian characters.
xcb_void_cookie_t xcb_poly_text_16_simple (xcb_connection_t *c, xcb_drawable_t drawable,
    xcb_gcontext_t gc, int16_t x, int16_t y, uint32_t len, const uint16_t *str);

}
