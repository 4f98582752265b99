#include "font.hpp"

#include <xcb/xcbext.h>

#include <cstdlib>
#include <sys/uio.h>

namespace saftbar {

font_p
font_load (xcb_connection_t *c, const std::string& pattern)
{
  xcb_font_t font = xcb_generate_id(c);

  xcb_void_cookie_t cookie = xcb_open_font_checked(c, font, pattern.size(), pattern.c_str());
  if (xcb_generic_error_t *err = xcb_request_check(c, cookie)) {
    free(err);
    return nullptr;
  }

  xcb_query_font_reply_t *font_info = xcb_query_font_reply(c, xcb_query_font(c, font), nullptr);
  if (!font_info) {
    xcb_close_font(c, font);
    return nullptr;
  }

  auto ret = std::make_unique<font_t>();
  ret->ptr = font;
  ret->ascent = font_info->font_ascent;
  ret->descent = font_info->font_descent;
  ret->height = font_info->font_ascent + font_info->font_descent;
  ret->width = font_info->max_bounds.character_width;
  ret->min_byte1 = font_info->min_byte1;
  ret->max_byte1 = font_info->max_byte1;
  ret->min_byte2 = font_info->min_char_or_byte2;
  ret->max_byte2 = font_info->max_char_or_byte2;

  // Copy over the width lut as it's part of font_info
  int lut_size = xcb_query_font_char_infos_length(font_info);
  if (lut_size) {
    auto info_ptr = xcb_query_font_char_infos(font_info);
    ret->width_lut = std::vector<xcb_charinfo_t>(info_ptr, info_ptr + lut_size);
  }

  free(font_info);
  return ret;
}

namespace {

// Position of ch in the char info table, -1 if it is outside the font.
long
glyph_index (const font_t& font, uint16_t ch)
{
  const uint8_t byte1 = ch >> 8;
  const uint8_t byte2 = ch & 0xff;

  if (byte1 < font.min_byte1 || byte1 > font.max_byte1)
    return -1;
  if (byte2 < font.min_byte2 || byte2 > font.max_byte2)
    return -1;

  const long columns = font.max_byte2 - font.min_byte2 + 1;
  return (byte1 - font.min_byte1) * columns + (byte2 - font.min_byte2);
}

}

bool
font_has_glyph (const font_t& font, uint16_t ch)
{
  const long i = glyph_index(font, ch);
  if (i < 0)
    return false;

  if (!font.width_lut.empty()) {
    // A truncated table from the server has no glyphs past its end
    if (size_t(i) >= font.width_lut.size())
      return false;
    if (font.width_lut[i].character_width == 0)
      return false;
  }

  return true;
}

int
font_char_width (const font_t& font, uint16_t ch)
{
  if (!font_has_glyph(font, ch))
    return 0;

  return !font.width_lut.empty() ?
    font.width_lut[glyph_index(font, ch)].character_width :
    font.width;
}

font_t *
select_drawable_font (const std::vector<font_p>& fonts, int index, uint16_t ch)
{
  // If the user has specified a font to use, try that first.
  if (index > 0 && size_t(index) <= fonts.size() && font_has_glyph(*fonts[index - 1], ch))
    return fonts[index - 1].get();

  for (auto& font : fonts) {
    if (font_has_glyph(*font, ch))
      return font.get();
  }
  return nullptr;
}

// xcb_poly_text_16 wants the items already encoded, so the request is
// composed here. Taken from 'wmdia' (http://wmdia.sourceforge.net/)
xcb_void_cookie_t
xcb_poly_text_16_simple (xcb_connection_t *c, xcb_drawable_t drawable,
    xcb_gcontext_t gc, int16_t x, int16_t y, uint32_t len, const uint16_t *str)
{
  static const xcb_protocol_request_t xcb_req = {
    5,                // count
    nullptr,          // ext
    XCB_POLY_TEXT_16, // opcode
    1                 // isvoid
  };
  struct iovec xcb_parts[7];
  uint8_t xcb_lendelta[2];
  xcb_void_cookie_t xcb_ret;
  xcb_poly_text_8_request_t xcb_out;

  xcb_out.pad0 = 0;
  xcb_out.drawable = drawable;
  xcb_out.gc = gc;
  xcb_out.x = x;
  xcb_out.y = y;

  xcb_lendelta[0] = len;
  xcb_lendelta[1] = 0;

  xcb_parts[2].iov_base = (char *)&xcb_out;
  xcb_parts[2].iov_len = sizeof(xcb_out);
  xcb_parts[3].iov_base = 0;
  xcb_parts[3].iov_len = -xcb_parts[2].iov_len & 3;

  xcb_parts[4].iov_base = xcb_lendelta;
  xcb_parts[4].iov_len = sizeof(xcb_lendelta);
  xcb_parts[5].iov_base = (char *)str;
  xcb_parts[5].iov_len = len * sizeof(int16_t);

  xcb_parts[6].iov_base = 0;
  xcb_parts[6].iov_len = -(xcb_parts[4].iov_len + xcb_parts[5].iov_len) & 3;

  xcb_ret.sequence = xcb_send_request(c, XCB_REQUEST_CHECKED, xcb_parts + 2, &xcb_req);

  return xcb_ret;
}

}
