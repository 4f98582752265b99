#include "color.hpp"
#include "common.hpp"

#include <cerrno>
#include <cstdlib>

namespace saftbar {

rgba_t
parse_color (const char *str, const rgba_t def)
{
  char *ep;

  if (!str)
    return def;

  // Reset
  if (str[0] == '-' && !str[1])
    return def;

  if (str[0] != '#') {
    LG_WARN("Invalid color specified: " << str);
    return def;
  }

  errno = 0;
  rgba_t tmp = rgba_t(uint32_t(strtoul(str + 1, &ep, 16)));

  if (errno || *ep) {
    LG_WARN("Invalid color specified: " << str);
    return def;
  }

  switch (ep - (str + 1)) {
    case 3:
      // Expand the #rgb format into #rrggbb (aa is set to 0xff)
      tmp.v = (tmp.v & 0xf00) * 0x1100
          | (tmp.v & 0x0f0) * 0x0110
          | (tmp.v & 0x00f) * 0x0011;
      // fall through
    case 6:
      // If the code is in #rrggbb form then assume it's opaque
      tmp.a = 255;
      break;
    case 7:
    case 8:
      // Colors in #aarrggbb format, those need no adjustments
      break;
    default:
      LG_WARN("Invalid color specified: " << str);
      return def;
  }

  // Premultiply the alpha in
  if (tmp.a) {
    return rgba_t(
      uint8_t((tmp.r * tmp.a) / 255),
      uint8_t((tmp.g * tmp.a) / 255),
      uint8_t((tmp.b * tmp.a) / 255),
      tmp.a
    );
  }

  return rgba_t(0U);
}

}
