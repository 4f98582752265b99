#pragma once

#include <cstdint>
#include <functional>

namespace saftbar {

// Pixel value as the 32 bit visual expects it: a<<24 | r<<16 | g<<8 | b.
// The channel overlay only gives that packing on little endian hosts.
static_assert(__BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__, "rgba_t assumes a little endian host");

union rgba_t {
  struct {
    uint8_t b;
    uint8_t g;
    uint8_t r;
    uint8_t a;
  };
  uint32_t v;
  rgba_t(uint8_t r, uint8_t g, uint8_t b, uint8_t a) : b(b), g(g), r(r), a(a) {}
  rgba_t() : v(0) {}
  explicit rgba_t(uint32_t v) : v(v) {}

  bool operator== (const rgba_t& other) const { return v == other.v; }
  bool operator!= (const rgba_t& other) const { return v != other.v; }
};

static const rgba_t BLACK = rgba_t(0, 0, 0, 255);
static const rgba_t WHITE = rgba_t(255, 255, 255, 255);

// Parses #rgb, #rrggbb and #aarrggbb, "-" resets to def. The result has its
// alpha premultiplied. On malformed input a warning is logged and def
// returned.
rgba_t parse_color (const char *str, const rgba_t def);

}

namespace std {
template<> struct hash<saftbar::rgba_t> {
  size_t operator() (const saftbar::rgba_t& color) const noexcept {
    return hash<uint32_t>()(color.v);
  }
};
}
