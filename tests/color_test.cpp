#include "color.hpp"
#include "color_cache.hpp"
#include "error.hpp"
#include "fake_backend.hpp"

#include <gtest/gtest.h>
#include <unordered_set>

using namespace saftbar;

TEST(color, packs_alpha_red_green_blue) {
  EXPECT_EQ(rgba_t(0x11, 0x22, 0x33, 0x44).v, 0x44112233u);
  EXPECT_EQ(BLACK.v, 0xff000000u);
  EXPECT_EQ(WHITE.v, 0xffffffffu);
}

TEST(color, equality_and_hash_follow_the_pixel) {
  EXPECT_EQ(rgba_t(1, 2, 3, 4), rgba_t(0x04010203u));
  EXPECT_NE(rgba_t(1, 2, 3, 4), rgba_t(1, 2, 3, 5));
  EXPECT_EQ(std::hash<rgba_t>()(rgba_t(1, 2, 3, 4)), std::hash<uint32_t>()(0x04010203u));

  std::unordered_set<rgba_t> set = { rgba_t(1, 2, 3, 4), rgba_t(0x04010203u), WHITE };
  EXPECT_EQ(set.size(), 2u);
}

TEST(color, parse_short_and_long_forms) {
  EXPECT_EQ(parse_color("#f00", BLACK).v, 0xffff0000u);
  EXPECT_EQ(parse_color("#00ff00", BLACK).v, 0xff00ff00u);
  EXPECT_EQ(parse_color("#ff0000ff", BLACK).v, 0xff0000ffu);
}

TEST(color, parse_premultiplies_alpha) {
  EXPECT_EQ(parse_color("#80ff0000", BLACK).v, 0x80800000u);
  EXPECT_EQ(parse_color("#00ffffff", WHITE).v, 0u);
}

TEST(color, parse_falls_back_to_default) {
  EXPECT_EQ(parse_color("red", WHITE), WHITE);
  EXPECT_EQ(parse_color("#12345", WHITE), WHITE);
  EXPECT_EQ(parse_color("-", WHITE), WHITE);
  EXPECT_EQ(parse_color(nullptr, BLACK), BLACK);
}

TEST(color, parse_rejects_trailing_text) {
  EXPECT_EQ(parse_color("#fff}rest", WHITE), WHITE);
  EXPECT_EQ(parse_color("-x", WHITE), WHITE);
}

TEST(gc_cache, creates_one_gc_per_color) {
  fake_backend backend;
  gc_cache cache(backend, 5);

  cache.ensure(WHITE);
  cache.ensure(WHITE);
  cache.ensure(rgba_t(1, 2, 3, 255));

  EXPECT_EQ(cache.size(), 2u);
  EXPECT_EQ(backend.gc_pixels.size(), 2u);
  EXPECT_EQ(backend.gc_pixels[cache.get(WHITE)], WHITE.v);
  EXPECT_EQ(backend.gc_pixels[cache.get(rgba_t(1, 2, 3, 255))], 0xff010203u);
  EXPECT_EQ(cache.get(WHITE), cache.get(WHITE));
}

TEST(gc_cache, get_without_ensure_is_a_local_error) {
  fake_backend backend;
  gc_cache cache(backend, 5);
  cache.ensure(WHITE);

  try {
    cache.get(BLACK);
    FAIL() << "expected an error";
  } catch (const error& e) {
    EXPECT_TRUE(e.is_local());
    EXPECT_EQ(e.source(), error::source_t::local);
  }
}

TEST(gc_cache, frees_every_gc) {
  fake_backend backend;
  {
    gc_cache cache(backend, 5);
    cache.ensure(WHITE);
    cache.ensure(BLACK);
  }
  EXPECT_EQ(backend.freed_gcs.size(), 2u);
}

TEST(color, channels_overlay_the_packed_pixel) {
  rgba_t color(0x80112233u);
  EXPECT_EQ(color.a, 0x80);
  EXPECT_EQ(color.r, 0x11);
  EXPECT_EQ(color.g, 0x22);
  EXPECT_EQ(color.b, 0x33);
}
