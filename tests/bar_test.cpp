#include "bar.hpp"
#include "error.hpp"
#include "fake_backend.hpp"

#include <gtest/gtest.h>

using namespace saftbar;

namespace {

const rgba_t red = rgba_t(255, 0, 0, 255);
const rgba_t blue = rgba_t(0, 0, 255, 255);

class bar_test : public ::testing::Test {
protected:
  void SetUp () override {
    backend.outputs = { {1920, 0, 1280, 1024}, {0, 0, 1920, 1080}, {0, 0, 1920, 1080} };
  }

  fake_backend backend;
  bar_options options;
};

}

TEST_F(bar_test, one_surface_per_region) {
  bar b(backend, options);

  ASSERT_EQ(b.monitors().size(), 2u);
  EXPECT_EQ(b.monitors()[0].x, 0u);
  EXPECT_EQ(b.monitors()[0].width, 1920u);
  EXPECT_EQ(b.monitors()[1].x, 1920u);
  EXPECT_EQ(b.monitors()[1].width, 1280u);
  EXPECT_EQ(backend.surface_regions.size(), 2u);
  EXPECT_EQ(backend.mapped.size(), 2u);
  ASSERT_EQ(backend.hints.size(), 2u);
  EXPECT_EQ(backend.hints[0], "saftbar@" + std::to_string(b.monitors()[0].surface.window) + ":0+1920x16");
}

TEST_F(bar_test, height_defaults_to_the_font) {
  bar b(backend, options);
  EXPECT_EQ(b.height(), 16u);

  options.height = 24;
  fake_backend other;
  other.outputs = backend.outputs;
  bar tall(other, options);
  EXPECT_EQ(tall.height(), 24u);
}

TEST_F(bar_test, clear_fills_each_monitor_once) {
  options.clear_color = rgba_t(0x20, 0x20, 0x20, 0xff);
  bar b(backend, options);
  backend.calls.clear();

  b.clear();

  auto rects = backend.of("fill_rect");
  ASSERT_EQ(rects.size(), 2u);
  for (size_t i = 0; i < rects.size(); i++) {
    EXPECT_EQ(rects[i].d, b.monitors()[i].surface.pixmap);
    EXPECT_EQ(rects[i].x, 0u);
    EXPECT_EQ(rects[i].w, b.monitors()[i].width);
    EXPECT_EQ(rects[i].h, 16u);
    EXPECT_EQ(backend.gc_pixels[rects[i].gc], 0xff202020u);
  }
}

TEST_F(bar_test, present_copies_pixmaps_onto_windows) {
  bar b(backend, options);
  backend.calls.clear();

  b.present();
  b.flush();

  auto copies = backend.of("copy_area");
  ASSERT_EQ(copies.size(), 2u);
  for (size_t i = 0; i < copies.size(); i++) {
    EXPECT_EQ(copies[i].d, b.monitors()[i].surface.pixmap);
    EXPECT_EQ(copies[i].x, b.monitors()[i].surface.window);
    EXPECT_EQ(copies[i].w, b.monitors()[i].width);
    EXPECT_EQ(copies[i].h, 16u);
  }
  EXPECT_EQ(backend.calls.back().op, "flush");
}

TEST_F(bar_test, draw_targets_the_monitor_pixmap) {
  bar b(backend, options);
  backend.calls.clear();

  b.draw(1, alignment::right, { content_item{red, blue, text_shape{"hi"}} });

  auto rects = backend.of("fill_rect");
  ASSERT_EQ(rects.size(), 1u);
  EXPECT_EQ(rects[0].d, b.monitors()[1].surface.pixmap);
  EXPECT_EQ(rects[0].x, 1280u - 20u);
}

TEST_F(bar_test, draw_on_missing_monitor_is_a_local_error) {
  bar b(backend, options);
  try {
    b.draw(2, alignment::left, {});
    FAIL() << "expected an error";
  } catch (const error& e) {
    EXPECT_TRUE(e.is_local());
  }
}

TEST_F(bar_test, backend_errors_surface_from_flush) {
  bar b(backend, options);
  backend.fail_flush = true;
  b.present();
  try {
    b.flush();
    FAIL() << "expected an error";
  } catch (const error& e) {
    EXPECT_FALSE(e.is_local());
    EXPECT_EQ(e.code(), 9);
    EXPECT_EQ(e.major_opcode(), 70);
  }
}

TEST_F(bar_test, releases_everything) {
  {
    bar b(backend, options);
    b.draw(0, alignment::left, { content_item{red, blue, text_shape{"x"}} });
  }
  // Two pixmaps and two windows, clear gc plus the blue background
  EXPECT_EQ(backend.destroyed.size(), 4u);
  EXPECT_EQ(backend.freed_gcs.size(), 2u);
}

TEST(bar_without_outputs, renders_nothing) {
  fake_backend backend;
  bar b(backend, bar_options{});

  EXPECT_TRUE(b.monitors().empty());
  b.clear();
  b.present();
  EXPECT_TRUE(backend.of("fill_rect").empty());
  EXPECT_TRUE(backend.of("copy_area").empty());
  EXPECT_TRUE(backend.gc_pixels.empty());
}

TEST(bar_geometry, bar_taller_than_output_fails) {
  fake_backend backend;
  backend.outputs = { {0, 0, 800, 600}, {800, 0, 640, 10} };
  bar_options options;
  options.height = 20;

  EXPECT_THROW({ bar b(backend, options); }, error);
  // The first monitor was already created and has to go again
  EXPECT_EQ(backend.destroyed.size(), 2u);
}
