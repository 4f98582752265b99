#include "geometry.hpp"

#include <gtest/gtest.h>
#include <random>
#include <vector>

using namespace saftbar;

TEST(geometry, drops_contained_outputs) {
  std::vector<rect_t> outputs = { {0, 0, 100, 100}, {0, 0, 200, 200}, {300, 0, 50, 50} };
  std::vector<rect_t> expected = { {0, 0, 200, 200}, {300, 0, 50, 50} };
  EXPECT_EQ(resolve_monitor_regions(outputs), expected);
}

TEST(geometry, no_outputs_means_no_monitors) {
  EXPECT_TRUE(resolve_monitor_regions({}).empty());
}

TEST(geometry, single_output_survives_itself) {
  std::vector<rect_t> outputs = { {10, 20, 1920, 1080} };
  EXPECT_EQ(resolve_monitor_regions(outputs), outputs);
}

TEST(geometry, identical_clones_leave_one) {
  std::vector<rect_t> outputs = { {0, 0, 1920, 1080}, {1920, 0, 1280, 1024}, {0, 0, 1920, 1080} };
  std::vector<rect_t> expected = { {0, 0, 1920, 1080}, {1920, 0, 1280, 1024} };
  EXPECT_EQ(resolve_monitor_regions(outputs), expected);
}

TEST(geometry, orders_left_to_right) {
  std::vector<rect_t> outputs = { {2560, 0, 1920, 1080}, {0, 0, 2560, 1440} };
  std::vector<rect_t> expected = { {0, 0, 2560, 1440}, {2560, 0, 1920, 1080} };
  EXPECT_EQ(resolve_monitor_regions(outputs), expected);
}

TEST(geometry, stacked_outputs_by_bottom_edge) {
  std::vector<rect_t> outputs = { {0, 1080, 1920, 1080}, {0, 0, 1920, 1080} };
  std::vector<rect_t> expected = { {0, 0, 1920, 1080}, {0, 1080, 1920, 1080} };
  EXPECT_EQ(resolve_monitor_regions(outputs), expected);
}

TEST(geometry, rect_inside) {
  EXPECT_TRUE(rect_inside({10, 10, 10, 10}, {0, 0, 100, 100}));
  EXPECT_TRUE(rect_inside({0, 0, 100, 100}, {0, 0, 100, 100}));
  EXPECT_FALSE(rect_inside({0, 0, 100, 100}, {10, 10, 10, 10}));
  EXPECT_FALSE(rect_inside({90, 0, 20, 20}, {0, 0, 100, 100}));
}

TEST(geometry, random_sets_are_maximal_and_sorted) {
  std::mt19937 rng(1234);
  std::uniform_int_distribution<uint32_t> pos(0, 400);
  std::uniform_int_distribution<uint32_t> size(1, 300);
  std::uniform_int_distribution<int> count(0, 8);

  for (int round = 0; round < 500; round++) {
    std::vector<rect_t> outputs;
    int n = count(rng);
    for (int i = 0; i < n; i++)
      outputs.push_back(rect_t{pos(rng), pos(rng), size(rng), size(rng)});

    std::vector<rect_t> result = resolve_monitor_regions(outputs);
    ASSERT_LE(result.size(), outputs.size());

    for (size_t i = 0; i < result.size(); i++) {
      for (size_t j = 0; j < result.size(); j++) {
        if (i != j)
          EXPECT_FALSE(rect_inside(result[i], result[j]));
      }
    }

    for (size_t i = 1; i < result.size(); i++) {
      const rect_t& a = result[i - 1];
      const rect_t& b = result[i];
      EXPECT_TRUE(a.x < b.x || (a.x == b.x && a.y + a.h <= b.y + b.h));
    }

    // Every dropped output lies within a survivor
    for (auto& out : outputs) {
      bool covered = false;
      for (auto& r : result)
        covered = covered || rect_inside(out, r);
      EXPECT_TRUE(covered);
    }
  }
}
