#include "config.hpp"
#include "error.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace saftbar;

namespace {

config_t
parse (std::vector<std::string> args)
{
  args.insert(args.begin(), "saftbar");
  std::vector<char *> argv;
  for (auto& arg : args)
    argv.push_back(&arg[0]);
  argv.push_back(nullptr);
  return parse_args(int(args.size()), argv.data());
}

}

TEST(config, defaults) {
  config_t cfg = parse({});
  EXPECT_EQ(cfg.bar.height, 0u);
  EXPECT_FALSE(cfg.bar.bottom);
  EXPECT_EQ(cfg.bar.wm_name, "saftbar");
  EXPECT_EQ(cfg.bar.clear_color, BLACK);
  EXPECT_TRUE(cfg.fonts.empty());
  EXPECT_EQ(cfg.font_index, -1);
  EXPECT_FALSE(cfg.dock);
  EXPECT_FALSE(cfg.help);
}

TEST(config, all_options) {
  config_t cfg = parse({ "-v", "-b", "-d", "-g", "22", "-f", "fixed", "-f", "-misc-fixed-*",
      "-T", "2", "-B", "#102030", "-n", "top" });
  EXPECT_TRUE(cfg.verbose);
  EXPECT_TRUE(cfg.bar.bottom);
  EXPECT_TRUE(cfg.dock);
  EXPECT_EQ(cfg.bar.height, 22u);
  EXPECT_EQ(cfg.fonts, (std::vector<std::string>{ "fixed", "-misc-fixed-*" }));
  EXPECT_EQ(cfg.font_index, 2);
  EXPECT_EQ(cfg.bar.clear_color.v, 0xff102030u);
  EXPECT_EQ(cfg.bar.wm_name, "top");
}

TEST(config, help) {
  EXPECT_TRUE(parse({ "-h" }).help);
}

TEST(config, rejects_bad_input) {
  EXPECT_THROW(parse({ "-g", "tall" }), error);
  EXPECT_THROW(parse({ "-x" }), error);
  EXPECT_THROW(parse({ "-g" }), error);
  EXPECT_THROW(parse({ "stray" }), error);
  EXPECT_THROW(parse({ "-n", "" }), error);
}

TEST(config, can_parse_twice) {
  parse({ "-g", "10" });
  EXPECT_EQ(parse({ "-g", "12" }).bar.height, 12u);
}

TEST(config, rejects_out_of_range_numbers) {
  EXPECT_EQ(parse({ "-g", "65535" }).bar.height, 65535u);
  EXPECT_THROW(parse({ "-g", "65536" }), error);
  EXPECT_THROW(parse({ "-g", "4294967296" }), error);
  EXPECT_THROW(parse({ "-g", "-1" }), error);
  EXPECT_THROW(parse({ "-T", "2147483648" }), error);
}
