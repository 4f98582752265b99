#pragma once

#include "bar.hpp"

#include <string>
#include <vector>

namespace saftbar {

struct config_t {
  bar_options bar;
  std::vector<std::string> fonts;
  int font_index = -1;
  bool dock = false;
  bool verbose = false;
  bool help = false;
};

// Parses the command line. Throws a local error for malformed options.
config_t parse_args (int argc, char **argv);

void show_help (const char *argv0);

}
