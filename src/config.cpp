#include "config.hpp"
#include "error.hpp"

#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <getopt.h>

namespace saftbar {

namespace {

unsigned long
parse_number (const char *str, const char *what, unsigned long max)
{
  char *ep;
  errno = 0;
  unsigned long v = strtoul(str, &ep, 10);
  if (errno || ep == str || *ep || *str == '-')
    throw error::local(std::string("Invalid ") + what + " \"" + str + "\"");
  if (v > max)
    throw error::local(std::string("The ") + what + " must not exceed " + std::to_string(max));
  return v;
}

}

config_t
parse_args (int argc, char **argv)
{
  config_t cfg;
  int ch;

  // getopt keeps its position between calls
  optind = 1;
  opterr = 0;

  while ((ch = getopt(argc, argv, "+:hvbdg:f:T:B:n:")) != -1) {
    switch (ch) {
      case 'h': cfg.help = true; break;
      case 'v': cfg.verbose = true; break;
      case 'b': cfg.bar.bottom = true; break;
      case 'd': cfg.dock = true; break;
      case 'g': cfg.bar.height = parse_number(optarg, "bar height", UINT16_MAX); break;
      case 'f': cfg.fonts.emplace_back(optarg); break;
      case 'T': cfg.font_index = int(parse_number(optarg, "font index", INT_MAX)); break;
      case 'B': cfg.bar.clear_color = parse_color(optarg, BLACK); break;
      case 'n': cfg.bar.wm_name = optarg; break;
      case ':':
        throw error::local(std::string("Option -") + char(optopt) + " needs an argument");
      case '?':
      default:
        throw error::local(std::string("Invalid option -") + char(optopt));
    }
  }

  if (optind < argc)
    throw error::local(std::string("Unexpected argument \"") + argv[optind] + "\"");

  if (cfg.bar.wm_name.empty())
    throw error::local("The window name must not be empty");

  return cfg;
}

void
show_help (const char *argv0)
{
  printf ("usage: %s [-h | -v | -b | -d | -g | -f | -T | -B | -n]\n"
      "\t-h Show this help\n"
      "\t-v Print debug output\n"
      "\t-b Put the bar at the bottom of the screen\n"
      "\t-d Force docking (use this if your WM isn't EWMH compliant)\n"
      "\t-g Set the bar height in pixels\n"
      "\t-f Add a font by name, may be given more than once\n"
      "\t-T Use the font with this index (1 based) when it has the glyph\n"
      "\t-B Set the clear color in #AARRGGBB\n"
      "\t-n Set the WM_NAME and WM_CLASS of the bar windows\n", argv0);
}

}
