#include "bar.hpp"
#include "common.hpp"
#include "config.hpp"
#include "error.hpp"
#include "xconn.hpp"

#include <csignal>
#include <cstdlib>
#include <memory>

using namespace saftbar;

namespace {

volatile sig_atomic_t quit = 0;

void
sighandle (int signal)
{
  if (signal == SIGINT || signal == SIGTERM)
    quit = 1;
}

const rgba_t red = rgba_t(255, 0, 0, 255);
const rgba_t green = rgba_t(0, 255, 0, 255);
const rgba_t blue = rgba_t(0, 0, 255, 255);
const rgba_t black = BLACK;
const rgba_t white = WHITE;

content_item
sep (rgba_t fg, rgba_t bg, powerline_style style, powerline_fill fill, powerline_direction dir)
{
  return content_item{fg, bg, make_separator(style, fill, dir)};
}

content_item
text (rgba_t fg, rgba_t bg, const std::string& str)
{
  return content_item{fg, bg, text_shape{str}};
}

void
render (bar& b)
{
  using S = powerline_style;
  using F = powerline_fill;
  using D = powerline_direction;

  b.clear();

  for (size_t i = 0; i < b.monitors().size(); i++) {
    if (i == 0) {
      b.draw(i, alignment::left, {
        text(white, red, " saftbar "),
        sep(red, blue, S::powerline, F::full, D::right),
        text(black, blue, " left "),
        sep(red, blue, S::powerline, F::no, D::right),
        text(black, blue, " outline "),
        sep(blue, black, S::powerline, F::full, D::right),
      });
    } else {
      b.draw(i, alignment::left, {
        sep(black, white, S::octagon, F::full, D::right),
        text(black, white, " monitor " + std::to_string(i + 1) + " "),
        sep(white, black, S::octagon, F::full, D::right),
      });
    }

    b.draw(i, alignment::center, {
      sep(white, black, S::octagon, F::no, D::left),
      text(white, black, " center "),
      sep(white, black, S::octagon, F::no, D::right),
    });

    b.draw(i, alignment::right, {
      sep(green, black, S::powerline, F::full, D::left),
      text(red, green, " right "),
      sep(black, green, S::powerline, F::no, D::left),
      text(blue, green, " last "),
    });
  }
}

}

int
main (int argc, char **argv)
{
  config_t cfg;
  try {
    cfg = parse_args(argc, argv);
  } catch (const error& e) {
    LG_ERR(e.what());
    show_help(argv[0]);
    return EXIT_FAILURE;
  }

  if (cfg.help) {
    show_help(argv[0]);
    return EXIT_SUCCESS;
  }
  verbose = cfg.verbose;

  // poll() has to return on the signal, so no SA_RESTART
  struct sigaction sa = {};
  sa.sa_handler = sighandle;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);

  // Declared before the bar, which has to go first
  std::unique_ptr<x_connection> conn;
  std::unique_ptr<bar> b;
  try {
    conn = std::make_unique<x_connection>(cfg.dock);
    for (auto& pattern : cfg.fonts)
      conn->load_font(pattern);
    conn->finish_fonts();
    conn->set_font_index(cfg.font_index);

    b = std::make_unique<bar>(*conn, cfg.bar);
  } catch (const error& e) {
    LG_ERR(e.what());
    return EXIT_FAILURE;
  }

  LG_INFO("Running on " << b->monitors().size() << " monitor(s), bar height " << b->height());

  bool redraw = true;
  while (!quit) {
    if (redraw && !b->monitors().empty()) {
      try {
        render(*b);
        b->present();
        b->flush();
      } catch (const error& e) {
        if (e.is_local()) {
          LG_ERR(e.what());
          return EXIT_FAILURE;
        }
        // Stale frames get redrawn on the next trigger
        LG_ERR("Dropping frame: " << e.what());
      }
    }
    redraw = false;

    event_t ev;
    try {
      ev = conn->next_event();
    } catch (const error& e) {
      LG_ERR(e.what());
      return EXIT_FAILURE;
    }

    switch (ev.kind) {
      case event_t::redraw:
      case event_t::key:
      case event_t::button:
        redraw = true;
        break;
      case event_t::closed:
        LG_ERR("Lost the connection to the X server");
        return EXIT_FAILURE;
      case event_t::interrupted:
      case event_t::other:
        break;
    }
  }

  LG_DBUG("Shutting down");
  return EXIT_SUCCESS;
}
