#pragma once

#include <iostream>

namespace saftbar {

// Set by -v, gates LG_DBUG.
extern bool verbose;

}

#define LG_ERR(expr) { std::cerr << "saftbar: error: " << expr << std::endl; }
#define LG_WARN(expr) { std::cerr << "saftbar: warning: " << expr << std::endl; }
#define LG_INFO(expr) { std::cerr << "saftbar: " << expr << std::endl; }
#define LG_DBUG(expr) { if (saftbar::verbose) std::cerr << "saftbar: debug: " << expr << std::endl; }
