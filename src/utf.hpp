#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace saftbar {

// Core fonts address glyphs in UCS-2. Sequences of four bytes and more map
// to U+FFFD, bytes that start no valid sequence are passed through.
std::vector<uint16_t> utf8_to_ucs2 (const std::string& text);

}
