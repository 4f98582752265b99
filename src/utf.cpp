#include "utf.hpp"

namespace saftbar {

std::vector<uint16_t>
utf8_to_ucs2 (const std::string& text)
{
  std::vector<uint16_t> out;
  out.reserve(text.size());

  const uint8_t *utf = reinterpret_cast<const uint8_t *>(text.data());
  const uint8_t *end = utf + text.size();

  // Continuation byte or zero if the sequence is cut short
  auto cont = [&](size_t i) -> uint16_t { return utf + i < end ? utf[i] & 0x3f : 0; };

  while (utf < end) {
    uint16_t ucs;
    size_t len;

    // ASCII
    if (utf[0] < 0x80) {
      ucs = utf[0];
      len = 1;
    }
    // Two byte utf8 sequence
    else if ((utf[0] & 0xe0) == 0xc0) {
      ucs = (utf[0] & 0x1f) << 6 | cont(1);
      len = 2;
    }
    // Three byte utf8 sequence
    else if ((utf[0] & 0xf0) == 0xe0) {
      ucs = (utf[0] & 0xf) << 12 | cont(1) << 6 | cont(2);
      len = 3;
    }
    // Four, five and six byte sequences are out of the BMP
    else if ((utf[0] & 0xf8) == 0xf0) {
      ucs = 0xfffd;
      len = 4;
    }
    else if ((utf[0] & 0xfc) == 0xf8) {
      ucs = 0xfffd;
      len = 5;
    }
    else if ((utf[0] & 0xfe) == 0xfc) {
      ucs = 0xfffd;
      len = 6;
    }
    // Not a valid utf-8 sequence
    else {
      ucs = utf[0];
      len = 1;
    }

    out.push_back(ucs);
    utf += (size_t(end - utf) < len) ? size_t(end - utf) : len;
  }

  return out;
}

}
