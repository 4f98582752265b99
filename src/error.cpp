#include "error.hpp"

namespace saftbar {

error::error (source_t src, const std::string& msg, uint8_t code, uint8_t major, uint16_t minor)
  : std::runtime_error(msg), src(src), err_code(code), major(major), minor(minor)
{
}

error
error::local (const std::string& msg)
{
  return error(source_t::local, msg);
}

error
error::request (const std::string& what, uint8_t code, uint8_t major, uint16_t minor)
{
  return error(source_t::backend,
      what + " failed: X error " + std::to_string(code)
      + " (request " + std::to_string(major) + "." + std::to_string(minor) + ")",
      code, major, minor);
}

error
error::connection (int code)
{
  // Values of xcb_connection_has_error
  const char *reason;
  switch (code) {
    case 1: reason = "socket, pipe or stream error"; break;
    case 2: reason = "extension not supported"; break;
    case 3: reason = "out of memory"; break;
    case 4: reason = "request length exceeded"; break;
    case 5: reason = "error parsing display string"; break;
    case 6: reason = "invalid screen"; break;
    case 7: reason = "file descriptor passing failed"; break;
    default: reason = "unknown error"; break;
  }
  return error(source_t::backend, std::string("X connection error: ") + reason);
}

}
