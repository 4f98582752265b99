#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace saftbar {

// Every failure the bar reports. Local errors are violated preconditions in
// our own code, backend errors come from the X server or the connection.
class error : public std::runtime_error {
public:
  enum class source_t { local, backend };

  static error local (const std::string& msg);
  static error request (const std::string& what, uint8_t code, uint8_t major, uint16_t minor);
  static error connection (int code);

  source_t source () const { return src; }
  bool is_local () const { return src == source_t::local; }

  // X error code, zero for local and connection errors.
  uint8_t code () const { return err_code; }
  uint8_t major_opcode () const { return major; }
  uint16_t minor_opcode () const { return minor; }

private:
  error (source_t src, const std::string& msg, uint8_t code = 0, uint8_t major = 0, uint16_t minor = 0);

  source_t src;
  uint8_t err_code;
  uint8_t major;
  uint16_t minor;
};

}
