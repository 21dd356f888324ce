#pragma once

#include <stdexcept>
#include <string>

namespace objxfer {

class exception : public std::runtime_error {
 public:
  explicit exception(const std::string& message) : std::runtime_error(message) {}
};

class unsupported_operation : public exception {
 public:
  explicit unsupported_operation(const std::string& message) : exception(message) {}
};

class config_error : public exception {
 public:
  explicit config_error(const std::string& message) : exception(message) {}
};

// Failed request against an object store.
// status is the HTTP response code, or 0 if no response was received.
class remote_error : public exception {
  long _status;
  std::string _code;

 public:
  remote_error(const std::string& message, long status = 0, const std::string& code = "")
      : exception(message), _status(status), _code(code) {}

  long status() const { return _status; }
  const std::string& code() const { return _code; }
};

}  // namespace objxfer
