#include "remote_handler.hpp"

#include "exception.hpp"
#include "local_handler.hpp"
#include "s3_handler.hpp"

#include <memory>

namespace objxfer {

const char* to_string(backend_type type) {
  switch (type) {
    case backend_type::s3:
      return "s3";
    case backend_type::local:
      return "local";
  }
  return "unknown";
}

bool remote_handler::supports_native_copy(const remote_handler&) const { return false; }

// remote_handler::create

std::unique_ptr<remote_handler> remote_handler::create(const transfer_spec& spec, const logger& log) {
  if (spec.backend == "s3") {
    return std::make_unique<s3_handler>(spec, log);
  }
  if (spec.backend == "local") {
    return std::make_unique<local_handler>(spec, log);
  }

  throw config_error("unsupported backend: " + spec.backend);
}

}  // namespace objxfer
