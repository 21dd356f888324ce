#include "log.hpp"

#include <cstdlib>
#include <iostream>
#include <mutex>
#include <ostream>
#include <stdexcept>
#include <string>

namespace objxfer {

static log_level _log_level = log_level::off;
static std::ostream* _stream = &std::cerr;
static std::mutex _mutex;

void set_log_level(log_level level) { _log_level = level; }

void set_log_stream(std::ostream& stream) {
  std::lock_guard<std::mutex> lock(_mutex);
  _stream = &stream;
}

log_level parse_log_level(const std::string& name) {
  if (name == "debug") return log_level::debug;
  if (name == "info") return log_level::info;
  if (name == "warn" || name == "warning") return log_level::warn;
  if (name == "error") return log_level::error;
  if (name == "off" || name == "none") return log_level::off;
  throw std::invalid_argument("invalid log level: " + name);
}

// Returns the log stream if enabled, otherwise returns a null stream
mutex_ostream log(log_level level) {
  if (level == log_level::off || level < _log_level) {
    return mutex_ostream();
  }

  mutex_ostream stream(*_stream, _mutex);
  switch (level) {
    case log_level::debug:
      stream << "debug - ";
      break;
    case log_level::info:
      stream << "info - ";
      break;
    case log_level::warn:
      stream << "warn - ";
      break;
    case log_level::error:
      stream << "error - ";
      break;
    default:
      break;
  }
  return stream;
}

// logger

static std::string task_id_from_env() {
  const char* id = std::getenv("OTF_TASK_ID");
  return id ? id : "";
}

logger::logger(const std::string& name, const std::string& task_type)
    : logger(name, task_id_from_env(), task_type) {}

logger::logger(const std::string& name, const std::string& task_id, const std::string& task_type)
    : _name(name), _task_id(task_id), _task_type(task_type) {}

logger logger::child(const std::string& name) const { return logger(_name + "." + name, _task_id, _task_type); }

mutex_ostream logger::operator()(log_level level) const {
  mutex_ostream stream = log(level);
  stream << _task_type << ":" << (_task_id.empty() ? "-" : _task_id) << " " << _name << " - ";
  return stream;
}

}  // namespace objxfer
