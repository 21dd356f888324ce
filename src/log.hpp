#pragma once

#include "mutex_ostream.hpp"

#include <ostream>
#include <string>

namespace objxfer {

enum class log_level {
  debug = 0,
  info = 1,
  warn = 2,
  error = 3,
  off = 4,
};

// Set log level
void set_log_level(log_level level);

// Parse a log level name (debug, info, warn, error, off)
log_level parse_log_level(const std::string& name);

// Redirect log output, std::cerr by default
void set_log_stream(std::ostream& stream);

// Returns the log stream if enabled, otherwise returns a null stream
mutex_ostream log(log_level level = log_level::info);

// Per task logger.
// Created once per task run and handed to every component taking part in it.
// Each line is tagged with the task type, the task id and the component name.
class logger {
  std::string _name;
  std::string _task_id;
  std::string _task_type;

 public:
  // The task id defaults to the OTF_TASK_ID environment variable
  explicit logger(const std::string& name, const std::string& task_type = "T");
  logger(const std::string& name, const std::string& task_id, const std::string& task_type);

  // Returns a logger for a sub component of the same task
  logger child(const std::string& name) const;

  const std::string& name() const { return _name; }
  const std::string& task_id() const { return _task_id; }
  const std::string& task_type() const { return _task_type; }

  mutex_ostream operator()(log_level level) const;

  mutex_ostream debug() const { return (*this)(log_level::debug); }
  mutex_ostream info() const { return (*this)(log_level::info); }
  mutex_ostream warn() const { return (*this)(log_level::warn); }
  mutex_ostream error() const { return (*this)(log_level::error); }
};

}  // namespace objxfer
