#include "local_handler.hpp"

#include "disposition_engine.hpp"
#include "exception.hpp"
#include "filesystem.hpp"

#include <exception>
#include <optional>
#include <regex>

namespace objxfer {

local_handler::local_handler(const transfer_spec& spec, const logger& log) : _spec(spec), _log(log.child("local")) {
  _spec.validate();
}

bool local_handler::supports_native_copy(const remote_handler& destination) const {
  return destination.type() == backend_type::local;
}

list_result local_handler::list_files(const std::string& directory, const std::string& pattern) {
  std::filesystem::path dir = directory.empty() ? _spec.directory : directory;

  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    _log.debug() << "directory not found: " << dir.string();
    return std::nullopt;
  }

  std::vector<std::filesystem::path> entries = staged_files(dir);
  if (entries.empty()) {
    return std::nullopt;
  }

  std::optional<std::regex> filter;
  if (!pattern.empty()) {
    filter.emplace(pattern);
  }

  remote_file_set files;
  for (const auto& path : entries) {
    std::string filename = path.filename().string();
    _log.debug() << "found file: " << filename;
    if (filter && !std::regex_match(filename, *filter)) {
      continue;
    }

    std::string key = path.string();
    files[key] = remote_object{key, std::filesystem::file_size(path), modified_time(path)};
  }

  return files;
}

int local_handler::copy_files(const std::vector<std::filesystem::path>& files, const std::filesystem::path& directory) {
  int result = 0;

  for (const auto& file : files) {
    std::filesystem::path target = directory / file.filename();
    _log.debug() << "transferring file: " << file.string() << " to " << target.string();
    try {
      std::filesystem::copy_file(file, target, std::filesystem::copy_options::overwrite_existing);
    }
    catch (const std::exception& e) {
      _log.error() << "failed to transfer file: " << file.string() << ": " << e.what();
      result = 1;
    }
  }

  return result;
}

int local_handler::push_files_from_worker(const std::filesystem::path& staging_dir) {
  return copy_files(staged_files(staging_dir), _spec.directory);
}

int local_handler::pull_files_to_worker(
    const std::vector<std::string>& files, const std::filesystem::path& staging_dir) {
  return copy_files(std::vector<std::filesystem::path>(files.begin(), files.end()), staging_dir);
}

int local_handler::transfer_files(const std::vector<std::string>& files, remote_handler& destination) {
  if (!supports_native_copy(destination)) {
    throw unsupported_operation(
        std::string("transfer from ") + to_string(type()) + " to " + to_string(destination.type()) +
        " is not supported");
  }
  return copy_files(std::vector<std::filesystem::path>(files.begin(), files.end()), destination.spec().directory);
}

int local_handler::handle_post_copy_action(const std::vector<std::string>& files) {
  post_copy_action action = _spec.post_copy;

  std::regex pattern;
  if (action.action == post_copy_action_type::move || action.action == post_copy_action_type::rename) {
    std::filesystem::path destination(action.destination);
    if (destination.is_relative()) {
      action.destination = (std::filesystem::path(_spec.directory) / destination).string();
    }
    if (action.action == post_copy_action_type::rename) {
      try {
        pattern = std::regex(action.pattern);
      }
      catch (const std::regex_error& e) {
        _log.error() << "invalid rename pattern: " << action.pattern << ": " << e.what();
        return 1;
      }
    }
  }

  int result = 0;

  for (const auto& file : files) {
    try {
      switch (action.action) {
        case post_copy_action_type::none:
          break;
        case post_copy_action_type::remove:
          _log.debug() << "deleting file: " << file;
          if (!std::filesystem::remove(file)) {
            throw exception("no such file");
          }
          break;
        case post_copy_action_type::move:
        case post_copy_action_type::rename: {
          std::filesystem::path target = disposition_engine::destination_key(file, action, pattern);
          _log.debug() << to_string(action.action) << " " << file << " to " << target.string();
          std::filesystem::rename(file, target);
          break;
        }
      }
    }
    catch (const std::exception& e) {
      _log.error() << "failed to " << to_string(action.action) << " file: " << file << ": " << e.what();
      result = 1;
    }
  }

  return result;
}

int local_handler::move_files_to_final_location(const std::vector<std::string>&) {
  throw unsupported_operation("local_handler::move_files_to_final_location is not implemented");
}

}  // namespace objxfer
