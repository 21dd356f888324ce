#include "argparser.hpp"
#include "exception.hpp"
#include "log.hpp"
#include "remote_handler.hpp"
#include "transfer_spec.hpp"
#include "version.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

int usage() {
  std::cerr << "objxfer ls [--pattern <regex>] [<prefix>]" << std::endl;
  std::cerr << "objxfer push <staging directory>" << std::endl;
  std::cerr << "objxfer pull <staging directory> <key>..." << std::endl;
  std::cerr << "objxfer copy --dest-bucket <bucket> [--dest-directory <prefix>] <key>..." << std::endl;
  std::cerr << "objxfer post-copy <key>..." << std::endl;
  std::cerr << std::endl;
  std::cerr << "options: --bucket --directory --backend --access-key-id --secret-access-key --region --endpoint"
            << std::endl;
  std::cerr << "         --no-owner-full-control --post-copy-action --post-copy-destination" << std::endl;
  std::cerr << "         --post-copy-pattern --post-copy-sub --task-id --log-level" << std::endl;
  return EXIT_FAILURE;
}

int version() {
  std::cout << "objxfer " << OBJXFER_VERSION << std::endl;
  return EXIT_SUCCESS;
}

std::string tolower(std::string s) {
  // Convert string to lowercase
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string rfc3339(std::chrono::system_clock::time_point time) {
  // Convert time to RFC3339 format
  auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(time);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(time - seconds);
  auto c_time = std::chrono::system_clock::to_time_t(seconds);

  std::tm tm;
  gmtime_r(&c_time, &tm);

  std::stringstream ss;
  ss << std::put_time(&tm, "%FT%T") << '.' << std::setfill('0') << std::setw(3) << millis.count() << 'Z';
  return ss.str();
}

std::optional<std::string> optional_option(const objxfer::argparser& args, const std::string& name) {
  std::string value = args.get_option(name);
  if (value.empty()) return std::nullopt;
  return value;
}

objxfer::transfer_spec spec_from_args(const objxfer::argparser& args, const std::string& bucket_option,
                                      const std::string& directory_option) {
  objxfer::transfer_spec spec;
  spec.backend = args.get_option("--backend");
  spec.bucket = args.get_option(bucket_option);
  spec.directory = args.get_option(directory_option);
  spec.protocol.access_key_id = optional_option(args, "--access-key-id");
  spec.protocol.secret_access_key = optional_option(args, "--secret-access-key");
  spec.protocol.region_name = optional_option(args, "--region");
  spec.protocol.endpoint_url = optional_option(args, "--endpoint");
  spec.protocol.bucket_owner_full_control = !args.has_option("--no-owner-full-control");
  spec.post_copy.action = objxfer::parse_post_copy_action(args.get_option("--post-copy-action"));
  spec.post_copy.destination = args.get_option("--post-copy-destination");
  spec.post_copy.pattern = args.get_option("--post-copy-pattern");
  spec.post_copy.sub = args.get_option("--post-copy-sub");
  return spec;
}

int status(int result) { return result == 0 ? EXIT_SUCCESS : EXIT_FAILURE; }

int cmd_objxfer(const objxfer::argparser& args) {
  if (args.size() < 1) throw std::invalid_argument("missing command argument");

  objxfer::set_log_level(objxfer::parse_log_level(args.get_option("--log-level")));
  objxfer::logger log("objxfer", args.get_option("--task-id"), "T");

  std::unique_ptr<objxfer::remote_handler> handler =
      objxfer::remote_handler::create(spec_from_args(args, "--bucket", "--directory"), log);

  int result = EXIT_FAILURE;

  if (args[0] == "ls") {
    std::string prefix = args.size() > 1 ? args[1] : handler->spec().directory;

    auto files = handler->list_files(prefix, args.get_option("--pattern"));
    if (!files) {
      log.warn() << "no files found under: " << prefix;
      result = EXIT_FAILURE;
    }
    else {
      for (const auto& [key, object] : *files) {
        std::cout << std::setw(12) << object.size << " " << rfc3339(object.modified_time) << " " << key << std::endl;
      }
      result = EXIT_SUCCESS;
    }
  }
  else if (args[0] == "push") {
    if (args.size() < 2) throw std::invalid_argument("missing staging directory argument");

    result = status(handler->push_files_from_worker(args.get_value_path(1)));
  }
  else if (args[0] == "pull") {
    if (args.size() < 2) throw std::invalid_argument("missing staging directory argument");
    std::vector<std::string> keys = args.get_values(2);
    if (keys.empty()) throw std::invalid_argument("missing key argument");

    result = handler->pull_files_to_worker(keys, args.get_value_path(1));
    if (result == 0) {
      result = handler->handle_post_copy_action(keys);
    }
    result = status(result);
  }
  else if (args[0] == "copy") {
    std::vector<std::string> keys = args.get_values(1);
    if (keys.empty()) throw std::invalid_argument("missing key argument");
    if (args.get_option("--dest-bucket").empty() && args.get_option("--backend") == "s3")
      throw std::invalid_argument("missing destination bucket");

    objxfer::transfer_spec dest_spec = spec_from_args(args, "--dest-bucket", "--dest-directory");
    dest_spec.post_copy = objxfer::post_copy_action();
    std::unique_ptr<objxfer::remote_handler> destination = objxfer::remote_handler::create(dest_spec, log);

    result = handler->transfer_files(keys, *destination);
    if (result == 0) {
      result = handler->handle_post_copy_action(keys);
    }
    destination->tidy();
    result = status(result);
  }
  else if (args[0] == "post-copy") {
    std::vector<std::string> keys = args.get_values(1);
    if (keys.empty()) throw std::invalid_argument("missing key argument");

    result = status(handler->handle_post_copy_action(keys));
  }
  else {
    throw std::invalid_argument("unknown command: " + args[0]);
  }

  handler->tidy();
  return result;
}

int main(int argc, char* argv[]) {
  try {
    if (argc < 2) {
      return usage();
    }

    objxfer::argparser args;
    args.set_env_prefix("OBJXFER");
    args.add_option("--backend", "s3");
    args.add_option("--bucket", "");
    args.add_option_alias("--bucket", "-b");
    args.add_option("--directory", "");
    args.add_option_alias("--directory", "-d");
    args.add_option("--access-key-id", "");
    args.add_option("--secret-access-key", "");
    args.add_option("--region", "");
    args.add_option("--endpoint", "");
    args.add_bool_option("--no-owner-full-control");
    args.add_option("--pattern", "");
    args.add_option_alias("--pattern", "-p");
    args.add_option("--post-copy-action", "none");
    args.add_option("--post-copy-destination", "");
    args.add_option("--post-copy-pattern", "");
    args.add_option("--post-copy-sub", "");
    args.add_option("--dest-bucket", "");
    args.add_option("--dest-directory", "");
    args.add_option("--task-id", std::getenv("OTF_TASK_ID") ? std::getenv("OTF_TASK_ID") : "");
    args.add_option("--log-level", "info");
    args.add_option_alias("--log-level", "-l");
    args.add_bool_option("--help");
    args.add_option_alias("--help", "-h");
    args.add_bool_option("--version");
    args.add_option_alias("--version", "-V");
    args.parse(argc, argv);

    if (args.has_option("--help")) return usage();
    if (args.has_option("--version")) return version();

    return cmd_objxfer(args);
  }
  catch (const objxfer::unsupported_operation& e) {
    std::cerr << "error: unsupported operation: " << tolower(e.what()) << std::endl;
    return EXIT_FAILURE;
  }
  catch (const std::exception& e) {
    std::cerr << "error: " << tolower(e.what()) << std::endl;
    return EXIT_FAILURE;
  }
}
