#include "transfer_spec.hpp"

#include "exception.hpp"

#include <cstdlib>
#include <regex>
#include <string>

namespace objxfer {

post_copy_action_type parse_post_copy_action(const std::string& name) {
  if (name.empty() || name == "none") return post_copy_action_type::none;
  if (name == "delete") return post_copy_action_type::remove;
  if (name == "move") return post_copy_action_type::move;
  if (name == "rename") return post_copy_action_type::rename;
  throw config_error("unknown post copy action: " + name);
}

const char* to_string(post_copy_action_type type) {
  switch (type) {
    case post_copy_action_type::none:
      return "none";
    case post_copy_action_type::remove:
      return "delete";
    case post_copy_action_type::move:
      return "move";
    case post_copy_action_type::rename:
      return "rename";
  }
  return "unknown";
}

static void from_env(std::optional<std::string>& value, const char* name) {
  if (value) return;
  const char* env = std::getenv(name);
  if (env && *env) {
    value = env;
  }
}

transfer_spec transfer_spec::resolve() const {
  transfer_spec resolved = *this;
  from_env(resolved.protocol.access_key_id, "AWS_ACCESS_KEY_ID");
  from_env(resolved.protocol.secret_access_key, "AWS_SECRET_ACCESS_KEY");
  from_env(resolved.protocol.session_token, "AWS_SESSION_TOKEN");
  from_env(resolved.protocol.region_name, "AWS_DEFAULT_REGION");
  from_env(resolved.protocol.region_name, "AWS_REGION");
  from_env(resolved.protocol.endpoint_url, "AWS_ENDPOINT_URL");
  return resolved;
}

void transfer_spec::validate() const {
  if (backend == "s3") {
    if (bucket.empty()) throw config_error("missing bucket");
  }
  else if (backend == "local") {
    if (directory.empty()) throw config_error("missing directory");
  }
  else {
    throw config_error("unknown backend: " + backend);
  }

  switch (post_copy.action) {
    case post_copy_action_type::rename:
      if (post_copy.pattern.empty()) throw config_error("rename requires a pattern");
      try {
        std::regex check(post_copy.pattern);
      }
      catch (const std::regex_error& e) {
        throw config_error("invalid rename pattern: " + post_copy.pattern + ": " + e.what());
      }
      [[fallthrough]];
    case post_copy_action_type::move:
      if (post_copy.destination.empty()) {
        throw config_error(std::string(to_string(post_copy.action)) + " requires a destination");
      }
      break;
    default:
      break;
  }
}

}  // namespace objxfer
