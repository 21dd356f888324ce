#pragma once

#include <optional>
#include <string>

namespace objxfer {

// Action applied to source objects once they have been transferred
enum class post_copy_action_type {
  none,
  remove,
  move,
  rename,
};

// Parse an action name (delete, move, rename). Empty or "none" is none.
post_copy_action_type parse_post_copy_action(const std::string& name);

const char* to_string(post_copy_action_type type);

struct post_copy_action {
  post_copy_action_type action = post_copy_action_type::none;

  // Destination prefix for move and rename
  std::string destination;

  // Regular expression and replacement applied to the base name on rename
  std::string pattern;
  std::string sub;
};

// Connection settings of an object store endpoint
struct protocol_spec {
  std::optional<std::string> access_key_id;
  std::optional<std::string> secret_access_key;
  std::optional<std::string> session_token;
  std::optional<std::string> region_name;

  // Overrides the default endpoint, e.g. http://localhost:9000
  std::optional<std::string> endpoint_url;

  // Attach the bucket-owner-full-control ACL to uploaded objects
  bool bucket_owner_full_control = true;
};

// One endpoint of a transfer.
// Handlers keep a const copy for their whole lifetime.
struct transfer_spec {
  // Backend name: "s3" or "local"
  std::string backend = "s3";

  // Bucket of the object store. Unused by the local backend.
  std::string bucket;

  // Key prefix in the bucket, or directory for the local backend
  std::string directory;

  protocol_spec protocol;
  post_copy_action post_copy;

  // Returns a copy with absent credentials, region and endpoint taken from
  // the AWS_* environment variables. Explicit values are kept.
  transfer_spec resolve() const;

  // Throws config_error if the transfer spec is incomplete
  void validate() const;
};

}  // namespace objxfer
