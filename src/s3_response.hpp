#pragma once

#include "object_store.hpp"

#include <optional>
#include <string>
#include <vector>

namespace objxfer {

// <Error> document returned by S3
struct s3_error {
  std::string code;
  std::string message;
};

// Parses a ListObjectsV2 response.
// KeyCount falls back to the number of <Contents> entries when absent.
// Throws remote_error if the body is not a ListBucketResult.
list_page parse_list_page(const std::string& body);

// Parses a DeleteObjects response into the keys that were not deleted
std::vector<delete_failure> parse_delete_result(const std::string& body);

// Returns the error carried by the body, if the body is an <Error> document
std::optional<s3_error> parse_error(const std::string& body);

// CopyObject may report a failure in the body of a 200 response.
// Throws remote_error naming the operation if it did.
void check_copy_result(const std::string& body, const std::string& what);

// Builds a quiet DeleteObjects request body
std::string delete_request_body(const std::vector<std::string>& keys);

}  // namespace objxfer
