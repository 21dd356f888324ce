#pragma once

#include "object_store.hpp"
#include "sigv4.hpp"
#include "url.hpp"

#include <chrono>
#include <cstdio>
#include <map>
#include <memory>
#include <string>

namespace objxfer {

// object_store speaking the S3 REST protocol over libcurl.
//
// Requests are signed with AWS Signature Version 4. With an endpoint override
// buckets are addressed path style (http://host/bucket/key), otherwise
// virtual host style (https://bucket.s3.region.amazonaws.com/key).
// The curl handle is reused across requests and released by close().
class s3_object_store : public object_store {
 public:
  // An empty region defaults to us-east-1
  s3_object_store(const credentials& creds, const std::string& region, const std::string& endpoint_url = "");
  ~s3_object_store() override;

  s3_object_store(const s3_object_store&) = delete;
  s3_object_store& operator=(const s3_object_store&) = delete;

  list_page list_objects(
      const std::string& bucket,
      const std::string& prefix,
      size_t max_keys,
      const std::optional<std::string>& continuation_token) override;

  object_head head_object(const std::string& bucket, const std::string& key) override;

  void upload_file(
      const std::filesystem::path& path,
      const std::string& bucket,
      const std::string& key,
      const upload_options& options) override;

  void download_file(const std::string& bucket, const std::string& key, const std::filesystem::path& path) override;

  void copy_object(
      const std::string& source_bucket,
      const std::string& source_key,
      const std::string& bucket,
      const std::string& key) override;

  std::vector<delete_failure> delete_objects(const std::string& bucket, const std::vector<std::string>& keys) override;

  void close() override;

  const std::string& region() const { return _region; }
  const url& endpoint() const { return _endpoint; }

 private:
  struct request {
    std::string method = "GET";
    std::string bucket;
    std::string key;
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers;
    std::string body;
    const std::filesystem::path* upload = nullptr;
    FILE* download = nullptr;
  };

  struct response {
    long status = 0;
    std::string body;
    std::map<std::string, std::string> headers;
  };

  // Signs and sends the request. Throws remote_error on transport errors and
  // on non 2xx responses.
  response perform(const request& req);

  std::string host(const std::string& bucket) const;
  std::string canonical_uri(const std::string& bucket, const std::string& key) const;

 private:
  credentials _credentials;
  std::string _region;
  url _endpoint;
  class curl_handle;
  std::unique_ptr<curl_handle> _curl;
};

// Parse an RFC 1123 date as used in HTTP headers
std::chrono::system_clock::time_point parse_http_date(const std::string& date);

}  // namespace objxfer
