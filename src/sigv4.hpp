#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace objxfer {

// Payload hash sent with streamed bodies
constexpr const char* unsigned_payload = "UNSIGNED-PAYLOAD";

struct credentials {
  std::string access_key_id;
  std::string secret_access_key;
  std::optional<std::string> session_token;
};

// Lower case hex encoding
std::string hex_encode(const std::string& data);

// Base64 encoding
std::string base64_encode(const std::string& data);

// Raw SHA-256 digest
std::string sha256(const std::string& data);

// Hex encoded SHA-256 digest
std::string sha256_hex(const std::string& data);

// Raw MD5 digest
std::string md5(const std::string& data);

// Raw HMAC-SHA256
std::string hmac_sha256(const std::string& key, const std::string& data);

// URI encoding as required by AWS: everything but A-Z a-z 0-9 - _ . ~ is
// percent encoded. Slashes are kept unless encode_slash is set.
std::string uri_encode(const std::string& value, bool encode_slash = true);

// 20130524T000000Z
std::string amz_date(std::chrono::system_clock::time_point time);

// 20130524
std::string date_stamp(std::chrono::system_clock::time_point time);

// AWS Signature Version 4 for a single request.
//
// Header names must be lower case. All headers passed in are signed, so they
// must include host, x-amz-date and x-amz-content-sha256.
class sigv4_signer {
  std::string _method;
  std::string _canonical_uri;
  std::map<std::string, std::string> _query;
  std::map<std::string, std::string> _headers;
  std::string _payload_hash;
  std::string _region;
  std::string _service;
  std::chrono::system_clock::time_point _time;

 public:
  sigv4_signer(
      const std::string& method,
      const std::string& canonical_uri,
      const std::map<std::string, std::string>& query,
      const std::map<std::string, std::string>& headers,
      const std::string& payload_hash,
      const std::string& region,
      std::chrono::system_clock::time_point time,
      const std::string& service = "s3");

  std::string canonical_query() const;
  std::string signed_headers() const;
  std::string canonical_request() const;
  std::string credential_scope() const;
  std::string string_to_sign() const;

  // Hex encoded request signature
  std::string signature(const credentials& creds) const;

  // Value of the Authorization header
  std::string authorization(const credentials& creds) const;
};

}  // namespace objxfer
