#include "sigv4.hpp"

#include "exception.hpp"

#include <ctime>
#include <sstream>
#include <string>
#include <vector>

#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace objxfer {

namespace {

std::string digest(const EVP_MD* md, const std::string& data) {
  unsigned char out[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if (EVP_Digest(data.data(), data.size(), out, &length, md, nullptr) != 1) {
    throw exception("failed to compute message digest");
  }
  return std::string(reinterpret_cast<const char*>(out), length);
}

std::string format_time(std::chrono::system_clock::time_point time, const char* format) {
  std::time_t t = std::chrono::system_clock::to_time_t(time);
  std::tm tm;
  gmtime_r(&t, &tm);
  char buf[32];
  size_t n = std::strftime(buf, sizeof(buf), format, &tm);
  return std::string(buf, n);
}

std::string trim(const std::string& value) {
  size_t begin = value.find_first_not_of(" \t");
  if (begin == std::string::npos) return "";
  size_t end = value.find_last_not_of(" \t");
  return value.substr(begin, end - begin + 1);
}

}  // namespace

std::string hex_encode(const std::string& data) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(data.size() * 2);
  for (unsigned char c : data) {
    out += digits[c >> 4];
    out += digits[c & 0x0f];
  }
  return out;
}

std::string base64_encode(const std::string& data) {
  std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
  int n = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(data.data()), static_cast<int>(data.size()));
  return std::string(reinterpret_cast<const char*>(out.data()), n);
}

std::string sha256(const std::string& data) { return digest(EVP_sha256(), data); }

std::string sha256_hex(const std::string& data) { return hex_encode(sha256(data)); }

std::string md5(const std::string& data) { return digest(EVP_md5(), data); }

std::string hmac_sha256(const std::string& key, const std::string& data) {
  unsigned char out[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
            reinterpret_cast<const unsigned char*>(data.data()), data.size(), out, &length)) {
    throw exception("failed to compute HMAC-SHA256");
  }
  return std::string(reinterpret_cast<const char*>(out), length);
}

std::string uri_encode(const std::string& value, bool encode_slash) {
  static const char digits[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(value.size());
  for (unsigned char c : value) {
    if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' ||
        c == '.' || c == '~' || (c == '/' && !encode_slash)) {
      out += static_cast<char>(c);
    }
    else {
      out += '%';
      out += digits[c >> 4];
      out += digits[c & 0x0f];
    }
  }
  return out;
}

std::string amz_date(std::chrono::system_clock::time_point time) { return format_time(time, "%Y%m%dT%H%M%SZ"); }

std::string date_stamp(std::chrono::system_clock::time_point time) { return format_time(time, "%Y%m%d"); }

// sigv4_signer

sigv4_signer::sigv4_signer(
    const std::string& method,
    const std::string& canonical_uri,
    const std::map<std::string, std::string>& query,
    const std::map<std::string, std::string>& headers,
    const std::string& payload_hash,
    const std::string& region,
    std::chrono::system_clock::time_point time,
    const std::string& service)
    : _method(method),
      _canonical_uri(canonical_uri.empty() ? "/" : canonical_uri),
      _query(query),
      _headers(headers),
      _payload_hash(payload_hash),
      _region(region),
      _service(service),
      _time(time) {}

std::string sigv4_signer::canonical_query() const {
  // Parameters are sorted by their encoded name
  std::map<std::string, std::string> encoded;
  for (const auto& [name, value] : _query) {
    encoded[uri_encode(name)] = uri_encode(value);
  }

  std::string out;
  for (const auto& [name, value] : encoded) {
    if (!out.empty()) out += '&';
    out += name + "=" + value;
  }
  return out;
}

std::string sigv4_signer::signed_headers() const {
  std::string out;
  for (const auto& header : _headers) {
    if (!out.empty()) out += ';';
    out += header.first;
  }
  return out;
}

std::string sigv4_signer::canonical_request() const {
  std::ostringstream ss;
  ss << _method << "\n";
  ss << _canonical_uri << "\n";
  ss << canonical_query() << "\n";
  for (const auto& [name, value] : _headers) {
    ss << name << ":" << trim(value) << "\n";
  }
  ss << "\n";
  ss << signed_headers() << "\n";
  ss << _payload_hash;
  return ss.str();
}

std::string sigv4_signer::credential_scope() const {
  return date_stamp(_time) + "/" + _region + "/" + _service + "/aws4_request";
}

std::string sigv4_signer::string_to_sign() const {
  return "AWS4-HMAC-SHA256\n" + amz_date(_time) + "\n" + credential_scope() + "\n" + sha256_hex(canonical_request());
}

std::string sigv4_signer::signature(const credentials& creds) const {
  std::string key = hmac_sha256("AWS4" + creds.secret_access_key, date_stamp(_time));
  key = hmac_sha256(key, _region);
  key = hmac_sha256(key, _service);
  key = hmac_sha256(key, "aws4_request");
  return hex_encode(hmac_sha256(key, string_to_sign()));
}

std::string sigv4_signer::authorization(const credentials& creds) const {
  return "AWS4-HMAC-SHA256 Credential=" + creds.access_key_id + "/" + credential_scope() +
         ",SignedHeaders=" + signed_headers() + ",Signature=" + signature(creds);
}

}  // namespace objxfer
