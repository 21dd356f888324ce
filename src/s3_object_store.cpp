#include "s3_object_store.hpp"

#include "exception.hpp"
#include "filesystem.hpp"
#include "s3_response.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>

#include <curl/curl.h>

namespace objxfer {

namespace {

// RAII wrapper for curl header lists
class CURLHeaders {
 public:
  CURLHeaders() = default;
  ~CURLHeaders() {
    if (list_) {
      curl_slist_free_all(list_);
    }
  }

  CURLHeaders(const CURLHeaders&) = delete;
  CURLHeaders& operator=(const CURLHeaders&) = delete;

  void append(const std::string& header) {
    curl_slist* list = curl_slist_append(list_, header.c_str());
    if (!list) {
      throw std::runtime_error("failed to append CURL header");
    }
    list_ = list;
  }

  curl_slist* get() const { return list_; }

 private:
  curl_slist* list_ = nullptr;
};

// Download target. The body is only written to the file for successful
// responses, error documents are kept in memory.
struct DownloadSink {
  CURL* curl;
  FILE* file;
  std::string error_body;
};

struct StringSource {
  const std::string* data;
  size_t offset;
};

// Callback to collect data into a string
size_t StringWriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
  std::string* body = static_cast<std::string*>(userp);
  body->append(static_cast<const char*>(contents), size * nmemb);
  return size * nmemb;
}

// Callback to write data to a file
size_t DownloadWriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
  DownloadSink* sink = static_cast<DownloadSink*>(userp);
  long response_code = 0;
  curl_easy_getinfo(sink->curl, CURLINFO_RESPONSE_CODE, &response_code);
  if (response_code >= 200 && response_code < 300) {
    return fwrite(contents, size, nmemb, sink->file) * size;
  }
  sink->error_body.append(static_cast<const char*>(contents), size * nmemb);
  return size * nmemb;
}

// Callback to read data from a file
size_t FileReadCallback(char* ptr, size_t size, size_t nmemb, void* userp) {
  std::ifstream* file = static_cast<std::ifstream*>(userp);
  file->read(ptr, size * nmemb);
  return file->gcount();
}

// Callback to read data from a string
size_t StringReadCallback(char* ptr, size_t size, size_t nmemb, void* userp) {
  StringSource* source = static_cast<StringSource*>(userp);
  size_t n = std::min(size * nmemb, source->data->size() - source->offset);
  std::memcpy(ptr, source->data->data() + source->offset, n);
  source->offset += n;
  return n;
}

// Callback to collect response headers with lower case names
size_t HeaderCallback(char* buffer, size_t size, size_t nitems, void* userp) {
  auto* headers = static_cast<std::map<std::string, std::string>*>(userp);
  std::string line(buffer, size * nitems);

  size_t colon = line.find(':');
  if (colon != std::string::npos) {
    std::string name = line.substr(0, colon);
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return std::tolower(c); });

    std::string value = line.substr(colon + 1);
    size_t begin = value.find_first_not_of(" \t");
    size_t end = value.find_last_not_of(" \t\r\n");
    value = begin == std::string::npos ? "" : value.substr(begin, end - begin + 1);

    (*headers)[name] = value;
  }

  return size * nitems;
}

std::string s3_path(const std::string& bucket, const std::string& key) { return "s3://" + bucket + "/" + key; }

}  // namespace

// RAII wrapper for CURL
class s3_object_store::curl_handle {
 public:
  curl_handle() : handle_(curl_easy_init()) {
    if (!handle_) {
      throw std::runtime_error("failed to initialize CURL");
    }
  }

  ~curl_handle() {
    if (handle_) {
      curl_easy_cleanup(handle_);
    }
  }

  CURL* get() const { return handle_; }

 private:
  CURL* handle_;
};

std::chrono::system_clock::time_point parse_http_date(const std::string& date) {
  std::tm tm{};
  std::istringstream ss(date);
  ss.imbue(std::locale::classic());
  ss >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
  if (ss.fail()) {
    throw exception("invalid HTTP date: " + date);
  }
  return std::chrono::system_clock::from_time_t(timegm(&tm));
}

s3_object_store::s3_object_store(const credentials& creds, const std::string& region, const std::string& endpoint_url)
    : _credentials(creds), _region(region.empty() ? "us-east-1" : region), _endpoint(endpoint_url) {
  curl_global_init(CURL_GLOBAL_DEFAULT);
  _curl = std::make_unique<curl_handle>();
}

s3_object_store::~s3_object_store() {
  close();
  curl_global_cleanup();
}

void s3_object_store::close() { _curl.reset(); }

std::string s3_object_store::host(const std::string& bucket) const {
  if (!_endpoint.empty()) {
    return _endpoint.host();
  }
  return bucket + ".s3." + _region + ".amazonaws.com";
}

std::string s3_object_store::canonical_uri(const std::string& bucket, const std::string& key) const {
  std::string path = "/" + uri_encode(key, false);
  if (!_endpoint.empty()) {
    if (key.empty()) return "/" + bucket;
    return "/" + bucket + path;
  }
  return path;
}

s3_object_store::response s3_object_store::perform(const request& req) {
  if (!_curl) {
    throw exception("object store client is closed");
  }

  CURL* curl = _curl->get();
  curl_easy_reset(curl);

  auto now = std::chrono::system_clock::now();
  std::string payload_hash = req.upload ? unsigned_payload : sha256_hex(req.body);

  std::map<std::string, std::string> headers = req.headers;
  headers["host"] = host(req.bucket);
  headers["x-amz-date"] = amz_date(now);
  headers["x-amz-content-sha256"] = payload_hash;
  if (_credentials.session_token) {
    headers["x-amz-security-token"] = *_credentials.session_token;
  }

  std::string uri = canonical_uri(req.bucket, req.key);
  sigv4_signer signer(req.method, uri, req.query, headers, payload_hash, _region, now);

  std::string target = (_endpoint.empty() ? "https://" + host(req.bucket) : _endpoint.origin()) + uri;
  std::string query = signer.canonical_query();
  if (!query.empty()) {
    target += "?" + query;
  }

  CURLHeaders header_list;
  for (const auto& [name, value] : headers) {
    header_list.append(name + ": " + value);
  }
  header_list.append("Authorization: " + signer.authorization(_credentials));
  header_list.append("Expect:");

  response resp;
  curl_easy_setopt(curl, CURLOPT_URL, target.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &resp.headers);
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 1L);
  curl_easy_setopt(curl, CURLOPT_VERBOSE, 0L);

  std::ifstream infile;
  StringSource source{&req.body, 0};

  if (req.method == "HEAD") {
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
  }
  else if (req.method == "PUT") {
    curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
    if (req.upload) {
      infile.open(*req.upload, std::ios::binary);
      if (!infile.is_open()) {
        throw exception("failed to open file for reading: " + req.upload->string());
      }
      curl_easy_setopt(curl, CURLOPT_READFUNCTION, FileReadCallback);
      curl_easy_setopt(curl, CURLOPT_READDATA, &infile);
      curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, (curl_off_t)std::filesystem::file_size(*req.upload));
    }
    else {
      curl_easy_setopt(curl, CURLOPT_READFUNCTION, StringReadCallback);
      curl_easy_setopt(curl, CURLOPT_READDATA, &source);
      curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, (curl_off_t)req.body.size());
    }
  }
  else if (req.method == "POST") {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, req.body.data());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t)req.body.size());
  }
  else if (req.method != "GET") {
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, req.method.c_str());
  }

  DownloadSink sink{curl, req.download, ""};
  if (req.download) {
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, DownloadWriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
  }
  else {
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, StringWriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
  }

  std::string what = req.method + " " + s3_path(req.bucket, req.key);

  CURLcode res = curl_easy_perform(curl);
  if (res != CURLE_OK) {
    throw remote_error(what + ": CURL error: " + curl_easy_strerror(res));
  }

  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
  if (resp.status < 200 || resp.status >= 300) {
    const std::string& body = req.download ? sink.error_body : resp.body;
    s3_error error = parse_error(body).value_or(s3_error{});
    std::string code = error.code;
    const std::string& message = error.message;
    if (code.empty()) {
      code = resp.status == 404 ? "NotFound" : "HTTP" + std::to_string(resp.status);
    }
    throw remote_error(
        what + ": HTTP " + std::to_string(resp.status) + ": " + code + (message.empty() ? "" : ": " + message),
        resp.status,
        code);
  }

  return resp;
}

list_page s3_object_store::list_objects(
    const std::string& bucket,
    const std::string& prefix,
    size_t max_keys,
    const std::optional<std::string>& continuation_token) {
  request req;
  req.bucket = bucket;
  req.query["list-type"] = "2";
  req.query["max-keys"] = std::to_string(max_keys);
  if (!prefix.empty()) {
    req.query["prefix"] = prefix;
  }
  if (continuation_token) {
    req.query["continuation-token"] = *continuation_token;
  }

  response resp = perform(req);

  try {
    return parse_list_page(resp.body);
  }
  catch (const remote_error& e) {
    throw remote_error("listing of " + s3_path(bucket, prefix) + ": " + e.what(), resp.status);
  }
}

object_head s3_object_store::head_object(const std::string& bucket, const std::string& key) {
  request req;
  req.method = "HEAD";
  req.bucket = bucket;
  req.key = key;

  response resp = perform(req);

  object_head head;
  auto length = resp.headers.find("content-length");
  if (length != resp.headers.end()) {
    head.size = std::stoull(length->second);
  }
  auto modified = resp.headers.find("last-modified");
  if (modified != resp.headers.end()) {
    head.last_modified = parse_http_date(modified->second);
  }
  return head;
}

void s3_object_store::upload_file(
    const std::filesystem::path& path,
    const std::string& bucket,
    const std::string& key,
    const upload_options& options) {
  request req;
  req.method = "PUT";
  req.bucket = bucket;
  req.key = key;
  req.upload = &path;
  if (options.acl) {
    req.headers["x-amz-acl"] = *options.acl;
  }

  perform(req);
}

void s3_object_store::download_file(
    const std::string& bucket, const std::string& key, const std::filesystem::path& path) {
  std::filesystem::path temp_path = path.has_parent_path() ? path.parent_path() : std::filesystem::path(".");
  FILE* outfile = objxfer::mkstemp(temp_path);
  if (!outfile) {
    throw exception("failed to create temporary file in: " + temp_path.string() + ": " + std::strerror(errno));
  }

  request req;
  req.bucket = bucket;
  req.key = key;
  req.download = outfile;

  try {
    perform(req);
  }
  catch (const std::exception&) {
    fclose(outfile);
    std::filesystem::remove(temp_path);
    throw;
  }

  if (fclose(outfile) != 0) {
    std::filesystem::remove(temp_path);
    throw exception("failed to write file: " + temp_path.string() + ": " + std::strerror(errno));
  }

  // Move the temporary file to the final path
  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::filesystem::remove(temp_path);
    throw exception("failed to rename temporary file: " + temp_path.string() + ": " + ec.message());
  }
}

void s3_object_store::copy_object(
    const std::string& source_bucket,
    const std::string& source_key,
    const std::string& bucket,
    const std::string& key) {
  request req;
  req.method = "PUT";
  req.bucket = bucket;
  req.key = key;
  req.headers["x-amz-copy-source"] = "/" + source_bucket + "/" + uri_encode(source_key, false);

  response resp = perform(req);

  // Copy failures may be reported after the 200 status has been sent
  check_copy_result(resp.body, "COPY " + s3_path(source_bucket, source_key) + " to " + s3_path(bucket, key));
}

std::vector<delete_failure> s3_object_store::delete_objects(
    const std::string& bucket, const std::vector<std::string>& keys) {
  if (keys.empty()) {
    return {};
  }

  request req;
  req.method = "POST";
  req.bucket = bucket;
  req.query["delete"] = "";
  req.body = delete_request_body(keys);
  req.headers["content-md5"] = base64_encode(md5(req.body));
  req.headers["content-type"] = "application/xml";

  response resp = perform(req);

  return parse_delete_result(resp.body);
}

}  // namespace objxfer
