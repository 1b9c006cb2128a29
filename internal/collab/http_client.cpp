#include "http_client.hpp"

#include <curl/curl.h>

#include <cstdio>
#include <mutex>
#include <stdexcept>

namespace relay::collab {

namespace {

void EnsureCurlGlobalInit() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

class CurlEasy {
 public:
  CurlEasy() : handle_(curl_easy_init()) {
    if (!handle_) throw std::runtime_error("curl_easy_init failed");
    curl_easy_setopt(handle_, CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(handle_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle_, CURLOPT_NOSIGNAL, 1L);
  }
  ~CurlEasy() {
    curl_easy_cleanup(handle_);
  }

  CurlEasy(const CurlEasy&)            = delete;
  CurlEasy& operator=(const CurlEasy&) = delete;

  operator CURL*() {
    return handle_;
  }

 private:
  CURL* handle_;
};

class SList {
 public:
  SList() = default;
  ~SList() {
    curl_slist_free_all(head_);
  }

  SList(const SList&)            = delete;
  SList& operator=(const SList&) = delete;

  void Add(const std::string& value) {
    head_ = curl_slist_append(head_, value.c_str());
  }

  curl_slist* Get() const {
    return head_;
  }

 private:
  curl_slist* head_ = nullptr;
};

size_t WriteToString(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* buffer = static_cast<std::string*>(userdata);
  buffer->append(ptr, size * nmemb);
  return size * nmemb;
}

template <class SetupFn>
HttpResponse Perform(std::chrono::seconds timeout, SetupFn&& setup) {
  EnsureCurlGlobalInit();

  CurlEasy    handle;
  std::string body;
  char        error_buffer[CURL_ERROR_SIZE] = {0};

  curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, WriteToString);
  curl_easy_setopt(handle, CURLOPT_WRITEDATA, &body);
  curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, error_buffer);
  curl_easy_setopt(handle, CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));

  setup(static_cast<CURL*>(handle));

  const CURLcode rc = curl_easy_perform(handle);
  if (rc != CURLE_OK) {
    const std::string detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(rc);
    throw std::runtime_error("HTTP request failed: " + detail);
  }

  HttpResponse response;
  curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status);
  response.body.swap(body);
  return response;
}

} // namespace

CurlHttpClient::CurlHttpClient(std::chrono::seconds timeout) : timeout_(timeout) {
}

HttpResponse CurlHttpClient::Get(const std::string& url, const HttpHeaders& headers) {
  SList list;
  for (const auto& header : headers) list.Add(header);

  return Perform(timeout_, [&](CURL* handle) {
    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, list.Get());
  });
}

HttpResponse CurlHttpClient::PostForm(const std::string& url, const FormFields& fields) {
  std::string body;
  for (const auto& [key, value] : fields) {
    if (!body.empty()) body += '&';
    body += UrlEncode(key) + "=" + UrlEncode(value);
  }

  SList list;
  list.Add("Content-Type: application/x-www-form-urlencoded");

  return Perform(timeout_, [&](CURL* handle) {
    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_POST, 1L);
    curl_easy_setopt(handle, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, list.Get());
  });
}

std::string UrlEncode(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (unsigned char c : value) {
    if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      char hex[4];
      std::snprintf(hex, sizeof(hex), "%%%02X", c);
      out += hex;
    }
  }
  return out;
}

} // namespace relay::collab
