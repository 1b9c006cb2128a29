#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace relay::collab {

struct HttpResponse {
  long        status = 0;
  std::string body;

  bool ok() const {
    return status / 100 == 2;
  }
};

using HttpHeaders = std::vector<std::string>;
using FormFields  = std::vector<std::pair<std::string, std::string>>;

/*
  Minimal blocking HTTP client. Transport failures throw; HTTP error
  statuses are returned to the caller.
*/
class HttpClient {
 public:
  virtual ~HttpClient() = default;

  virtual HttpResponse Get(const std::string& url, const HttpHeaders& headers) = 0;

  // application/x-www-form-urlencoded POST
  virtual HttpResponse PostForm(const std::string& url, const FormFields& fields) = 0;
};

class CurlHttpClient final : public HttpClient {
 public:
  explicit CurlHttpClient(std::chrono::seconds timeout = std::chrono::seconds(30));

  HttpResponse Get(const std::string& url, const HttpHeaders& headers) override;
  HttpResponse PostForm(const std::string& url, const FormFields& fields) override;

 private:
  std::chrono::seconds timeout_;
};

// RFC 3986 percent-encoding of everything but unreserved characters.
std::string UrlEncode(std::string_view value);

} // namespace relay::collab
