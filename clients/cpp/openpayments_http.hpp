#pragma once

#include <curl/curl.h>

#include <string>
#include <utility>
#include <vector>

namespace openpayments {

struct HttpRequest {
  std::string method;
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;

  void set_header(const std::string& name, const std::string& value);
  // Case-insensitive; empty when absent.
  std::string header(const std::string& name) const;
};

struct HttpResponse {
  long status = 0;
  std::string body;

  bool ok() const { return status >= 200 && status < 300; }
};

// One outbound request at a time. Returns every HTTP status; throws
// TransportError only when no status was obtained.
class HttpTransport {
public:
  virtual ~HttpTransport() = default;

  virtual HttpResponse perform(const HttpRequest& request) = 0;
};

// libcurl easy handle held for the transport's lifetime so connections are
// reused across calls.
class CurlTransport : public HttpTransport {
public:
  explicit CurlTransport(long timeout_seconds = 30);
  ~CurlTransport() override;

  CurlTransport(const CurlTransport&) = delete;
  CurlTransport& operator=(const CurlTransport&) = delete;

  HttpResponse perform(const HttpRequest& request) override;

  long timeout_seconds() const { return timeout_seconds_; }

private:
  CURL* curl_;
  long timeout_seconds_;
};

} // namespace openpayments
