#include "openpayments_http.hpp"

#include "openpayments_errors.hpp"
#include "openpayments_log.hpp"

#include <cctype>
#include <string>

namespace openpayments {

namespace {
size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
  size_t total = size * nmemb;
  auto* buffer = static_cast<std::string*>(userp);
  buffer->append(static_cast<char*>(contents), total);
  return total;
}

bool iequals(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

class HeaderList {
public:
  HeaderList() = default;
  ~HeaderList() { curl_slist_free_all(list_); }

  HeaderList(const HeaderList&) = delete;
  HeaderList& operator=(const HeaderList&) = delete;

  void append(const std::string& line) {
    struct curl_slist* next = curl_slist_append(list_, line.c_str());
    if (!next) {
      throw TransportError("curl_slist_append failed");
    }
    list_ = next;
  }

  struct curl_slist* get() const { return list_; }

private:
  struct curl_slist* list_ = nullptr;
};
} // namespace

void HttpRequest::set_header(const std::string& name, const std::string& value) {
  for (auto& h : headers) {
    if (iequals(h.first, name)) {
      h.second = value;
      return;
    }
  }
  headers.emplace_back(name, value);
}

std::string HttpRequest::header(const std::string& name) const {
  for (const auto& h : headers) {
    if (iequals(h.first, name)) {
      return h.second;
    }
  }
  return {};
}

CurlTransport::CurlTransport(long timeout_seconds) : curl_(curl_easy_init()), timeout_seconds_(timeout_seconds) {
  if (!curl_) {
    throw TransportError("failed to init curl");
  }
}

CurlTransport::~CurlTransport() {
  curl_easy_cleanup(curl_);
}

HttpResponse CurlTransport::perform(const HttpRequest& request) {
  // Reset options but keep the connection cache.
  curl_easy_reset(curl_);

  HeaderList headers;
  for (const auto& h : request.headers) {
    headers.append(h.first + ": " + h.second);
  }

  HttpResponse response;
  curl_easy_setopt(curl_, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_cb);
  curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl_, CURLOPT_TIMEOUT, timeout_seconds_);
  curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

  if (request.method == "GET") {
    curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
  } else {
    if (request.method != "POST") {
      curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    } else {
      curl_easy_setopt(curl_, CURLOPT_POST, 1L);
    }
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
  }

  logger()->debug("{} {}", request.method, request.url);
  CURLcode res = curl_easy_perform(curl_);
  if (res != CURLE_OK) {
    logger()->warn("{} {} failed: {}", request.method, request.url, curl_easy_strerror(res));
    throw TransportError(request.method + " " + request.url + ": " + curl_easy_strerror(res));
  }
  curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.status);
  logger()->debug("{} {} -> {}", request.method, request.url, response.status);
  return response;
}

} // namespace openpayments
