#include "openpayments_errors.hpp"
#include "openpayments_http.hpp"
#include "openpayments_log.hpp"
#include "openpayments_test_support.hpp"

#include <cassert>
#include <string>

using namespace openpayments;
using openpayments_test::throws;

int main() {
  HttpRequest request;
  request.set_header("Content-Type", "text/plain");
  request.set_header("content-type", "application/json");
  assert(request.headers.size() == 1);
  assert(request.header("CONTENT-TYPE") == "application/json");
  assert(request.header("Authorization").empty());

  HttpResponse response;
  response.status = 204;
  assert(response.ok());
  response.status = 302;
  assert(!response.ok());

  assert(logger()->name() == "openpayments");
  assert(logger() == logger());
  logger()->debug("transport test starting");

  assert(redact("") == "<empty>");
  assert(redact("short") == "***(5 chars)");
  assert(redact("abcdefghijklmnopqrstuvwxyz") == "abcdef...(26 chars)");

  // Nothing listens on port 1; the failure must not look like an HTTP status.
  CurlTransport transport(2);
  request.method = "GET";
  request.url = "http://127.0.0.1:1/";
  assert(throws<TransportError>([&] { transport.perform(request); }));
  return 0;
}
