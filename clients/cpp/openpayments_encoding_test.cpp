#include "openpayments_encoding.hpp"
#include "openpayments_test_support.hpp"

#include <cassert>
#include <chrono>
#include <stdexcept>
#include <string>

using namespace openpayments;
using openpayments_test::throws;

int main() {
  const Bytes sample = {'h', 'i', '?', '>'};
  assert(base64_encode(sample) == "aGk/Pg==");
  assert(base64url_encode(sample) == "aGk_Pg");
  assert(base64_decode("aGk/Pg==") == sample);
  assert(base64url_decode("aGk_Pg") == sample);
  assert(throws<std::invalid_argument>([] { base64_decode("a*b"); }));

  assert(base64_encode(sha256("")) == "47DEQpj8HBSa+/TImW+5JCeuQeRkm5NMpJWZG3hSuFU=");

  const std::string nonce = generate_nonce();
  assert(nonce.size() == 43);
  assert(nonce.find_first_not_of("ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_") ==
         std::string::npos);
  assert(base64url_decode(nonce).size() == 32);
  assert(generate_nonce() != nonce);

  using namespace std::chrono;
  const system_clock::time_point tp = system_clock::time_point(seconds(1735787045)) + microseconds(123456);
  assert(format_timestamp(tp) == "2025-01-02T03:04:05.123456+00:00");
  assert(format_timestamp(system_clock::time_point(seconds(0))) == "1970-01-01T00:00:00.000000+00:00");

  assert(base_url_of("https://ilp.example.com/alice") == "https://ilp.example.com");
  assert(base_url_of("http://localhost:3000/accounts/bob/") == "http://localhost:3000");
  assert(base_url_of("https://ilp.example.com") == "https://ilp.example.com");
  assert(throws<std::invalid_argument>([] { base_url_of("ilp.example.com/alice"); }));

  assert(trim_trailing_slashes("https://auth.example//") == "https://auth.example");
  return 0;
}
