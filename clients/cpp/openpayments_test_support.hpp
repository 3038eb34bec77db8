#pragma once

#include "openpayments_http.hpp"
#include "openpayments_signer.hpp"

#include <cassert>
#include <deque>
#include <memory>
#include <string>
#include <vector>

#ifndef OPENPAYMENTS_TESTDATA_DIR
#define OPENPAYMENTS_TESTDATA_DIR "../testdata"
#endif

namespace openpayments_test {

// RFC 8032 section 7.1, test 1.
inline openpayments::Bytes rfc8032_seed() {
  const unsigned char seed[] = {
      0x9d, 0x61, 0xb1, 0x9d, 0xef, 0xfd, 0x5a, 0x60, 0xba, 0x84, 0x4a, 0xf4, 0x92, 0xec, 0x2c, 0xc4,
      0x44, 0x49, 0xc5, 0x69, 0x7b, 0x32, 0x69, 0x19, 0x70, 0x3b, 0xac, 0x03, 0x1c, 0xae, 0x7f, 0x60};
  return openpayments::Bytes(seed, seed + sizeof(seed));
}

inline openpayments::Bytes rfc8032_public_key() {
  const unsigned char pub[] = {
      0xd7, 0x5a, 0x98, 0x01, 0x82, 0xb1, 0x0a, 0xb7, 0xd5, 0x4b, 0xfe, 0xd3, 0xc9, 0x64, 0x07, 0x3a,
      0x0e, 0xe1, 0x72, 0xf3, 0xda, 0xa6, 0x23, 0x25, 0xaf, 0x02, 0x1a, 0x68, 0xf7, 0x07, 0x51, 0x1a};
  return openpayments::Bytes(pub, pub + sizeof(pub));
}

inline openpayments::Signer test_signer(const std::string& key_id = "key-1") {
  return openpayments::Signer(openpayments::SigningKey::from_raw_private_key(rfc8032_seed()), key_id);
}

// Records every request and replays queued responses in order.
class StubTransport : public openpayments::HttpTransport {
public:
  void enqueue(long status, const std::string& body) {
    openpayments::HttpResponse r;
    r.status = status;
    r.body = body;
    responses_.push_back(r);
  }

  openpayments::HttpResponse perform(const openpayments::HttpRequest& request) override {
    requests.push_back(request);
    assert(!responses_.empty() && "unexpected request");
    openpayments::HttpResponse r = responses_.front();
    responses_.pop_front();
    return r;
  }

  std::vector<openpayments::HttpRequest> requests;

private:
  std::deque<openpayments::HttpResponse> responses_;
};

// Returns a stub plus a non-owning handle that stays valid after the stub is
// moved into a client.
inline std::unique_ptr<StubTransport> make_stub(StubTransport*& handle) {
  auto stub = std::make_unique<StubTransport>();
  handle = stub.get();
  return stub;
}

template <typename E, typename F>
bool throws(F&& f) {
  try {
    f();
  } catch (const E&) {
    return true;
  }
  return false;
}

} // namespace openpayments_test
