#include "openpayments_errors.hpp"
#include "openpayments_signer.hpp"
#include "openpayments_test_support.hpp"

#include <cassert>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace openpayments;
using openpayments_test::throws;

namespace {
const std::chrono::system_clock::time_point kCreated =
    std::chrono::system_clock::time_point(std::chrono::seconds(1735787045)); // 2025-01-02T03:04:05Z

const std::string kGrantUrl = "https://auth.example/";
const std::string kGrantBody = "{\"client\":\"https://wallet.example/alice\"}";

void test_rfc8032_vector() {
  auto key = SigningKey::from_raw_private_key(openpayments_test::rfc8032_seed());
  assert(key->public_key() == openpayments_test::rfc8032_public_key());
  assert(base64_encode(key->sign("")) ==
         "5VZDAMNgrHKQhuLMgG6CioSHfx645dl02HPgZSJJAVVfuIIVkKM7rMYeOXAc+bRr0lv18FlbviRlUUFDjnoQCw==");
}

void test_pem_key_matches_raw_key() {
  auto key = SigningKey::from_pem_file(std::string(OPENPAYMENTS_TESTDATA_DIR) + "/ed25519_private.pem");
  assert(key->public_key() == openpayments_test::rfc8032_public_key());
}

void test_bad_key_material() {
  assert(throws<SigningError>([] { SigningKey::from_pem("not a key"); }));
  assert(throws<SigningError>([] { SigningKey::from_raw_private_key(Bytes(31, 0x01)); }));
  assert(throws<SigningError>([] { SigningKey::from_pem_file("/nonexistent/key.pem"); }));
}

void test_canonical_string() {
  assert(canonical_signing_string("GET", "https://wallet.example/alice", "T", "") ==
         "GET\nhttps://wallet.example/alice\nT");
  assert(canonical_signing_string("POST", "https://rs.example/quotes", "T", "hello") ==
         "POST\nhttps://rs.example/quotes\nT\nLPJNul+wow4m6DsqxbninhsWHlwfp0JecwQzYpOLmCQ=");
}

void test_known_signature_with_body() {
  Signer signer = openpayments_test::test_signer("key-1");
  SignedHeaders headers = signer.sign("POST", kGrantUrl, kGrantBody, kCreated);

  assert(headers.created == "2025-01-02T03:04:05.000000+00:00");
  assert(headers.signature_input == "sig1=();created=2025-01-02T03:04:05.000000+00:00");
  assert(headers.signature ==
         "keyId=\"key-1\",algorithm=\"ed25519\","
         "signature=\"BqPUA5T0DUqH23UJbB3y0Inw6+wW5LMHPUJiTUUD91hNSA7hlCY6lV1o4DGbHoi53VYqRKu3tGqEdhAqlTGRCA==\"");
}

void test_known_signature_without_body() {
  Signer signer = openpayments_test::test_signer("key-1");
  SignedHeaders headers = signer.sign("GET", "https://wallet.example/alice", "", kCreated);
  SignatureHeader parsed = parse_signature_header(headers.signature);
  assert(parsed.signature ==
         "f5IYA64Ter5h4kCvFmQ0Y29360d1mwYjQtyZmbCA/Y1SKOhaAqU4hHJxqRlMNCOxGZvsz5dmi1Z2oitiyOQrAw==");
}

void test_deterministic_and_parseable() {
  Signer signer = openpayments_test::test_signer("my-key");
  SignedHeaders a = signer.sign("POST", kGrantUrl, kGrantBody, kCreated);
  SignedHeaders b = signer.sign("POST", kGrantUrl, kGrantBody, kCreated);
  assert(a.signature == b.signature);
  assert(a.signature_input == b.signature_input);

  SignatureHeader parsed = parse_signature_header(a.signature);
  assert(parsed.key_id == "my-key");
  assert(parsed.algorithm == "ed25519");
  assert(base64_decode(parsed.signature).size() == 64);
  assert(parse_signature_created(a.signature_input) == a.created);
}

void test_body_change_changes_signature() {
  Signer signer = openpayments_test::test_signer();
  std::string tampered = kGrantBody;
  tampered[tampered.size() - 2] = 'x';
  SignedHeaders a = signer.sign("POST", kGrantUrl, kGrantBody, kCreated);
  SignedHeaders b = signer.sign("POST", kGrantUrl, tampered, kCreated);
  assert(a.signature != b.signature);
}

void test_timestamp_changes_signature() {
  Signer signer = openpayments_test::test_signer();
  SignedHeaders a = signer.sign("POST", kGrantUrl, kGrantBody, kCreated);
  SignedHeaders b = signer.sign("POST", kGrantUrl, kGrantBody, kCreated + std::chrono::microseconds(1));
  assert(b.created == "2025-01-02T03:04:05.000001+00:00");
  assert(a.signature != b.signature);
}

void test_verify() {
  Signer signer = openpayments_test::test_signer();
  const Bytes pub = openpayments_test::rfc8032_public_key();
  SignedHeaders headers = signer.sign("POST", kGrantUrl, kGrantBody);
  verify_signed_request(pub, "POST", kGrantUrl, kGrantBody, headers);

  assert(throws<SigningError>([&] {
    verify_signed_request(pub, "POST", kGrantUrl, kGrantBody + " ", headers);
  }));
  assert(throws<SigningError>([&] {
    verify_signed_request(pub, "POST", "https://other.example/", kGrantBody, headers);
  }));
  assert(throws<SigningError>([&] {
    verify_signed_request(pub, "PUT", kGrantUrl, kGrantBody, headers);
  }));

  Bytes wrong = pub;
  wrong[0] ^= 0x01;
  assert(throws<SigningError>([&] {
    verify_signed_request(wrong, "POST", kGrantUrl, kGrantBody, headers);
  }));
}

void test_malformed_headers() {
  assert(throws<ProtocolError>([] { parse_signature_header(""); }));
  assert(throws<ProtocolError>([] { parse_signature_header("keyId=abc"); }));
  assert(throws<ProtocolError>([] { parse_signature_header("keyId=\"a\",algorithm=\"ed25519\""); }));
  assert(throws<ProtocolError>([] { parse_signature_created("sig1=()"); }));
}

void test_signer_arguments() {
  assert(throws<std::invalid_argument>([] { Signer(nullptr, "key-1"); }));
  assert(throws<std::invalid_argument>([] {
    Signer(SigningKey::from_raw_private_key(openpayments_test::rfc8032_seed()), "");
  }));
}

void test_shared_key_across_threads() {
  auto key = SigningKey::from_raw_private_key(openpayments_test::rfc8032_seed());
  const Bytes pub = key->public_key();
  std::vector<std::thread> workers;
  std::vector<SignedHeaders> results(4);
  for (std::size_t i = 0; i < results.size(); ++i) {
    workers.emplace_back([&, i] {
      Signer signer(key, "key-" + std::to_string(i));
      for (int n = 0; n < 50; ++n) {
        results[i] = signer.sign("POST", kGrantUrl, kGrantBody + std::to_string(n));
      }
    });
  }
  for (auto& w : workers) {
    w.join();
  }
  for (std::size_t i = 0; i < results.size(); ++i) {
    verify_signed_request(pub, "POST", kGrantUrl, kGrantBody + "49", results[i]);
    assert(parse_signature_header(results[i].signature).key_id == "key-" + std::to_string(i));
  }
}
} // namespace

int main() {
  test_rfc8032_vector();
  test_pem_key_matches_raw_key();
  test_bad_key_material();
  test_canonical_string();
  test_known_signature_with_body();
  test_known_signature_without_body();
  test_deterministic_and_parseable();
  test_body_change_changes_signature();
  test_timestamp_changes_signature();
  test_verify();
  test_malformed_headers();
  test_signer_arguments();
  test_shared_key_across_threads();
  return 0;
}
