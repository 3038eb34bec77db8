#pragma once

#include "openpayments_encoding.hpp"

#include <openssl/evp.h>

#include <chrono>
#include <memory>
#include <string>

namespace openpayments {

// Ed25519 private key. Read-only after loading, so one instance can back any
// number of signers on any number of threads.
class SigningKey {
public:
  static std::shared_ptr<const SigningKey> from_pem(const std::string& pem);
  static std::shared_ptr<const SigningKey> from_pem_file(const std::string& path);
  static std::shared_ptr<const SigningKey> from_raw_private_key(const Bytes& seed);

  Bytes public_key() const;
  Bytes sign(const std::string& message) const;

private:
  struct PKeyDeleter {
    void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }
  };

  explicit SigningKey(EVP_PKEY* key);

  std::unique_ptr<EVP_PKEY, PKeyDeleter> key_;
};

struct SignedHeaders {
  std::string signature;       // Signature
  std::string signature_input; // Signature-Input
  std::string created;
};

struct SignatureHeader {
  std::string key_id;
  std::string algorithm;
  std::string signature;
};

// METHOD \n URL \n created [\n base64(sha256(body))]. An empty body adds no
// digest line.
std::string canonical_signing_string(const std::string& method,
                                     const std::string& url,
                                     const std::string& created,
                                     const std::string& body);

SignatureHeader parse_signature_header(const std::string& value);

// Extracts created=... from a Signature-Input value.
std::string parse_signature_created(const std::string& signature_input);

// Throws SigningError unless headers carry a valid ed25519 signature by
// public_key over the request.
void verify_signed_request(const Bytes& public_key,
                           const std::string& method,
                           const std::string& url,
                           const std::string& body,
                           const SignedHeaders& headers);

class Signer {
public:
  Signer(std::shared_ptr<const SigningKey> key, std::string key_id);

  const std::string& key_id() const { return key_id_; }

  // Headers are bound to this call's timestamp; never reuse them for a
  // second send attempt.
  SignedHeaders sign(const std::string& method,
                     const std::string& url,
                     const std::string& body = "") const;

  SignedHeaders sign(const std::string& method,
                     const std::string& url,
                     const std::string& body,
                     std::chrono::system_clock::time_point created) const;

private:
  std::shared_ptr<const SigningKey> key_;
  std::string key_id_;
};

} // namespace openpayments
