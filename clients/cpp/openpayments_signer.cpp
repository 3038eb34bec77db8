#include "openpayments_signer.hpp"

#include "openpayments_errors.hpp"

#include <openssl/bio.h>
#include <openssl/pem.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace openpayments {

namespace {
constexpr std::size_t kEd25519KeySize = 32;
constexpr std::size_t kEd25519SignatureSize = 64;

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

struct BioDeleter {
  void operator()(BIO* p) const { BIO_free(p); }
};

std::string quoted_param(const std::string& name, const std::string& value) {
  return name + "=\"" + value + "\"";
}
} // namespace

SigningKey::SigningKey(EVP_PKEY* key) : key_(key) {
  if (!key_) {
    throw SigningError("missing key material");
  }
  if (EVP_PKEY_id(key_.get()) != EVP_PKEY_ED25519) {
    throw SigningError("private key is not an Ed25519 key");
  }
}

std::shared_ptr<const SigningKey> SigningKey::from_pem(const std::string& pem) {
  std::unique_ptr<BIO, BioDeleter> bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
  if (!bio) {
    throw SigningError("BIO_new_mem_buf failed");
  }
  EVP_PKEY* pkey = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
  if (!pkey) {
    throw SigningError("failed to parse PEM private key");
  }
  return std::shared_ptr<const SigningKey>(new SigningKey(pkey));
}

std::shared_ptr<const SigningKey> SigningKey::from_pem_file(const std::string& path) {
  std::ifstream file(path);
  if (!file.good()) {
    throw SigningError("failed to open private key file: " + path);
  }
  std::stringstream ss;
  ss << file.rdbuf();
  return from_pem(ss.str());
}

std::shared_ptr<const SigningKey> SigningKey::from_raw_private_key(const Bytes& seed) {
  if (seed.size() != kEd25519KeySize) {
    throw SigningError("Ed25519 private key must be 32 bytes, got " + std::to_string(seed.size()));
  }
  EVP_PKEY* pkey = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size());
  if (!pkey) {
    throw SigningError("EVP_PKEY_new_raw_private_key(Ed25519) failed");
  }
  return std::shared_ptr<const SigningKey>(new SigningKey(pkey));
}

Bytes SigningKey::public_key() const {
  size_t len = 0;
  if (EVP_PKEY_get_raw_public_key(key_.get(), nullptr, &len) <= 0) {
    throw SigningError("EVP_PKEY_get_raw_public_key size failed");
  }
  Bytes pub(len);
  if (EVP_PKEY_get_raw_public_key(key_.get(), pub.data(), &len) <= 0) {
    throw SigningError("EVP_PKEY_get_raw_public_key failed");
  }
  return pub;
}

Bytes SigningKey::sign(const std::string& message) const {
  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw SigningError("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) <= 0) {
    throw SigningError("EVP_DigestSignInit failed");
  }

  const auto* msg = reinterpret_cast<const unsigned char*>(message.data());
  size_t siglen = 0;
  if (EVP_DigestSign(ctx.get(), nullptr, &siglen, msg, message.size()) <= 0) {
    throw SigningError("EVP_DigestSign size failed");
  }
  Bytes sig(siglen);
  if (EVP_DigestSign(ctx.get(), sig.data(), &siglen, msg, message.size()) <= 0) {
    throw SigningError("EVP_DigestSign failed");
  }
  sig.resize(siglen);
  if (sig.size() != kEd25519SignatureSize) {
    throw SigningError("unexpected Ed25519 signature size " + std::to_string(sig.size()));
  }
  return sig;
}

std::string canonical_signing_string(const std::string& method,
                                     const std::string& url,
                                     const std::string& created,
                                     const std::string& body) {
  std::string out = method + "\n" + url + "\n" + created;
  if (!body.empty()) {
    out += "\n" + base64_encode(sha256(body));
  }
  return out;
}

SignatureHeader parse_signature_header(const std::string& value) {
  SignatureHeader parsed;
  std::size_t pos = 0;
  while (pos < value.size()) {
    while (pos < value.size() && (value[pos] == ' ' || value[pos] == ',')) {
      ++pos;
    }
    if (pos >= value.size()) break;

    auto eq = value.find('=', pos);
    if (eq == std::string::npos || eq + 1 >= value.size() || value[eq + 1] != '"') {
      throw ProtocolError("malformed Signature header: " + value);
    }
    auto close = value.find('"', eq + 2);
    if (close == std::string::npos) {
      throw ProtocolError("unterminated value in Signature header: " + value);
    }
    const std::string name = value.substr(pos, eq - pos);
    const std::string param = value.substr(eq + 2, close - eq - 2);
    if (name == "keyId") {
      parsed.key_id = param;
    } else if (name == "algorithm") {
      parsed.algorithm = param;
    } else if (name == "signature") {
      parsed.signature = param;
    }
    pos = close + 1;
  }

  if (parsed.key_id.empty() || parsed.algorithm.empty() || parsed.signature.empty()) {
    throw ProtocolError("Signature header must carry keyId, algorithm and signature");
  }
  return parsed;
}

std::string parse_signature_created(const std::string& signature_input) {
  const std::string marker = "created=";
  auto pos = signature_input.find(marker);
  if (pos == std::string::npos) {
    throw ProtocolError("Signature-Input has no created parameter: " + signature_input);
  }
  pos += marker.size();
  auto end = signature_input.find(';', pos);
  std::string created = signature_input.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
  if (created.empty()) {
    throw ProtocolError("Signature-Input has an empty created parameter");
  }
  return created;
}

void verify_signed_request(const Bytes& public_key,
                           const std::string& method,
                           const std::string& url,
                           const std::string& body,
                           const SignedHeaders& headers) {
  if (public_key.size() != kEd25519KeySize) {
    throw SigningError("Ed25519 public key must be 32 bytes");
  }
  const SignatureHeader sig = parse_signature_header(headers.signature);
  if (sig.algorithm != "ed25519") {
    throw SigningError("unsupported signature algorithm: " + sig.algorithm);
  }
  const std::string created = parse_signature_created(headers.signature_input);
  const std::string signing_input = canonical_signing_string(method, url, created, body);
  Bytes sig_bytes;
  try {
    sig_bytes = base64_decode(sig.signature);
  } catch (const std::invalid_argument& ex) {
    throw SigningError(std::string("signature is not base64: ") + ex.what());
  }

  EVP_PKEY* raw = EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(), public_key.size());
  if (!raw) {
    throw SigningError("failed to create public key");
  }
  std::unique_ptr<EVP_PKEY, void (*)(EVP_PKEY*)> pkey(raw, EVP_PKEY_free);

  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw SigningError("failed to create md ctx");
  }
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
    throw SigningError("verify init failed");
  }
  int ok = EVP_DigestVerify(ctx.get(), sig_bytes.data(), sig_bytes.size(),
                            reinterpret_cast<const unsigned char*>(signing_input.data()), signing_input.size());
  if (ok != 1) {
    throw SigningError("signature verification failed");
  }
}

Signer::Signer(std::shared_ptr<const SigningKey> key, std::string key_id)
    : key_(std::move(key)), key_id_(std::move(key_id)) {
  if (!key_) {
    throw std::invalid_argument("signer requires a signing key");
  }
  if (key_id_.empty()) {
    throw std::invalid_argument("signer requires a key id");
  }
}

SignedHeaders Signer::sign(const std::string& method, const std::string& url, const std::string& body) const {
  return sign(method, url, body, std::chrono::system_clock::now());
}

SignedHeaders Signer::sign(const std::string& method,
                           const std::string& url,
                           const std::string& body,
                           std::chrono::system_clock::time_point created) const {
  SignedHeaders out;
  out.created = format_timestamp(created);
  const Bytes sig = key_->sign(canonical_signing_string(method, url, out.created, body));

  out.signature = quoted_param("keyId", key_id_) + "," +
                  quoted_param("algorithm", "ed25519") + "," +
                  quoted_param("signature", base64_encode(sig));
  out.signature_input = "sig1=();created=" + out.created;
  return out;
}

} // namespace openpayments
