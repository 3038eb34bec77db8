#include "openpayments_encoding.hpp"

#include "openpayments_errors.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace openpayments {

namespace {
const char kStdAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
const char kUrlAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

std::string encode_with(const Bytes& data, const char* alphabet, bool pad) {
  std::string out;
  out.reserve(((data.size() + 2) / 3) * 4);
  unsigned int val = 0;
  int valb = -6;
  for (unsigned char c : data) {
    val = (val << 8) + c;
    valb += 8;
    while (valb >= 0) {
      out.push_back(alphabet[(val >> valb) & 0x3F]);
      valb -= 6;
    }
  }
  if (valb > -6) {
    out.push_back(alphabet[((val << 8) >> (valb + 8)) & 0x3F]);
  }
  while (pad && out.size() % 4 != 0) {
    out.push_back('=');
  }
  return out;
}

int decode_char(unsigned char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '+' || c == '-') return 62;
  if (c == '/' || c == '_') return 63;
  if (c == '=') return -2;
  return -1;
}
} // namespace

std::string base64_encode(const Bytes& data) {
  return encode_with(data, kStdAlphabet, true);
}

std::string base64url_encode(const Bytes& data) {
  return encode_with(data, kUrlAlphabet, false);
}

Bytes base64_decode(const std::string& input) {
  Bytes out;
  unsigned int val = 0;
  int valb = -8;
  for (unsigned char c : input) {
    int d = decode_char(c);
    if (d == -1) {
      throw std::invalid_argument("invalid base64 character");
    }
    if (d == -2) break;
    val = (val << 6) + static_cast<unsigned int>(d);
    valb += 6;
    if (valb >= 0) {
      out.push_back(static_cast<unsigned char>((val >> valb) & 0xFF));
      valb -= 8;
    }
  }
  return out;
}

Bytes base64url_decode(const std::string& input) {
  return base64_decode(input);
}

Bytes sha256(const std::string& data) {
  Bytes digest(EVP_MAX_MD_SIZE);
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), digest.data(), &len, EVP_sha256(), nullptr) != 1) {
    throw Error(ErrorKind::Signing, "EVP_Digest(sha256) failed");
  }
  digest.resize(len);
  return digest;
}

Bytes random_bytes(std::size_t count) {
  Bytes out(count);
  if (RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
    throw Error(ErrorKind::Signing, "RAND_bytes failed");
  }
  return out;
}

std::string generate_nonce() {
  return base64url_encode(random_bytes(32));
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  using namespace std::chrono;
  const auto since_epoch = duration_cast<microseconds>(tp.time_since_epoch());
  auto secs = duration_cast<seconds>(since_epoch);
  auto micros = since_epoch - duration_cast<microseconds>(secs);
  if (micros.count() < 0) {
    secs -= seconds(1);
    micros += seconds(1);
  }

  std::time_t t = static_cast<std::time_t>(secs.count());
  std::tm tm = {};
  if (gmtime_r(&t, &tm) == nullptr) {
    throw std::runtime_error("gmtime_r failed");
  }

  char buf[64];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld+00:00",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec,
                static_cast<long long>(micros.count()));
  return buf;
}

std::string base_url_of(const std::string& url) {
  auto scheme = url.find("://");
  if (scheme == std::string::npos || scheme == 0) {
    throw std::invalid_argument("url must be absolute: " + url);
  }
  auto path = url.find('/', scheme + 3);
  if (path == std::string::npos) {
    return url;
  }
  return url.substr(0, path);
}

std::string trim_trailing_slashes(std::string url) {
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

} // namespace openpayments
