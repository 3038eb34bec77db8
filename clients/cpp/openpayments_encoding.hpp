#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace openpayments {

using Bytes = std::vector<unsigned char>;

std::string base64_encode(const Bytes& data);
std::string base64url_encode(const Bytes& data); // unpadded

// Accepts both alphabets; padding is optional.
Bytes base64_decode(const std::string& input);
Bytes base64url_decode(const std::string& input);

Bytes sha256(const std::string& data);

Bytes random_bytes(std::size_t count);

// 32 random bytes, base64url without padding.
std::string generate_nonce();

// UTC, microseconds, explicit offset: 2025-01-02T03:04:05.000000+00:00
std::string format_timestamp(std::chrono::system_clock::time_point tp);

// "https://host:port/alice" -> "https://host:port"
std::string base_url_of(const std::string& url);

// Strips trailing '/' characters.
std::string trim_trailing_slashes(std::string url);

} // namespace openpayments
