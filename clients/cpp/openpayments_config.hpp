#pragma once

#include "openpayments_http.hpp"
#include "openpayments_signer.hpp"
#include "openpayments_types.hpp"

#include <memory>
#include <optional>
#include <string>

namespace openpayments {

struct Config {
  std::string wallet_address;
  std::string private_key_path;
  std::string key_id;
  std::string client_id;
  std::optional<std::string> auth_server_url;     // else taken from wallet info
  std::optional<std::string> resource_server_url; // else taken from wallet info
  long http_timeout_seconds = 30;
};

// WALLET_ADDRESS (required), PRIVATE_KEY_PATH, KEY_ID, CLIENT_ID,
// AUTH_SERVER_URL, RESOURCE_SERVER_URL, OPENPAYMENTS_HTTP_TIMEOUT.
Config load_config_from_env();

// Loads the PEM key named by the config and binds it to key_id.
Signer make_signer(const Config& config);

// CurlTransport bounded by http_timeout_seconds.
std::unique_ptr<HttpTransport> make_transport(const Config& config);

// The configured server when set, otherwise the one the wallet advertises.
// Throws ConfigError when neither is known.
std::string auth_server_for(const Config& config, const WalletAddress& wallet);
std::string resource_server_for(const Config& config, const WalletAddress& wallet);

} // namespace openpayments
