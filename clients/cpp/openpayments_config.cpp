#include "openpayments_config.hpp"

#include "openpayments_errors.hpp"
#include "openpayments_log.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace openpayments {

namespace {
std::optional<std::string> env(const char* name) {
  const char* value = std::getenv(name);
  if (!value || !*value) {
    return std::nullopt;
  }
  return std::string(value);
}

long parse_timeout(const std::string& value) {
  std::size_t used = 0;
  long seconds = 0;
  try {
    seconds = std::stol(value, &used);
  } catch (const std::exception&) {
    throw ConfigError("OPENPAYMENTS_HTTP_TIMEOUT must be a number of seconds: " + value);
  }
  if (used != value.size() || seconds <= 0) {
    throw ConfigError("OPENPAYMENTS_HTTP_TIMEOUT must be a positive number of seconds: " + value);
  }
  return seconds;
}

std::string pick_server(const std::optional<std::string>& configured, const std::string& advertised,
                        const char* what) {
  if (configured) {
    return *configured;
  }
  if (advertised.empty()) {
    throw ConfigError(std::string(what) + " is neither configured nor advertised by the wallet");
  }
  return advertised;
}
} // namespace

Config load_config_from_env() {
  Config cfg;
  auto wallet = env("WALLET_ADDRESS");
  if (!wallet) {
    throw ConfigError("WALLET_ADDRESS is not set");
  }
  cfg.wallet_address = *wallet;
  cfg.private_key_path = env("PRIVATE_KEY_PATH").value_or("keys/key-1_private.pem");
  cfg.key_id = env("KEY_ID").value_or("key-1");
  cfg.client_id = env("CLIENT_ID").value_or(cfg.wallet_address);
  cfg.auth_server_url = env("AUTH_SERVER_URL");
  cfg.resource_server_url = env("RESOURCE_SERVER_URL");
  if (auto timeout = env("OPENPAYMENTS_HTTP_TIMEOUT")) {
    cfg.http_timeout_seconds = parse_timeout(*timeout);
  }

  logger()->debug("config: wallet={} key_id={} key={} timeout={}s", cfg.wallet_address, cfg.key_id,
                  cfg.private_key_path, cfg.http_timeout_seconds);
  return cfg;
}

Signer make_signer(const Config& config) {
  if (config.key_id.empty()) {
    throw ConfigError("KEY_ID must not be empty");
  }
  return Signer(SigningKey::from_pem_file(config.private_key_path), config.key_id);
}

std::unique_ptr<HttpTransport> make_transport(const Config& config) {
  if (config.http_timeout_seconds <= 0) {
    throw ConfigError("http timeout must be positive");
  }
  return std::make_unique<CurlTransport>(config.http_timeout_seconds);
}

std::string auth_server_for(const Config& config, const WalletAddress& wallet) {
  return pick_server(config.auth_server_url, wallet.auth_server, "AUTH_SERVER_URL");
}

std::string resource_server_for(const Config& config, const WalletAddress& wallet) {
  return pick_server(config.resource_server_url, wallet.resource_server, "RESOURCE_SERVER_URL");
}

} // namespace openpayments
