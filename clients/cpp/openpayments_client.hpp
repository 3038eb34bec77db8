#pragma once

#include "openpayments_http.hpp"
#include "openpayments_signer.hpp"
#include "openpayments_types.hpp"

#include <memory>
#include <optional>
#include <string>

// Wallet address lookup and signed quote creation for one wallet.
// Dependencies: libcurl, nlohmann/json, OpenSSL

namespace openpayments {

class OpenPaymentsClient {
public:
  // base_url defaults to scheme://host of wallet_address.
  OpenPaymentsClient(std::string wallet_address,
                     Signer signer,
                     std::optional<std::string> base_url = std::nullopt,
                     std::unique_ptr<HttpTransport> transport = nullptr);

  // Public, unauthenticated. Defaults to this client's own wallet.
  WalletAddress get_wallet_info(const std::optional<std::string>& wallet_address = std::nullopt);

  // Exactly one of send_amount / receive_amount must be given.
  Quote create_quote(const std::string& receiver_wallet,
                     const std::optional<Amount>& send_amount,
                     const std::optional<Amount>& receive_amount = std::nullopt,
                     const std::optional<std::string>& access_token = std::nullopt);

  const std::string& wallet_address() const { return wallet_address_; }
  const std::string& base_url() const { return base_url_; }

private:
  std::string wallet_address_;
  Signer signer_;
  std::string base_url_;
  std::unique_ptr<HttpTransport> transport_;
};

} // namespace openpayments
