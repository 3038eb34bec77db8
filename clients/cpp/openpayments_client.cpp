#include "openpayments_client.hpp"

#include "openpayments_encoding.hpp"
#include "openpayments_errors.hpp"
#include "openpayments_log.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <utility>

namespace {
std::string http_get(openpayments::HttpTransport& transport, const std::string& url, const std::string& accept) {
  openpayments::HttpRequest request;
  request.method = "GET";
  request.url = url;
  request.set_header("Accept", accept);

  const openpayments::HttpResponse response = transport.perform(request);
  if (!response.ok()) {
    throw openpayments::HttpError(response.status, response.body);
  }
  return response.body;
}
} // namespace

namespace openpayments {

OpenPaymentsClient::OpenPaymentsClient(std::string wallet_address,
                                       Signer signer,
                                       std::optional<std::string> base_url,
                                       std::unique_ptr<HttpTransport> transport)
    : wallet_address_(std::move(wallet_address)),
      signer_(std::move(signer)),
      transport_(std::move(transport)) {
  if (wallet_address_.empty()) {
    throw std::invalid_argument("wallet address is required");
  }
  base_url_ = trim_trailing_slashes(base_url ? *base_url : base_url_of(wallet_address_));
  if (!transport_) {
    transport_ = std::make_unique<CurlTransport>();
  }
}

WalletAddress OpenPaymentsClient::get_wallet_info(const std::optional<std::string>& wallet_address) {
  const std::string url = wallet_address ? *wallet_address : wallet_address_;
  if (url.empty()) {
    throw std::invalid_argument("wallet address is required");
  }
  logger()->info("looking up wallet {}", url);
  WalletAddress info = parse_wallet_address(http_get(*transport_, url, "application/json"));
  logger()->debug("wallet {} asset={} scale={} auth={} resource={}", info.id, info.asset_code,
                  info.asset_scale, info.auth_server, info.resource_server);
  return info;
}

Quote OpenPaymentsClient::create_quote(const std::string& receiver_wallet,
                                       const std::optional<Amount>& send_amount,
                                       const std::optional<Amount>& receive_amount,
                                       const std::optional<std::string>& access_token) {
  if (receiver_wallet.empty()) {
    throw std::invalid_argument("quote needs a receiver wallet address");
  }
  if (send_amount.has_value() == receive_amount.has_value()) {
    throw std::invalid_argument("quote needs exactly one of sendAmount or receiveAmount");
  }

  nlohmann::json payload = {
      {"walletAddress", receiver_wallet},
      {"method", "ilp"}};
  if (send_amount) {
    payload["sendAmount"] = *send_amount;
  } else {
    payload["receiveAmount"] = *receive_amount;
  }

  HttpRequest request;
  request.method = "POST";
  request.url = base_url_ + "/quotes";
  request.body = payload.dump();
  const SignedHeaders headers = signer_.sign(request.method, request.url, request.body);
  request.set_header("Content-Type", "application/json");
  request.set_header("Accept", "application/json");
  request.set_header("Signature", headers.signature);
  request.set_header("Signature-Input", headers.signature_input);
  if (access_token) {
    request.set_header("Authorization", "GNAP " + *access_token);
  }

  logger()->info("creating quote for {} at {}", receiver_wallet, request.url);
  const HttpResponse response = transport_->perform(request);
  if (!response.ok()) {
    logger()->warn("quote creation failed with status {}", response.status);
    throw HttpError(response.status, response.body);
  }
  Quote quote = parse_quote(response.body);
  if (quote.wallet_address.empty()) {
    quote.wallet_address = receiver_wallet;
  }
  logger()->info("quote created: {}", quote.id);
  return quote;
}

} // namespace openpayments
