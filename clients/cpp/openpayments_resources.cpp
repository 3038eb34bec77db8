#include "openpayments_resources.hpp"

#include "openpayments_encoding.hpp"
#include "openpayments_errors.hpp"
#include "openpayments_log.hpp"

#include <stdexcept>
#include <utility>

namespace openpayments {

namespace {
constexpr long kUnauthorized = 401;
} // namespace

ResourceClient::ResourceClient(std::string resource_server_url,
                               std::string access_token,
                               std::unique_ptr<HttpTransport> transport)
    : resource_server_url_(trim_trailing_slashes(std::move(resource_server_url))),
      transport_(std::move(transport)) {
  if (resource_server_url_.empty()) {
    throw std::invalid_argument("resource server url is required");
  }
  set_access_token(std::move(access_token));
  if (!transport_) {
    transport_ = std::make_unique<CurlTransport>();
  }
}

void ResourceClient::set_access_token(std::string access_token) {
  if (access_token.empty()) {
    throw std::invalid_argument("access token must not be empty");
  }
  access_token_ = std::move(access_token);
}

std::string ResourceClient::execute(const std::string& method, const std::string& url, const std::string& body) {
  HttpRequest http;
  http.method = method;
  http.url = url;
  http.body = body;
  http.set_header("Authorization", "GNAP " + access_token_);
  http.set_header("Accept", "application/json");
  if (!body.empty()) {
    http.set_header("Content-Type", "application/json");
  }

  const HttpResponse response = transport_->perform(http);
  if (response.status == kUnauthorized) {
    logger()->warn("{} {} rejected token={}", method, url, redact(access_token_));
    throw TokenExpired(response.status, response.body);
  }
  if (!response.ok()) {
    logger()->warn("{} {} failed with status {}", method, url, response.status);
    throw HttpError(response.status, response.body);
  }
  return response.body;
}

IncomingPayment ResourceClient::create_incoming_payment(const std::string& wallet_address,
                                                        const Amount& incoming_amount,
                                                        const std::optional<std::string>& expires_at,
                                                        const std::optional<nlohmann::json>& metadata) {
  if (wallet_address.empty()) {
    throw std::invalid_argument("incoming payment needs a wallet address");
  }
  nlohmann::json payload = {
      {"walletAddress", wallet_address},
      {"incomingAmount", incoming_amount}};
  if (expires_at) {
    payload["expiresAt"] = *expires_at;
  }
  if (metadata) {
    payload["metadata"] = *metadata;
  }

  logger()->info("creating incoming payment for {} ({} {} scale {})", wallet_address,
                 incoming_amount.value, incoming_amount.asset_code, incoming_amount.asset_scale);
  IncomingPayment payment = parse_incoming_payment(
      execute("POST", resource_server_url_ + "/incoming-payments", payload.dump()));
  if (payment.wallet_address.empty()) {
    payment.wallet_address = wallet_address;
  }
  if (!payment.incoming_amount) {
    payment.incoming_amount = incoming_amount;
  }
  if (!payment.expires_at) {
    payment.expires_at = expires_at;
  }
  if (!payment.metadata) {
    payment.metadata = metadata;
  }
  logger()->info("incoming payment created: {}", payment.id);
  return payment;
}

OutgoingPayment ResourceClient::create_outgoing_payment(const std::string& wallet_address,
                                                        const std::string& quote_id,
                                                        const std::optional<nlohmann::json>& metadata) {
  if (wallet_address.empty() || quote_id.empty()) {
    throw std::invalid_argument("outgoing payment needs a wallet address and a quote id");
  }
  nlohmann::json payload = {
      {"walletAddress", wallet_address},
      {"quoteId", quote_id}};
  if (metadata) {
    payload["metadata"] = *metadata;
  }

  logger()->info("creating outgoing payment from {} with quote {}", wallet_address, quote_id);
  OutgoingPayment payment = parse_outgoing_payment(
      execute("POST", resource_server_url_ + "/outgoing-payments", payload.dump()));
  if (payment.wallet_address.empty()) {
    payment.wallet_address = wallet_address;
  }
  if (!payment.quote_id) {
    payment.quote_id = quote_id;
  }
  if (!payment.metadata) {
    payment.metadata = metadata;
  }
  logger()->info("outgoing payment created: {} failed={}", payment.id, payment.failed);
  return payment;
}

IncomingPayment ResourceClient::get_incoming_payment(const std::string& resource_url) {
  if (resource_url.empty()) {
    throw std::invalid_argument("incoming payment url is required");
  }
  IncomingPayment payment = parse_incoming_payment(execute("GET", resource_url, ""));
  logger()->info("incoming payment {} completed={}", payment.id, payment.completed);
  return payment;
}

OutgoingPayment ResourceClient::get_outgoing_payment(const std::string& resource_url) {
  if (resource_url.empty()) {
    throw std::invalid_argument("outgoing payment url is required");
  }
  OutgoingPayment payment = parse_outgoing_payment(execute("GET", resource_url, ""));
  logger()->info("outgoing payment {} failed={}", payment.id, payment.failed);
  return payment;
}

} // namespace openpayments
