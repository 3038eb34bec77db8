#pragma once

#include "openpayments_http.hpp"
#include "openpayments_types.hpp"

#include <memory>
#include <optional>
#include <string>

namespace openpayments {

// Token-authorized operations on a resource server. Requests carry
// "Authorization: GNAP <token>" and no request signature.
//
// A 401 surfaces as TokenExpired; the caller re-runs grant negotiation and
// installs the new token with set_access_token().
class ResourceClient {
public:
  ResourceClient(std::string resource_server_url,
                 std::string access_token,
                 std::unique_ptr<HttpTransport> transport = nullptr);

  void set_access_token(std::string access_token);

  IncomingPayment create_incoming_payment(const std::string& wallet_address,
                                          const Amount& incoming_amount,
                                          const std::optional<std::string>& expires_at = std::nullopt,
                                          const std::optional<nlohmann::json>& metadata = std::nullopt);

  OutgoingPayment create_outgoing_payment(const std::string& wallet_address,
                                          const std::string& quote_id,
                                          const std::optional<nlohmann::json>& metadata = std::nullopt);

  // resource_url is the id returned at creation, used verbatim.
  IncomingPayment get_incoming_payment(const std::string& resource_url);
  OutgoingPayment get_outgoing_payment(const std::string& resource_url);

  const std::string& resource_server_url() const { return resource_server_url_; }

private:
  std::string execute(const std::string& method, const std::string& url, const std::string& body);

  std::string resource_server_url_;
  std::string access_token_;
  std::unique_ptr<HttpTransport> transport_;
};

} // namespace openpayments
