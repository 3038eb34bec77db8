#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

// Open Payments / GNAP data model and its JSON mapping.
// Dependencies: nlohmann/json

namespace openpayments {

enum class ResourceType {
  IncomingPayment,
  Quote,
  OutgoingPayment
};

enum class Action {
  Create,
  Read,
  Update,
  List
};

std::string to_string(ResourceType type);
std::string to_string(Action action);
ResourceType resource_type_from_string(const std::string& value);
Action action_from_string(const std::string& value);

// One requested (or granted) capability. The action list is never empty.
class AccessRight {
public:
  AccessRight(ResourceType type,
              std::vector<Action> actions,
              std::optional<std::string> identifier = std::nullopt,
              std::optional<nlohmann::json> limits = std::nullopt);

  ResourceType type() const { return type_; }
  const std::vector<Action>& actions() const { return actions_; }
  const std::optional<std::string>& identifier() const { return identifier_; }
  const std::optional<nlohmann::json>& limits() const { return limits_; }

  bool allows(Action action) const;

private:
  ResourceType type_;
  std::vector<Action> actions_;
  std::optional<std::string> identifier_;
  std::optional<nlohmann::json> limits_;
};

struct Amount {
  std::string value; // integer string, scaled by asset_scale
  std::string asset_code;
  int asset_scale = 0;
};

struct InteractRequest {
  std::string redirect_uri;
  std::string nonce;
};

struct GrantRequest {
  std::vector<AccessRight> access_rights;
  std::string client;
  std::optional<InteractRequest> interact;
};

struct AccessToken {
  std::string value; // bearer secret, log only via redact()
  std::string manage_url;
  std::optional<long> expires_in;
  std::vector<AccessRight> access;
};

struct InteractionHandle {
  std::string redirect_url;
  std::optional<std::string> finish; // server nonce for the redirect hash
};

struct Continuation {
  std::string uri;
  std::string access_token;
  std::optional<long> wait_seconds;
};

struct GrantResponse {
  std::optional<AccessToken> access_token;
  std::optional<InteractionHandle> interact;
  std::optional<Continuation> continuation;

  bool granted() const { return access_token.has_value(); }
  bool requires_interaction() const { return !access_token && interact.has_value(); }
};

struct WalletAddress {
  std::string id;
  std::optional<std::string> public_name;
  std::string asset_code;
  int asset_scale = 0;
  std::string auth_server;
  std::string resource_server;
};

struct Quote {
  std::string id;
  std::string wallet_address;
  std::string receiver;
  std::optional<Amount> send_amount;
  std::optional<Amount> receive_amount;
  std::optional<std::string> expires_at;
  std::string method;
};

struct IncomingPayment {
  std::string id; // full resource URL, reused verbatim
  std::string wallet_address;
  std::optional<Amount> incoming_amount;
  std::optional<Amount> received_amount;
  std::optional<std::string> expires_at;
  std::optional<nlohmann::json> metadata;
  bool completed = false;
};

struct OutgoingPayment {
  std::string id; // full resource URL, reused verbatim
  std::string wallet_address;
  std::optional<std::string> quote_id;
  std::optional<Amount> sent_amount;
  std::optional<Amount> debit_amount;
  std::optional<nlohmann::json> metadata;
  bool failed = false;
};

void to_json(nlohmann::json& j, const AccessRight& right);
void to_json(nlohmann::json& j, const Amount& amount);
void from_json(const nlohmann::json& j, Amount& amount);
void to_json(nlohmann::json& j, const GrantRequest& request);

// Parsers for server payloads. Missing required fields and type mismatches
// become ProtocolError.
AccessRight parse_access_right(const nlohmann::json& j);
GrantResponse parse_grant_response(const std::string& body);
WalletAddress parse_wallet_address(const std::string& body);
Quote parse_quote(const std::string& body);
IncomingPayment parse_incoming_payment(const std::string& body);
OutgoingPayment parse_outgoing_payment(const std::string& body);

} // namespace openpayments
