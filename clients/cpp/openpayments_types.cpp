#include "openpayments_types.hpp"

#include "openpayments_errors.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace openpayments {

using nlohmann::json;

namespace {
json parse_object(const std::string& body, const std::string& what) {
  json j;
  try {
    j = json::parse(body);
  } catch (const json::parse_error& ex) {
    throw ProtocolError(what + " is not valid JSON: " + ex.what());
  }
  if (!j.is_object()) {
    throw ProtocolError(what + " must be a JSON object");
  }
  return j;
}

std::string require_string(const json& obj, const std::string& key, const std::string& what) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string() || it->get<std::string>().empty()) {
    throw ProtocolError("missing " + key + " in " + what);
  }
  return it->get<std::string>();
}

std::optional<std::string> optional_string(const json& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    throw ProtocolError(key + " must be a string");
  }
  return it->get<std::string>();
}

std::optional<long> optional_integer(const json& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_number_integer()) {
    throw ProtocolError(key + " must be an integer");
  }
  return it->get<long>();
}

bool optional_flag(const json& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return false;
  }
  if (!it->is_boolean()) {
    throw ProtocolError(key + " must be a boolean");
  }
  return it->get<bool>();
}

std::optional<Amount> optional_amount(const json& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<Amount>();
}

std::optional<json> optional_value(const json& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return std::nullopt;
  }
  return *it;
}

AccessToken parse_access_token(const json& j) {
  // GNAP allows a single token object or a list of them.
  const json* token = &j;
  if (j.is_array()) {
    if (j.empty()) {
      throw ProtocolError("access_token list is empty");
    }
    token = &j.front();
  }
  if (!token->is_object()) {
    throw ProtocolError("access_token must be an object");
  }

  AccessToken out;
  out.value = require_string(*token, "value", "access_token");
  out.manage_url = optional_string(*token, "manage").value_or("");
  out.expires_in = optional_integer(*token, "expires_in");
  auto access = token->find("access");
  if (access != token->end() && !access->is_null()) {
    if (!access->is_array()) {
      throw ProtocolError("access_token.access must be a list");
    }
    for (const auto& right : *access) {
      out.access.push_back(parse_access_right(right));
    }
  }
  return out;
}
} // namespace

std::string to_string(ResourceType type) {
  switch (type) {
  case ResourceType::IncomingPayment: return "incoming-payment";
  case ResourceType::Quote: return "quote";
  case ResourceType::OutgoingPayment: return "outgoing-payment";
  }
  return "incoming-payment";
}

std::string to_string(Action action) {
  switch (action) {
  case Action::Create: return "create";
  case Action::Read: return "read";
  case Action::Update: return "update";
  case Action::List: return "list";
  }
  return "read";
}

ResourceType resource_type_from_string(const std::string& value) {
  if (value == "incoming-payment") return ResourceType::IncomingPayment;
  if (value == "quote") return ResourceType::Quote;
  if (value == "outgoing-payment") return ResourceType::OutgoingPayment;
  throw ProtocolError("unknown resource type: " + value);
}

Action action_from_string(const std::string& value) {
  if (value == "create") return Action::Create;
  if (value == "read") return Action::Read;
  if (value == "update") return Action::Update;
  if (value == "list") return Action::List;
  throw ProtocolError("unknown action: " + value);
}

AccessRight::AccessRight(ResourceType type,
                         std::vector<Action> actions,
                         std::optional<std::string> identifier,
                         std::optional<json> limits)
    : type_(type), identifier_(std::move(identifier)), limits_(std::move(limits)) {
  for (Action a : actions) {
    if (std::find(actions_.begin(), actions_.end(), a) == actions_.end()) {
      actions_.push_back(a);
    }
  }
  if (actions_.empty()) {
    throw std::invalid_argument("access right for " + to_string(type) + " needs at least one action");
  }
}

bool AccessRight::allows(Action action) const {
  return std::find(actions_.begin(), actions_.end(), action) != actions_.end();
}

void to_json(json& j, const AccessRight& right) {
  j = json::object();
  j["type"] = to_string(right.type());
  json actions = json::array();
  for (Action a : right.actions()) {
    actions.push_back(to_string(a));
  }
  j["actions"] = actions;
  if (right.identifier()) {
    j["identifier"] = *right.identifier();
  }
  if (right.limits()) {
    j["limits"] = *right.limits();
  }
}

AccessRight parse_access_right(const json& j) {
  if (!j.is_object()) {
    throw ProtocolError("access right must be an object");
  }
  const ResourceType type = resource_type_from_string(require_string(j, "type", "access right"));
  auto actions_it = j.find("actions");
  if (actions_it == j.end() || !actions_it->is_array() || actions_it->empty()) {
    throw ProtocolError("access right for " + to_string(type) + " has no actions");
  }
  std::vector<Action> actions;
  for (const auto& a : *actions_it) {
    if (!a.is_string()) {
      throw ProtocolError("action must be a string");
    }
    actions.push_back(action_from_string(a.get<std::string>()));
  }
  return AccessRight(type, std::move(actions), optional_string(j, "identifier"), optional_value(j, "limits"));
}

void to_json(json& j, const Amount& amount) {
  j = json{{"value", amount.value}, {"assetCode", amount.asset_code}, {"assetScale", amount.asset_scale}};
}

void from_json(const json& j, Amount& amount) {
  if (!j.is_object()) {
    throw ProtocolError("amount must be an object");
  }
  auto value = j.find("value");
  if (value == j.end()) {
    throw ProtocolError("missing value in amount");
  }
  if (value->is_string()) {
    amount.value = value->get<std::string>();
  } else if (value->is_number_integer()) {
    amount.value = value->dump();
  } else {
    throw ProtocolError("amount value must be an integer string");
  }
  amount.asset_code = require_string(j, "assetCode", "amount");
  auto scale = optional_integer(j, "assetScale");
  if (!scale) {
    throw ProtocolError("missing assetScale in amount");
  }
  amount.asset_scale = static_cast<int>(*scale);
}

void to_json(json& j, const GrantRequest& request) {
  j = json::object();
  json rights = json::array();
  for (const auto& right : request.access_rights) {
    rights.push_back(right);
  }
  j["access_token"] = rights;
  j["client"] = request.client;
  if (request.interact) {
    j["interact"] = {
        {"start", json::array({"redirect"})},
        {"finish", {
            {"method", "redirect"},
            {"uri", request.interact->redirect_uri},
            {"nonce", request.interact->nonce}}}};
  }
}

GrantResponse parse_grant_response(const std::string& body) {
  const json j = parse_object(body, "grant response");
  GrantResponse out;

  auto token = j.find("access_token");
  if (token != j.end() && !token->is_null()) {
    out.access_token = parse_access_token(*token);
  }

  auto interact = j.find("interact");
  if (interact != j.end() && !interact->is_null()) {
    if (!interact->is_object()) {
      throw ProtocolError("interact must be an object");
    }
    InteractionHandle handle;
    handle.redirect_url = require_string(*interact, "redirect", "interact");
    handle.finish = optional_string(*interact, "finish");
    out.interact = std::move(handle);
  }

  auto cont = j.find("continue");
  if (cont != j.end() && !cont->is_null()) {
    if (!cont->is_object()) {
      throw ProtocolError("continue must be an object");
    }
    Continuation c;
    c.uri = require_string(*cont, "uri", "continue");
    auto cont_token = cont->find("access_token");
    if (cont_token == cont->end() || !cont_token->is_object()) {
      throw ProtocolError("missing access_token in continue");
    }
    c.access_token = require_string(*cont_token, "value", "continue.access_token");
    c.wait_seconds = optional_integer(*cont, "wait");
    out.continuation = std::move(c);
  }

  if (!out.access_token && !out.interact) {
    throw ProtocolError("grant response carries neither access_token nor interact: " + body);
  }
  return out;
}

WalletAddress parse_wallet_address(const std::string& body) {
  const json j = parse_object(body, "wallet address");
  WalletAddress out;
  out.id = require_string(j, "id", "wallet address");
  out.public_name = optional_string(j, "publicName");
  out.asset_code = optional_string(j, "assetCode").value_or("");
  out.asset_scale = static_cast<int>(optional_integer(j, "assetScale").value_or(0));
  out.auth_server = optional_string(j, "authServer").value_or("");
  out.resource_server = optional_string(j, "resourceServer").value_or("");
  return out;
}

Quote parse_quote(const std::string& body) {
  const json j = parse_object(body, "quote");
  Quote out;
  out.id = require_string(j, "id", "quote");
  out.wallet_address = optional_string(j, "walletAddress").value_or("");
  out.receiver = optional_string(j, "receiver").value_or("");
  out.send_amount = optional_amount(j, "sendAmount");
  out.receive_amount = optional_amount(j, "receiveAmount");
  out.expires_at = optional_string(j, "expiresAt");
  out.method = optional_string(j, "method").value_or("ilp");
  return out;
}

IncomingPayment parse_incoming_payment(const std::string& body) {
  const json j = parse_object(body, "incoming payment");
  IncomingPayment out;
  out.id = require_string(j, "id", "incoming payment");
  out.wallet_address = optional_string(j, "walletAddress").value_or("");
  out.incoming_amount = optional_amount(j, "incomingAmount");
  out.received_amount = optional_amount(j, "receivedAmount");
  out.expires_at = optional_string(j, "expiresAt");
  out.metadata = optional_value(j, "metadata");
  out.completed = optional_flag(j, "completed");
  return out;
}

OutgoingPayment parse_outgoing_payment(const std::string& body) {
  const json j = parse_object(body, "outgoing payment");
  OutgoingPayment out;
  out.id = require_string(j, "id", "outgoing payment");
  out.wallet_address = optional_string(j, "walletAddress").value_or("");
  out.quote_id = optional_string(j, "quoteId");
  out.sent_amount = optional_amount(j, "sentAmount");
  out.debit_amount = optional_amount(j, "debitAmount");
  out.metadata = optional_value(j, "metadata");
  out.failed = optional_flag(j, "failed");
  return out;
}

} // namespace openpayments
