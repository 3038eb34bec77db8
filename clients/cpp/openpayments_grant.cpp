#include "openpayments_grant.hpp"

#include "openpayments_errors.hpp"
#include "openpayments_log.hpp"

#include <stdexcept>
#include <utility>

namespace openpayments {

namespace {
std::string describe_rights(const std::vector<AccessRight>& rights) {
  std::string out;
  for (const auto& r : rights) {
    if (!out.empty()) out += ",";
    out += to_string(r.type());
  }
  return "[" + out + "]";
}
} // namespace

const char* grant_state_name(GrantState state) {
  switch (state) {
  case GrantState::Idle: return "idle";
  case GrantState::Building: return "building";
  case GrantState::Sent: return "sent";
  case GrantState::Granted: return "granted";
  case GrantState::PendingInteraction: return "pending-interaction";
  case GrantState::Continuing: return "continuing";
  case GrantState::Failed: return "failed";
  }
  return "unknown";
}

GrantClient::GrantClient(std::string auth_server_url, Signer signer, std::unique_ptr<HttpTransport> transport)
    : auth_server_url_(trim_trailing_slashes(std::move(auth_server_url))),
      signer_(std::move(signer)),
      transport_(std::move(transport)) {
  if (auth_server_url_.empty()) {
    throw std::invalid_argument("authorization server url is required");
  }
  if (!transport_) {
    transport_ = std::make_unique<CurlTransport>();
  }
}

GrantRequest GrantClient::build_request(const std::vector<AccessRight>& access_rights,
                                        const std::string& client_id,
                                        const std::optional<std::string>& redirect_uri) {
  state_ = GrantState::Building;
  if (access_rights.empty()) {
    throw std::invalid_argument("grant request needs at least one access right");
  }
  if (client_id.empty()) {
    throw std::invalid_argument("grant request needs a client id");
  }

  GrantRequest request;
  request.access_rights = access_rights;
  request.client = client_id;
  if (redirect_uri) {
    if (redirect_uri->empty()) {
      throw std::invalid_argument("interactive grant needs a redirect uri");
    }
    InteractRequest interact;
    interact.redirect_uri = *redirect_uri;
    interact.nonce = generate_nonce();
    interact_nonce_ = interact.nonce;
    request.interact = std::move(interact);
  }
  return request;
}

GrantResponse GrantClient::send(const GrantRequest& request) {
  const std::string url = auth_server_url_ + "/";
  const std::string body = nlohmann::json(request).dump();

  HttpRequest http;
  http.method = "POST";
  http.url = url;
  http.body = body;
  const SignedHeaders signed_headers = signer_.sign(http.method, url, body);
  http.set_header("Content-Type", "application/json");
  http.set_header("Accept", "application/json");
  http.set_header("Signature", signed_headers.signature);
  http.set_header("Signature-Input", signed_headers.signature_input);

  state_ = GrantState::Sent;
  const HttpResponse response = transport_->perform(http);
  if (!response.ok()) {
    throw HttpError(response.status, response.body);
  }
  return parse_grant_response(response.body);
}

GrantResponse GrantClient::request_grant_non_interactive(const std::vector<AccessRight>& access_rights,
                                                         const std::string& client_id) {
  pending_.reset();
  pending_continuation_.reset();
  interact_nonce_.reset();
  try {
    const GrantRequest request = build_request(access_rights, client_id, std::nullopt);
    logger()->info("requesting non-interactive grant for {} from {}",
                   describe_rights(access_rights), auth_server_url_);

    GrantResponse response = send(request);
    if (!response.access_token) {
      throw UnexpectedInteractionRequired(response.interact->redirect_url);
    }
    // No interact block was sent, so the server cannot hand one back.
    if (response.interact) {
      throw ProtocolError("non-interactive grant answered with an interaction handle: " +
                          response.interact->redirect_url);
    }
    state_ = GrantState::Granted;
    logger()->info("grant issued token={} expires_in={}",
                   redact(response.access_token->value),
                   response.access_token->expires_in ? std::to_string(*response.access_token->expires_in) : "n/a");
    return response;
  } catch (const std::exception& ex) {
    state_ = GrantState::Failed;
    logger()->warn("non-interactive grant failed: {}", ex.what());
    throw;
  }
}

GrantResponse GrantClient::request_grant_interactive(const std::vector<AccessRight>& access_rights,
                                                     const std::string& client_id,
                                                     const std::string& redirect_uri) {
  pending_.reset();
  pending_continuation_.reset();
  interact_nonce_.reset();
  try {
    const GrantRequest request = build_request(access_rights, client_id, redirect_uri);
    logger()->info("requesting interactive grant for {} from {}",
                   describe_rights(access_rights), auth_server_url_);

    GrantResponse response = send(request);
    if (response.access_token) {
      state_ = GrantState::Granted;
      logger()->info("grant issued without interaction token={}", redact(response.access_token->value));
      return response;
    }
    pending_ = response.interact;
    pending_continuation_ = response.continuation;
    state_ = GrantState::PendingInteraction;
    logger()->info("grant pending user interaction at {}", response.interact->redirect_url);
    return response;
  } catch (const std::exception& ex) {
    state_ = GrantState::Failed;
    logger()->warn("interactive grant failed: {}", ex.what());
    throw;
  }
}

GrantResponse GrantClient::continue_grant(const std::string& continuation_uri,
                                          const std::string& continuation_token,
                                          const std::optional<std::string>& interact_ref) {
  if (!pending_ || state_ != GrantState::PendingInteraction) {
    throw InvalidContinuation("no grant is pending interaction on this client");
  }
  if (continuation_uri.empty() || continuation_token.empty()) {
    throw InvalidContinuation("continuation uri and token are required");
  }
  // Only the negotiation pending right now may be continued; the pending
  // state is left untouched so the right handle can still be used.
  if (pending_continuation_ && (continuation_uri != pending_continuation_->uri ||
                                continuation_token != pending_continuation_->access_token)) {
    throw InvalidContinuation("continuation does not belong to the pending grant: " + continuation_uri);
  }

  pending_.reset();
  pending_continuation_.reset();
  state_ = GrantState::Continuing;
  try {
    nlohmann::json body = nlohmann::json::object();
    if (interact_ref) {
      body["interact_ref"] = *interact_ref;
    }

    HttpRequest http;
    http.method = "POST";
    http.url = continuation_uri;
    http.body = body.dump();
    http.set_header("Authorization", "GNAP " + continuation_token);
    http.set_header("Content-Type", "application/json");
    http.set_header("Accept", "application/json");

    logger()->info("continuing grant at {} with token={}", continuation_uri, redact(continuation_token));
    const HttpResponse response = transport_->perform(http);
    if (!response.ok()) {
      throw HttpError(response.status, response.body);
    }
    GrantResponse grant = parse_grant_response(response.body);
    if (!grant.access_token) {
      throw ProtocolError("grant continuation did not yield an access token: " + response.body);
    }
    state_ = GrantState::Granted;
    logger()->info("grant completed token={}", redact(grant.access_token->value));
    return grant;
  } catch (const std::exception& ex) {
    state_ = GrantState::Failed;
    logger()->warn("grant continuation failed: {}", ex.what());
    throw;
  }
}

GrantResponse GrantClient::continue_grant(const GrantResponse& pending,
                                          const std::optional<std::string>& interact_ref) {
  if (!pending.continuation) {
    throw InvalidContinuation("grant response has no continue section");
  }
  return continue_grant(pending.continuation->uri, pending.continuation->access_token, interact_ref);
}

} // namespace openpayments
