#pragma once

#include "openpayments_http.hpp"
#include "openpayments_signer.hpp"
#include "openpayments_types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace openpayments {

enum class GrantState {
  Idle,
  Building,
  Sent,
  Granted,
  PendingInteraction,
  Continuing,
  Failed
};

const char* grant_state_name(GrantState state);

// GNAP grant negotiation against one authorization server.
//
// Each request_* call starts a fresh negotiation; the instance may be reused
// sequentially but must not be shared by concurrent callers. A negotiation
// that ends in PendingInteraction can be finished with continue_grant() once
// the user has consented out of band.
//
// Nothing is retried: every failure is reported to the caller and leaves the
// negotiation in Failed.
class GrantClient {
public:
  GrantClient(std::string auth_server_url,
              Signer signer,
              std::unique_ptr<HttpTransport> transport = nullptr);

  // Throws UnexpectedInteractionRequired when the server asks for consent.
  GrantResponse request_grant_non_interactive(const std::vector<AccessRight>& access_rights,
                                              const std::string& client_id);

  // Returns either a granted token or a pending interaction.
  GrantResponse request_grant_interactive(const std::vector<AccessRight>& access_rights,
                                          const std::string& client_id,
                                          const std::string& redirect_uri);

  // Throws InvalidContinuation unless a grant is pending on this instance and,
  // when the server sent a continue section, uri and token match it.
  GrantResponse continue_grant(const std::string& continuation_uri,
                               const std::string& continuation_token,
                               const std::optional<std::string>& interact_ref = std::nullopt);

  // Uses the continue section of a pending response.
  GrantResponse continue_grant(const GrantResponse& pending,
                               const std::optional<std::string>& interact_ref = std::nullopt);

  GrantState state() const { return state_; }
  const std::string& auth_server_url() const { return auth_server_url_; }

  // Nonce sent with the last interactive request; the redirect back carries
  // a hash bound to it.
  const std::optional<std::string>& last_interact_nonce() const { return interact_nonce_; }

private:
  GrantRequest build_request(const std::vector<AccessRight>& access_rights,
                             const std::string& client_id,
                             const std::optional<std::string>& redirect_uri);
  GrantResponse send(const GrantRequest& request);

  std::string auth_server_url_;
  Signer signer_;
  std::unique_ptr<HttpTransport> transport_;
  GrantState state_ = GrantState::Idle;
  std::optional<InteractionHandle> pending_;
  std::optional<Continuation> pending_continuation_;
  std::optional<std::string> interact_nonce_;
};

} // namespace openpayments
