#pragma once

#include <stdexcept>
#include <string>

namespace openpayments {

enum class ErrorKind {
  Signing,
  Protocol,
  UnexpectedInteraction,
  InvalidContinuation,
  Http,
  TokenExpired,
  Transport,
  Config
};

const char* error_kind_name(ErrorKind kind);

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

// Key material could not produce (or verify) a signature.
class SigningError : public Error {
public:
  explicit SigningError(const std::string& msg) : Error(ErrorKind::Signing, msg) {}
};

// Malformed or contradictory server response.
class ProtocolError : public Error {
public:
  explicit ProtocolError(const std::string& msg) : Error(ErrorKind::Protocol, msg) {}
};

class UnexpectedInteractionRequired : public Error {
public:
  explicit UnexpectedInteractionRequired(const std::string& redirect_url)
      : Error(ErrorKind::UnexpectedInteraction,
              "authorization server requires user interaction: " + redirect_url),
        redirect_url_(redirect_url) {}

  const std::string& redirect_url() const { return redirect_url_; }

private:
  std::string redirect_url_;
};

class InvalidContinuation : public Error {
public:
  explicit InvalidContinuation(const std::string& msg) : Error(ErrorKind::InvalidContinuation, msg) {}
};

// Non-2xx answer from any endpoint. Also serves as the resource request error.
class HttpError : public Error {
public:
  HttpError(long status, const std::string& body)
      : Error(ErrorKind::Http, "request failed " + std::to_string(status) + ": " + body),
        status_(status), body_(body) {}

  long status() const { return status_; }
  const std::string& body() const { return body_; }

private:
  long status_;
  std::string body_;
};

// 401 from the resource server. Deliberately not an HttpError.
class TokenExpired : public Error {
public:
  TokenExpired(long status, const std::string& body)
      : Error(ErrorKind::TokenExpired, "access token rejected " + std::to_string(status) + ": " + body),
        status_(status), body_(body) {}

  long status() const { return status_; }
  const std::string& body() const { return body_; }

private:
  long status_;
  std::string body_;
};

// The request never produced an HTTP status (DNS, TLS, timeout, ...).
class TransportError : public Error {
public:
  explicit TransportError(const std::string& msg) : Error(ErrorKind::Transport, msg) {}
};

class ConfigError : public Error {
public:
  explicit ConfigError(const std::string& msg) : Error(ErrorKind::Config, msg) {}
};

} // namespace openpayments
