#include "openpayments_errors.hpp"

namespace openpayments {

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Signing: return "signing";
  case ErrorKind::Protocol: return "protocol";
  case ErrorKind::UnexpectedInteraction: return "unexpected-interaction";
  case ErrorKind::InvalidContinuation: return "invalid-continuation";
  case ErrorKind::Http: return "http";
  case ErrorKind::TokenExpired: return "token-expired";
  case ErrorKind::Transport: return "transport";
  case ErrorKind::Config: return "config";
  }
  return "unknown";
}

} // namespace openpayments
