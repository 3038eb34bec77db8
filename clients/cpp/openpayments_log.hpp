#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace openpayments {

// Shared "openpayments" logger, stderr sink. Level comes from
// OPENPAYMENTS_LOG_LEVEL (trace, debug, info, warn, err, critical, off).
std::shared_ptr<spdlog::logger> logger();

// Safe form of a bearer secret for log lines: "abcdef...(32 chars)".
std::string redact(const std::string& secret);

} // namespace openpayments
