#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace accord::control {
struct LogConfig;
}

namespace accord::logging {

// Start the Quill backend thread (idempotent)
void init_logging_system();

// Create the process logger from config (rotating text or JSON file sink)
quill::Logger* init_logger(const accord::control::LogConfig& config);

// Flush and stop the backend (called at exit)
void shutdown_logging();

// Process logger. Falls back to a console logger when init_logger() was never
// called, so library code can always log.
quill::Logger* get_logger();

// Request ids: {uuid-v4}#{counter}, uuid generated once per thread
std::string generate_request_id();

// Validate request id format
bool is_valid_request_id(std::string_view request_id);

// Short, non-reversible token reference for log lines (never log tokens)
std::string token_fingerprint(std::string_view token);

// Trust decision (allow/deny across an instance edge)
#define LOG_TRUST_DECISION(logger, request_id, source, target, decision, reason)         \
  LOG_INFO(logger,                                                                       \
           "Trust decision: request_id={}, source={}, target={}, decision={}, reason={}", \
           request_id, source, target, decision, reason)

// Outbound call to a peer instance or policy engine
#define LOG_PEER_CALL(logger, event, peer, status, latency_ms, request_id)                 \
  LOG_INFO(logger, "Peer call {}: peer={}, status={}, latency_ms={}, request_id={}", event, \
           peer, status, latency_ms, request_id)

// Error logging with context
#define LOG_ERROR_CTX(logger, message, request_id, error_code, error_detail)           \
  LOG_ERROR(logger, "{}: request_id={}, error_code={}, error_detail={}", message,      \
            request_id, error_code, error_detail)

}  // namespace accord::logging
