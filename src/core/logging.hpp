#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>

#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace vcadmin::control {
struct LogConfig;
}

namespace vcadmin::logging {

// Initialize Quill logging backend (called once at startup)
void init_logging_system();

// Create the admin logger with config-driven sink, format and level
// Installs it as the process-wide logger and returns it
quill::Logger* init_logger(const vcadmin::control::LogConfig& config);

// Shutdown logging system (called at exit)
void shutdown_logging();

// UUID v4 generation for correlation IDs
std::string generate_correlation_id();

// Validate correlation ID format ({uuid v4}#{counter}), as generated above
// Inbound X-Correlation-ID values are reused only when this holds
bool is_valid_correlation_id(std::string_view id);

// Get the process-wide logger (returns nullptr if not initialized)
quill::Logger* get_current_logger();

// Logging macros for structured logging

// Request completion logging
#define LOG_REQUEST(logger, method, path, status, duration_us, client_ip, correlation_id) \
    LOG_INFO(logger,                                                                      \
             "Request completed: method={}, path={}, status={}, "                         \
             "duration_us={}, client_ip={}, correlation_id={}",                           \
             method, path, status, duration_us, client_ip, correlation_id)

// Error logging with context
#define LOG_ERROR_CTX(logger, message, correlation_id, error_code, error_detail)        \
    LOG_ERROR(logger, "{}: correlation_id={}, error_code={}, error_detail={}", message, \
              correlation_id, error_code, error_detail)

// Lifecycle transition logging (raw alive/ready flags; effective readiness needs both)
#define LOG_STATE(logger, event, alive, ready_flag) \
    LOG_INFO(logger, "Server state {}: alive={}, ready={}", event, alive, ready_flag)

}  // namespace vcadmin::logging
