#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>

#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace regmock::control {
struct LogConfig;
}

namespace regmock::logging {

// Start the Quill backend thread (called once at startup)
void init_logging_system();

// Create the service logger from config: append-only file sink when
// config.file is set, console otherwise. Becomes the current logger.
// Throws if the log directory or file cannot be created; the current
// logger is left unchanged in that case.
quill::Logger* init_service_logger(const regmock::control::LogConfig& config);

// Flush and stop the backend (called at exit)
void shutdown_logging();

// Request ids: per-thread random UUID v4 base plus counter, "{uuid}#{n}"
std::string generate_request_id();

// Get the service logger (nullptr before init_service_logger)
quill::Logger* get_current_logger();

// Request completion logging
#define REGMOCK_LOG_REQUEST(logger, level_macro, method, path, status, bytes, duration_us, \
                            request_id)                                                    \
    level_macro(logger,                                                                    \
                "Request handled: method={}, path={}, status={}, bytes={}, "               \
                "duration_us={}, request_id={}",                                           \
                method, path, status, bytes, duration_us, request_id)

}  // namespace regmock::logging
