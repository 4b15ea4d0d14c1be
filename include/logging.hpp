#pragma once
#include "tokenvault_common.hpp"

// -------- Logging (levels) --------
enum class LogLevel { INFO, WARN, ERROR, ALERT }; // levels, ascending severity

struct LogContext {
    std::string userId;
    std::string sessionId;
    long pid = 0;
};

extern LogContext g_log_ctx;

// Initialize global logging context
void init_log_context();

// Destination file; empty path means AUDIT_LOG in the working directory
void set_audit_log_path(const std::string& path);
const std::string& audit_log_path();

// Entries below this level are dropped
void set_audit_min_level(LogLevel lvl);

const char* log_level_str(LogLevel lvl);
// "INFO", "warn", ... -> level; false on unknown names
bool parse_log_level(const std::string& name, LogLevel& out);

// Log with level, message, optional event + outcome
// audit_log_level(LogLevel::INFO, "Record saved", "vault_save", "success");
void audit_log_level(
    LogLevel lvl,
    const std::string& entry,
    const std::string& event = "",
    const std::string& outcome = ""
);
