#pragma once
#include "tokenvault_common.hpp"
#include "cipher_codec.hpp"
#include "logging.hpp"

// -------- Runtime configuration --------
struct VaultConfig {
    std::string store_root;              // $HOME/.tokenvault
    std::string app_id = DEFAULT_APP_ID;
    std::string audit_log;               // <store_root>/audit.log
    LogLevel min_log_level = LogLevel::INFO;
    KdfParams kdf;
    std::vector<std::string> salt_paths; // machine-id candidates
};

std::string get_user_home_dir();

// "interactive" | "moderate" | "sensitive"
bool parse_kdf_profile(const std::string& name, KdfParams& out);

// Defaults overridden by TOKENVAULT_* environment variables.
// Throws VaultError naming the offending variable.
VaultConfig load_config_from_env();

// Points the audit log at cfg.audit_log and applies the level threshold
void apply_logging_config(const VaultConfig& cfg);
