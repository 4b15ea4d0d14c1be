#include "config.hpp"
#include "errors.hpp"
#include "salt_source.hpp"

// ---------- Path helpers ----------
std::string get_user_home_dir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        struct passwd* pw = getpwuid(geteuid());
        if (pw && pw->pw_dir) {
            home = pw->pw_dir;
        }
    }
    if (!home || !*home) return ".";
    return std::string(home);
}

static std::string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : std::string();
}

bool parse_kdf_profile(const std::string& name, KdfParams& out) {
    if (name == "interactive") {
        out.opslimit = crypto_pwhash_OPSLIMIT_INTERACTIVE;
        out.memlimit = crypto_pwhash_MEMLIMIT_INTERACTIVE;
        return true;
    }
    if (name == "moderate") {
        out.opslimit = crypto_pwhash_OPSLIMIT_MODERATE;
        out.memlimit = crypto_pwhash_MEMLIMIT_MODERATE;
        return true;
    }
    if (name == "sensitive") {
        out.opslimit = crypto_pwhash_OPSLIMIT_SENSITIVE;
        out.memlimit = crypto_pwhash_MEMLIMIT_SENSITIVE;
        return true;
    }
    return false;
}

VaultConfig load_config_from_env() {
    VaultConfig cfg;

    cfg.store_root = env_or_empty("TOKENVAULT_HOME");
    if (cfg.store_root.empty()) {
        cfg.store_root = get_user_home_dir() + "/" + STORE_DIRNAME;
    }

    std::string app = env_or_empty("TOKENVAULT_APP_ID");
    if (!app.empty()) {
        cfg.app_id = app;
    }

    cfg.audit_log = env_or_empty("TOKENVAULT_AUDIT_LOG");
    if (cfg.audit_log.empty()) {
        cfg.audit_log = cfg.store_root + "/" + AUDIT_LOG;
    }

    std::string lvl = env_or_empty("TOKENVAULT_LOG_LEVEL");
    if (!lvl.empty() && !parse_log_level(lvl, cfg.min_log_level)) {
        throw VaultError("TOKENVAULT_LOG_LEVEL: unknown level '" + lvl + "'");
    }

    std::string kdf = env_or_empty("TOKENVAULT_KDF");
    if (!kdf.empty() && !parse_kdf_profile(kdf, cfg.kdf)) {
        throw VaultError("TOKENVAULT_KDF: unknown profile '" + kdf + "'");
    }

    std::string mid = env_or_empty("TOKENVAULT_MACHINE_ID_FILE");
    if (!mid.empty()) {
        cfg.salt_paths = { mid };
    }
    else {
        cfg.salt_paths = default_machine_id_paths();
    }

    return cfg;
}

void apply_logging_config(const VaultConfig& cfg) {
    set_audit_log_path(cfg.audit_log);
    set_audit_min_level(cfg.min_log_level);
}
