#include "tokenvault_common.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "file_store.hpp"
#include "logging.hpp"
#include "salt_source.hpp"
#include "secure_buffer.hpp"
#include "token_vault.hpp"
#include "util.hpp"

// exit codes
static constexpr int EXIT_OK = 0;
static constexpr int EXIT_USAGE = 1;
static constexpr int EXIT_VAULT = 2;
static constexpr int EXIT_ABSENT = 3;

static void print_usage() {
    std::cout << "Usage:\n";
    std::cout << "  tokenvault status\n";
    std::cout << "  tokenvault save <user_id> <expires_at>\n";
    std::cout << "  tokenvault show [--reveal]\n";
    std::cout << "  tokenvault clear\n";
}

static std::string mask(const std::string& s) {
    if (s.size() <= 4) return std::string(s.size(), '*');
    return s.substr(0, 2) + std::string(s.size() - 4, '*') + s.substr(s.size() - 2);
}

// Prompted secrets pass through locked memory until handed to the vault
static std::string read_secret(const char* prompt) {
    SecureBuffer b = get_password_secure(prompt);
    return b.str();
}

static int cmd_save(TokenVault& vault, const std::string& user_id, const std::string& expires) {
    AccessTokenRecord rec;
    rec.user_id = user_id;
    if (!parse_epoch(expires, rec.expires_at)) {
        std::cerr << "expires_at must be an integer epoch value.\n";
        return EXIT_USAGE;
    }

    std::string pass = read_secret("Passphrase: ");
    std::string confirm = read_secret("Confirm passphrase: ");
    if (pass.empty() || pass != confirm) {
        std::cerr << "Passphrases are empty or do not match.\n";
        secure_clear_string(pass);
        secure_clear_string(confirm);
        return EXIT_USAGE;
    }
    secure_clear_string(confirm);

    rec.access_token = read_secret("Access token: ");
    rec.refresh_token = read_secret("Refresh token: ");

    try {
        vault.save(pass, rec);
    }
    catch (...) {
        secure_clear_string(pass);
        secure_clear_record(rec);
        throw;
    }
    secure_clear_string(pass);
    secure_clear_record(rec);
    std::cout << "Token record saved.\n";
    return EXIT_OK;
}

static int cmd_show(TokenVault& vault, bool reveal) {
    std::string pass = read_secret("Passphrase: ");
    std::optional<AccessTokenRecord> rec;
    try {
        rec = vault.load(pass);
    }
    catch (...) {
        secure_clear_string(pass);
        throw;
    }
    secure_clear_string(pass);

    if (!rec) {
        std::cout << "No token record stored.\n";
        return EXIT_ABSENT;
    }

    std::cout << "user_id:       " << rec->user_id << "\n";
    std::cout << "expires_at:    " << rec->expires_at << "\n";
    std::cout << "access_token:  " << (reveal ? rec->access_token : mask(rec->access_token)) << "\n";
    std::cout << "refresh_token: " << (reveal ? rec->refresh_token : mask(rec->refresh_token)) << "\n";
    if (reveal) {
        audit_log_level(LogLevel::INFO,
            "Token record revealed on terminal",
            "cli_show",
            "notify");
    }
    secure_clear_record(*rec);
    return EXIT_OK;
}

// -----------------------------------------------------------------------
// main
// -----------------------------------------------------------------------
int main(int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    if (!valid_cli_args(args)) {
        print_usage();
        return EXIT_USAGE;
    }
    const std::string& cmd = args[0];

    if (sodium_init() < 0) {
        std::fprintf(stderr, "An unexpected error occurred: libsodium initialization failed.\n");
        return EXIT_VAULT;
    }

    VaultConfig cfg;
    try {
        cfg = load_config_from_env();
    }
    catch (const VaultError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return EXIT_USAGE;
    }

    init_log_context();

    try {
        apply_logging_config(cfg);
        FileStore store(cfg.store_root);
        audit_log_level(LogLevel::INFO,
            "tokenvault starting: " + cmd,
            "session",
            "notify");

        MachineIdSaltSource salt_source(cfg.salt_paths);
        AppNamespaceResolver resolver(cfg.app_id);
        CipherCodec codec(cfg.kdf);
        TokenVault vault(store, salt_source, resolver, codec);

        if (cmd == "status") {
            std::cout << vault.current_namespace() << ": "
                << vault_state_str(vault.state()) << "\n";
            return EXIT_OK;
        }
        if (cmd == "save") {
            return cmd_save(vault, args[1], args[2]);
        }
        if (cmd == "show") {
            return cmd_show(vault, args.size() == 2);
        }
        vault.clear();
        std::cout << "Token record cleared.\n";
        return EXIT_OK;
    }
    catch (const SaltUnavailableError& e) {
        std::cerr << "Device salt unavailable: " << e.what() << "\n";
        return EXIT_VAULT;
    }
    catch (const VaultError& e) {
        std::cerr << "Vault error: " << e.what() << "\n";
        return EXIT_VAULT;
    }
    catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << "\n";
        audit_log_level(LogLevel::ERROR,
            std::string("Unhandled error: ") + e.what(),
            "session",
            "failure");
        return EXIT_VAULT;
    }
}
