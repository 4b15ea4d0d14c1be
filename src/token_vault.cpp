#include "token_vault.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "util.hpp"

const char* vault_state_str(VaultState s) {
    switch (s) {
    case VaultState::Empty:      return "Empty";
    case VaultState::Populated:  return "Populated";
    case VaultState::Incomplete: return "Incomplete";
    default:                     return "Unknown";
    }
}

TokenVault::TokenVault(KeyValueStore& store,
    const DeviceSaltSource& salt_source,
    const NamespaceResolver& resolver,
    const CipherCodec& codec)
    : store_(store)
    , salt_source_(salt_source)
    , resolver_(resolver)
    , codec_(codec)
{
}

size_t TokenVault::present_key_count(const std::string& ns) const {
    size_t n = 0;
    for (const char* k : RECORD_KEYS) {
        if (store_.contains(ns, k)) ++n;
    }
    return n;
}

VaultState TokenVault::state(const std::string& ns) const {
    size_t n = present_key_count(ns);
    if (n == 0) return VaultState::Empty;
    if (n == RECORD_KEY_COUNT) return VaultState::Populated;
    return VaultState::Incomplete;
}

VaultState TokenVault::state() const {
    return state(resolver_.resolve());
}


// ---------------- Key derivation ----------------
SecureBuffer TokenVault::device_key(const std::string& passphrase) const {
    std::vector<byte> salt = salt_source_.device_salt();
    try {
        SecureBuffer key = codec_.derive_key(passphrase, salt);
        sodium_memzero(salt.data(), salt.size());
        return key;
    }
    catch (...) {
        sodium_memzero(salt.data(), salt.size());
        throw;
    }
}


// ---------------- Clear ----------------
void TokenVault::clear(const std::string& ns) {
    StoreBatch batch;
    for (const char* k : RECORD_KEYS) {
        batch.remove(k);
    }
    store_.apply(ns, batch);

    audit_log_level(LogLevel::INFO,
        "Token record cleared for " + ns,
        "vault_clear",
        "success");
}

void TokenVault::clear() {
    clear(resolver_.resolve());
}

void TokenVault::clear_after_failure(const std::string& ns, const char* event) noexcept {
    try {
        clear(ns);
    }
    catch (const std::exception& e) {
        // original error is still the one surfaced to the caller
        audit_log_level(LogLevel::ALERT,
            std::string("Compensating clear failed: ") + e.what(),
            event,
            "failure");
    }
}


// ---------------- Encrypt + save ----------------
void TokenVault::save(const std::string& ns,
    const std::string& passphrase,
    const AccessTokenRecord& record)
{
    StoreBatch batch;
    try {
        SecureBuffer key = device_key(passphrase);

        batch.put(KEY_ACCESS_TOKEN,
            codec_.encrypt_with_key(key, record.access_token, KEY_ACCESS_TOKEN));
        batch.put(KEY_EXPIRES_AT,
            codec_.encrypt_with_key(key, std::to_string(record.expires_at), KEY_EXPIRES_AT));
        batch.put(KEY_REFRESH_TOKEN,
            codec_.encrypt_with_key(key, record.refresh_token, KEY_REFRESH_TOKEN));
        batch.put(KEY_USER_ID,
            codec_.encrypt_with_key(key, record.user_id, KEY_USER_ID));

        store_.apply(ns, batch);
    }
    catch (const std::exception& e) {
        audit_log_level(LogLevel::ERROR,
            std::string("Saving token record failed: ") + e.what(),
            "vault_save",
            "failure");
        batch.clear();
        clear_after_failure(ns, "vault_save");
        throw;
    }

    batch.clear();
    audit_log_level(LogLevel::INFO,
        "Token record saved for " + ns,
        "vault_save",
        "success");
}

void TokenVault::save(const std::string& passphrase, const AccessTokenRecord& record) {
    save(resolver_.resolve(), passphrase, record);
}


// ---------------- Decrypt + load ----------------
std::optional<AccessTokenRecord> TokenVault::load(const std::string& ns,
    const std::string& passphrase)
{
    AccessTokenRecord out;
    try {
        size_t present = present_key_count(ns);
        if (present == 0) {
            return std::nullopt;
        }
        if (present != RECORD_KEY_COUNT) {
            throw FormatError("incomplete token record: " +
                std::to_string(present) + " of " +
                std::to_string(RECORD_KEY_COUNT) + " fields present");
        }

        SecureBuffer key = device_key(passphrase);

        // the vault never writes an empty value; "" would bypass authentication
        auto stored = [&](const char* k) {
            std::optional<std::string> v = store_.get(ns, k);
            if (!v) {
                throw FormatError(std::string("incomplete token record: ") + k + " missing");
            }
            if (v->empty()) {
                throw CryptoError(std::string("empty ciphertext stored for ") + k);
            }
            return *v;
        };

        out.access_token = codec_.decrypt_with_key(key, stored(KEY_ACCESS_TOKEN), KEY_ACCESS_TOKEN);
        std::string expires = codec_.decrypt_with_key(key, stored(KEY_EXPIRES_AT), KEY_EXPIRES_AT);
        out.refresh_token = codec_.decrypt_with_key(key, stored(KEY_REFRESH_TOKEN), KEY_REFRESH_TOKEN);
        out.user_id = codec_.decrypt_with_key(key, stored(KEY_USER_ID), KEY_USER_ID);

        if (!parse_epoch(expires, out.expires_at)) {
            throw FormatError("stored expires_at is not an integer");
        }
    }
    catch (const std::exception& e) {
        secure_clear_record(out);
        audit_log_level(LogLevel::ERROR,
            std::string("Loading token record failed: ") + e.what(),
            "vault_load",
            "failure");
        clear_after_failure(ns, "vault_load");
        throw;
    }

    audit_log_level(LogLevel::INFO,
        "Token record loaded for " + ns,
        "vault_load",
        "success");
    return out;
}

std::optional<AccessTokenRecord> TokenVault::load(const std::string& passphrase) {
    return load(resolver_.resolve(), passphrase);
}
