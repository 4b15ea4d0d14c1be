#pragma once
#include "tokenvault_common.hpp"
#include "cipher_codec.hpp"
#include "kv_store.hpp"
#include "salt_source.hpp"

enum class VaultState { Empty, Populated, Incomplete };

const char* vault_state_str(VaultState s);

// All-or-nothing persistence of an AccessTokenRecord.
//
// The four fields are encrypted under one derived key (fresh nonce each, the
// storage key bound as associated data) and written as a single StoreBatch.
// Any failure inside save/load clears the namespace before the original
// error is rethrown. Clearing is compensation, not a transaction: a
// concurrent writer on the same namespace can still interleave, so callers
// serialize operations per namespace.
class TokenVault {
public:
    TokenVault(KeyValueStore& store,
        const DeviceSaltSource& salt_source,
        const NamespaceResolver& resolver,
        const CipherCodec& codec);

    void save(const std::string& ns,
        const std::string& passphrase,
        const AccessTokenRecord& record);
    void save(const std::string& passphrase, const AccessTokenRecord& record);

    // nullopt when none of the four keys exist
    std::optional<AccessTokenRecord> load(const std::string& ns,
        const std::string& passphrase);
    std::optional<AccessTokenRecord> load(const std::string& passphrase);

    // Idempotent
    void clear(const std::string& ns);
    void clear();

    VaultState state(const std::string& ns) const;
    VaultState state() const;

    std::string current_namespace() const { return resolver_.resolve(); }

private:
    KeyValueStore& store_;
    const DeviceSaltSource& salt_source_;
    const NamespaceResolver& resolver_;
    const CipherCodec& codec_;

    size_t present_key_count(const std::string& ns) const;
    // device salt + passphrase -> key; the salt copy is wiped on every path
    SecureBuffer device_key(const std::string& passphrase) const;
    void clear_after_failure(const std::string& ns, const char* event) noexcept;
};
