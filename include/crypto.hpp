#pragma once
#include "tokenvault_common.hpp"
#include "logging.hpp"
#include "secure_buffer.hpp"

// -------- Crypto helpers --------
// All helpers return false on failure and leave an audit log entry.

// Argon2id over the passphrase with the given cost parameters
bool derive_key_from_password(
    const byte* pw,
    size_t pw_len,
    const byte salt[SALT_LEN],
    unsigned long long opslimit,
    size_t memlimit,
    byte key[KEY_LEN]
);

// Any non-empty device identifier -> fixed-length KDF salt (BLAKE2b)
bool normalize_device_salt(
    const byte* device_salt,
    size_t device_salt_len,
    byte salt[SALT_LEN]
);

// XChaCha20-Poly1305-IETF, fresh random nonce; out = nonce || ct || tag
bool encrypt_field_blob(
    const byte key[KEY_LEN],
    const byte* plaintext,
    size_t plen,
    const byte* ad,
    size_t ad_len,
    std::vector<byte>& out
);

// Inverse of encrypt_field_blob; plaintext is placed in locked memory
bool decrypt_field_blob(
    const byte key[KEY_LEN],
    const byte* blob,
    size_t blob_len,
    const byte* ad,
    size_t ad_len,
    SecureBuffer& out_plain
);

// Standard alphabet, padded, no line breaks
std::string to_base64(const byte* bin, size_t len);
bool from_base64(const std::string& b64, std::vector<byte>& out);
