#include "crypto.hpp"

// -------- Crypto helpers --------
bool derive_key_from_password( // symmetric key derivation from passphrase using Argon2id
    const byte* pw,
    size_t pw_len,
    const byte salt[SALT_LEN],
    unsigned long long opslimit,
    size_t memlimit,
    byte key[KEY_LEN]
)
{
    if (!pw || !salt || !key) {
        audit_log_level(LogLevel::ERROR,
            "derive_key_from_password: null pointer",
            "crypto_module",
            "failure");
        return false;
    }

    if (pw_len == 0 || pw_len > MAX_PASSPHRASE_LEN) {
        audit_log_level(LogLevel::WARN,
            "derive_key_from_password: invalid passphrase length",
            "crypto_module",
            "failure");
        return false;
    }

    if (crypto_pwhash(key,
        KEY_LEN,
        reinterpret_cast<const char*>(pw),
        pw_len,
        salt,
        opslimit,
        memlimit,
        crypto_pwhash_ALG_ARGON2ID13) != 0)
    {
        // out of memory or limits outside the Argon2id bounds
        audit_log_level(LogLevel::ERROR,
            "derive_key_from_password: crypto_pwhash failed",
            "crypto_module",
            "failure");
        return false;
    }

    return true;
}

bool normalize_device_salt(
    const byte* device_salt,
    size_t device_salt_len,
    byte salt[SALT_LEN]
)
{
    if (!device_salt || device_salt_len == 0 || !salt) {
        audit_log_level(LogLevel::WARN,
            "normalize_device_salt: empty device salt",
            "crypto_module",
            "failure");
        return false;
    }

    static_assert(SALT_LEN >= crypto_generichash_BYTES_MIN &&
        SALT_LEN <= crypto_generichash_BYTES_MAX,
        "salt length outside BLAKE2b output range");

    if (crypto_generichash(salt, SALT_LEN,
        device_salt, device_salt_len,
        nullptr, 0) != 0)
    {
        audit_log_level(LogLevel::ERROR,
            "normalize_device_salt: crypto_generichash failed",
            "crypto_module",
            "failure");
        return false;
    }
    return true;
}

bool encrypt_field_blob( // field encryption using XChaCha20-Poly1305-IETF
    const byte key[KEY_LEN],
    const byte* plaintext,
    size_t plen,
    const byte* ad,
    size_t ad_len,
    std::vector<byte>& out
)
{
    out.clear();

    if (!key) {
        audit_log_level(LogLevel::ERROR,
            "encrypt_field_blob: null key",
            "crypto_module",
            "failure");
        return false;
    }

    if (plen > 0 && !plaintext) {
        audit_log_level(LogLevel::ERROR,
            "encrypt_field_blob: non-zero length but plaintext null",
            "crypto_module",
            "failure");
        return false;
    }

    if (plen > MAX_FIELD_LEN) {
        audit_log_level(LogLevel::WARN,
            "encrypt_field_blob: plaintext too large",
            "crypto_module",
            "failure");
        return false;
    }

    out.resize(NONCE_LEN + plen + ABYTES);
    byte* nonce = out.data();
    byte* ct = out.data() + NONCE_LEN;
    randombytes_buf(nonce, NONCE_LEN);

    unsigned long long ct_len_ull = 0;

    if (crypto_aead_xchacha20poly1305_ietf_encrypt(
        ct,
        &ct_len_ull,
        plaintext,
        plen,
        ad_len ? ad : nullptr,
        ad_len,
        nullptr,          // nsec - not used
        nonce,
        key) != 0)
    {
        audit_log_level(LogLevel::ERROR,
            "encrypt_field_blob: crypto_aead_xchacha20poly1305_ietf_encrypt failed",
            "crypto_module",
            "failure");
        sodium_memzero(out.data(), out.size());
        out.clear();
        return false;
    }

    // ct_len is always plen + ABYTES
    out.resize(NONCE_LEN + static_cast<size_t>(ct_len_ull));
    return true;
}


bool decrypt_field_blob( // field decryption with XChaCha20-Poly1305-IETF
    const byte key[KEY_LEN],
    const byte* blob,
    size_t blob_len,
    const byte* ad,
    size_t ad_len,
    SecureBuffer& out_plain
)
{
    if (!key) {
        audit_log_level(LogLevel::ERROR,
            "decrypt_field_blob: null key",
            "crypto_module",
            "failure");
        return false;
    }

    if (!blob || blob_len < NONCE_LEN + ABYTES) {
        audit_log_level(LogLevel::WARN,
            "decrypt_field_blob: ciphertext too small or null",
            "crypto_module",
            "failure");
        return false;
    }

    const byte* nonce = blob;
    const byte* ct = blob + NONCE_LEN;
    size_t ct_len = blob_len - NONCE_LEN;
    size_t plain_len = ct_len - ABYTES;

    // one spare byte keeps the allocation non-empty for zero-length fields
    SecureBuffer plain(plain_len + 1);

    unsigned long long out_len_ull = 0;
    if (crypto_aead_xchacha20poly1305_ietf_decrypt(
        plain.data(),
        &out_len_ull,
        nullptr,      // nsec - not used
        ct,
        ct_len,
        ad_len ? ad : nullptr,
        ad_len,
        nonce,
        key) != 0)
    {
        // wrong key, wrong associated data, corrupted or tampered ciphertext
        audit_log_level(LogLevel::WARN,
            "decrypt_field_blob: authentication failed",
            "crypto_module",
            "failure");
        return false;
    }

    if (static_cast<size_t>(out_len_ull) != plain_len) {
        audit_log_level(LogLevel::ERROR,
            "decrypt_field_blob: unexpected plaintext length",
            "crypto_module",
            "failure");
        return false;
    }

    out_plain = SecureBuffer(plain.data(), plain_len);
    return true;
}


// -------- Base64 --------
std::string to_base64(const byte* bin, size_t len) {
    if (!bin || len == 0) return "";
    size_t out_len = sodium_base64_encoded_len(len, sodium_base64_VARIANT_ORIGINAL);
    std::string out;
    out.resize(out_len);
    sodium_bin2base64(&out[0], out_len, bin, len, sodium_base64_VARIANT_ORIGINAL);
    // encoded_len counts the terminating null
    size_t pos = out.find('\0');
    if (pos != std::string::npos) out.resize(pos);
    return out;
}

bool from_base64(const std::string& b64, std::vector<byte>& out) {
    out.clear();
    if (b64.empty()) return true;
    std::vector<byte> buf(b64.size());
    size_t out_len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(buf.data(),
        buf.size(),
        b64.c_str(),
        b64.size(),
        nullptr,
        &out_len,
        &end,
        sodium_base64_VARIANT_ORIGINAL) != 0) {
        audit_log_level(LogLevel::WARN,
            "from_base64: malformed input",
            "crypto_module",
            "failure");
        return false;
    }
    // trailing garbage after a valid prefix
    if (end != b64.c_str() + b64.size() || out_len > buf.size()) {
        audit_log_level(LogLevel::WARN,
            "from_base64: trailing characters",
            "crypto_module",
            "failure");
        return false;
    }
    buf.resize(out_len);
    out.swap(buf);
    return true;
}
