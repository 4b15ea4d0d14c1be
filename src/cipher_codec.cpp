#include "cipher_codec.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "util.hpp"

static const byte* ad_ptr(const std::string& ad) {
    return reinterpret_cast<const byte*>(ad.data());
}

CipherCodec::CipherCodec()
    : CipherCodec(KdfParams{})
{
}

CipherCodec::CipherCodec(const KdfParams& params)
    : params_(params)
{
    if (sodium_init() < 0) {
        audit_log_level(LogLevel::ERROR,
            "libsodium initialization failed",
            "codec_init",
            "failure");
        throw CryptoError("libsodium initialization failed");
    }
}

SecureBuffer CipherCodec::derive_key(
    const std::string& passphrase,
    const std::vector<byte>& salt
) const
{
    if (passphrase.empty() || passphrase.size() > MAX_PASSPHRASE_LEN) {
        throw CryptoError("key derivation failed: invalid passphrase length");
    }
    if (salt.empty()) {
        throw CryptoError("key derivation failed: empty salt");
    }

    byte kdf_salt[SALT_LEN];
    if (!normalize_device_salt(salt.data(), salt.size(), kdf_salt)) {
        throw CryptoError("key derivation failed: salt normalization");
    }

    SecureBuffer key(KEY_LEN);
    bool ok = derive_key_from_password(
        reinterpret_cast<const byte*>(passphrase.data()),
        passphrase.size(),
        kdf_salt,
        params_.opslimit,
        params_.memlimit,
        key.data());
    sodium_memzero(kdf_salt, sizeof(kdf_salt));
    if (!ok) {
        throw CryptoError("key derivation failed");
    }
    return key;
}

std::string CipherCodec::encrypt_with_key(
    const SecureBuffer& key,
    const std::string& plaintext,
    const std::string& associated_data
) const
{
    if (key.size() != KEY_LEN) {
        throw CryptoError("cipher initialization failed: bad key length");
    }
    if (!is_valid_utf8(plaintext)) {
        throw EncodingError("plaintext is not valid UTF-8");
    }

    std::vector<byte> blob;
    if (!encrypt_field_blob(key.data(),
        reinterpret_cast<const byte*>(plaintext.data()),
        plaintext.size(),
        ad_ptr(associated_data),
        associated_data.size(),
        blob)) {
        throw CryptoError("encryption failed");
    }
    return to_base64(blob.data(), blob.size());
}

std::string CipherCodec::decrypt_with_key(
    const SecureBuffer& key,
    const std::string& ciphertext_text,
    const std::string& associated_data
) const
{
    if (ciphertext_text.empty()) {
        return std::string();
    }
    if (key.size() != KEY_LEN) {
        throw CryptoError("cipher initialization failed: bad key length");
    }

    std::vector<byte> blob;
    if (!from_base64(ciphertext_text, blob)) {
        throw CryptoError("malformed base64 ciphertext");
    }

    SecureBuffer plain(0);
    if (!decrypt_field_blob(key.data(),
        blob.data(),
        blob.size(),
        ad_ptr(associated_data),
        associated_data.size(),
        plain)) {
        throw CryptoError("decryption failed");
    }

    std::string out = plain.str();
    if (!is_valid_utf8(out)) {
        secure_clear_string(out);
        throw EncodingError("decrypted value is not valid UTF-8");
    }
    return out;
}

std::string CipherCodec::encrypt(
    const std::string& passphrase,
    const std::vector<byte>& salt,
    const std::string& plaintext
) const
{
    SecureBuffer key = derive_key(passphrase, salt);
    return encrypt_with_key(key, plaintext);
}

std::string CipherCodec::decrypt(
    const std::string& passphrase,
    const std::vector<byte>& salt,
    const std::string& ciphertext_text
) const
{
    if (ciphertext_text.empty()) {
        return std::string();
    }
    SecureBuffer key = derive_key(passphrase, salt);
    return decrypt_with_key(key, ciphertext_text);
}
