#pragma once
#include "tokenvault_common.hpp"
#include "secure_buffer.hpp"

// Argon2id cost pair; see KDF_OPSLIMIT / KDF_MEMLIMIT
struct KdfParams {
    unsigned long long opslimit = KDF_OPSLIMIT;
    size_t memlimit = KDF_MEMLIMIT;
};

// Passphrase + device salt -> key; single text value <-> base64 ciphertext.
// Ciphertext text is base64(nonce || ciphertext || tag).
// Throws CryptoError / EncodingError.
class CipherCodec {
public:
    CipherCodec();
    explicit CipherCodec(const KdfParams& params);

    const KdfParams& params() const { return params_; }

    std::string encrypt(
        const std::string& passphrase,
        const std::vector<byte>& salt,
        const std::string& plaintext
    ) const;

    // Empty text decrypts to an empty string.
    std::string decrypt(
        const std::string& passphrase,
        const std::vector<byte>& salt,
        const std::string& ciphertext_text
    ) const;

    // Split form for callers protecting several values under one key.
    SecureBuffer derive_key(
        const std::string& passphrase,
        const std::vector<byte>& salt
    ) const;

    std::string encrypt_with_key(
        const SecureBuffer& key,
        const std::string& plaintext,
        const std::string& associated_data = ""
    ) const;

    std::string decrypt_with_key(
        const SecureBuffer& key,
        const std::string& ciphertext_text,
        const std::string& associated_data = ""
    ) const;

private:
    KdfParams params_;
};
