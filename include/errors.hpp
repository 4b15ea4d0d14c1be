#pragma once
#include <stdexcept>
#include <string>

// -------- Vault error taxonomy --------
// Every failure surfaced by the vault derives from VaultError.

class VaultError : public std::runtime_error {
public:
    explicit VaultError(const std::string& what)
        : std::runtime_error(what) {}
};

// key derivation, cipher init/execution, base64 decoding, authentication
class CryptoError : public VaultError {
public:
    explicit CryptoError(const std::string& what)
        : VaultError(what) {}
};

// text is not valid UTF-8
class EncodingError : public VaultError {
public:
    explicit EncodingError(const std::string& what)
        : VaultError(what) {}
};

// decrypted field does not parse, or the stored record is incomplete
class FormatError : public VaultError {
public:
    explicit FormatError(const std::string& what)
        : VaultError(what) {}
};

// device salt source cannot produce a salt
class SaltUnavailableError : public VaultError {
public:
    explicit SaltUnavailableError(const std::string& what)
        : VaultError(what) {}
};

// persistent store I/O, ownership/permission or naming failure
class StoreError : public VaultError {
public:
    explicit StoreError(const std::string& what)
        : VaultError(what) {}
};
