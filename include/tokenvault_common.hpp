#pragma once

#include <sodium.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <fcntl.h>
#include <pwd.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <iostream>
#include <sstream>
#include <ctime>
#include <cerrno>
#include <limits>
#include <algorithm>
#include <cctype>

// -------- Configuration constants --------
inline constexpr const char* DEFAULT_APP_ID = "tokenvault";
inline constexpr const char* NAMESPACE_SUFFIX = ".sdk";
inline constexpr const char* STORE_DIRNAME = ".tokenvault";
inline constexpr const char* STORE_FILE_EXT = ".kv";
inline constexpr const char* AUDIT_LOG = "audit.log";

// Fixed storage keys inside a namespace
inline constexpr const char* KEY_ACCESS_TOKEN = "access_token";
inline constexpr const char* KEY_EXPIRES_AT = "expires_at";
inline constexpr const char* KEY_REFRESH_TOKEN = "refresh_token";
inline constexpr const char* KEY_USER_ID = "user_id";
inline constexpr const char* const RECORD_KEYS[] = {
    KEY_ACCESS_TOKEN, KEY_EXPIRES_AT, KEY_REFRESH_TOKEN, KEY_USER_ID
};
inline constexpr size_t RECORD_KEY_COUNT = 4;

inline constexpr size_t SALT_LEN = crypto_pwhash_SALTBYTES; // Argon2 salt
inline constexpr size_t KEY_LEN = crypto_aead_xchacha20poly1305_ietf_KEYBYTES;
inline constexpr size_t NONCE_LEN = crypto_aead_xchacha20poly1305_ietf_NPUBBYTES;
inline constexpr size_t ABYTES = crypto_aead_xchacha20poly1305_ietf_ABYTES;

// Argon2id parameters. The same pair must be used for encrypt and decrypt;
// nothing in the stored text records which pair produced it.
inline constexpr unsigned long long KDF_OPSLIMIT = crypto_pwhash_OPSLIMIT_INTERACTIVE;
inline constexpr size_t KDF_MEMLIMIT = crypto_pwhash_MEMLIMIT_INTERACTIVE;

// limits
inline constexpr size_t MAX_PASSPHRASE_LEN = 1024;
inline constexpr size_t MAX_FIELD_LEN = 64 * 1024;
inline constexpr size_t MAX_NAMESPACE_LEN = 255;
inline constexpr size_t MAX_STORE_FILE_SIZE = 1024 * 1024; // 1 MB hard cap

using byte = unsigned char;

struct AccessTokenRecord {
    std::string access_token;
    std::int64_t expires_at = 0; // epoch value, unit chosen by the caller
    std::string refresh_token;
    std::string user_id;
};

inline bool operator==(const AccessTokenRecord& a, const AccessTokenRecord& b) {
    return a.access_token == b.access_token &&
        a.expires_at == b.expires_at &&
        a.refresh_token == b.refresh_token &&
        a.user_id == b.user_id;
}

inline bool operator!=(const AccessTokenRecord& a, const AccessTokenRecord& b) {
    return !(a == b);
}
