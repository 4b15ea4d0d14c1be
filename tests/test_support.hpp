#pragma once
#include <gtest/gtest.h>

#include "cipher_codec.hpp"
#include "logging.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

// Cheapest Argon2id parameters libsodium accepts; keeps the suite fast.
inline KdfParams fast_kdf() {
    KdfParams p;
    p.opslimit = crypto_pwhash_OPSLIMIT_MIN;
    p.memlimit = crypto_pwhash_MEMLIMIT_MIN;
    return p;
}

inline std::vector<byte> bytes_of(const std::string& s) {
    return std::vector<byte>(s.begin(), s.end());
}

// Private scratch directory, removed on destruction
class TempDir {
public:
    TempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "tokenvault-test-XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (!mkdtemp(buf.data())) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = buf.data();
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const { return path_ + "/" + name; }

private:
    std::string path_;
};

// Initializes libsodium and sends audit output to a scratch file
class VaultTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_GE(sodium_init(), 0);
        set_audit_log_path(log_dir_.file("audit.log"));
        set_audit_min_level(LogLevel::INFO);
    }

    void TearDown() override {
        set_audit_log_path("");
    }

    std::string read_audit_log() const {
        std::ifstream in(audit_log_path());
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    TempDir log_dir_;
};

inline void PrintTo(const AccessTokenRecord& r, std::ostream* os) {
    *os << "{access_token=" << r.access_token
        << ", expires_at=" << r.expires_at
        << ", refresh_token=" << r.refresh_token
        << ", user_id=" << r.user_id << "}";
}
