#pragma once
#include "tokenvault_common.hpp"
#include "secure_buffer.hpp"

#include <string>
#include <vector>

// ---------- SessionID ----------
std::string generate_session_id();

// ---------- Helpers: input validation ----------
bool is_valid_utf8(const std::string& s);
bool valid_namespace(const std::string& ns);
// Whole-string base-10 signed 64-bit parse; no whitespace, no '+'
bool parse_epoch(const std::string& s, std::int64_t& out);
// argv shape check for the CLI, run before anything touches disk
bool valid_cli_args(const std::vector<std::string>& args);

// ---------- Secure input ----------
SecureBuffer get_password_secure(const char* prompt);

// ---------- Memory cleanup ----------
void secure_clear_string(std::string& s);
void secure_clear_record(AccessTokenRecord& r);
