#include "util.hpp"

#include <termios.h>
#include <array>
#include <charconv>


// ---------- SessionID ----------
std::string generate_session_id() {
    std::array<byte, 16> buf{};
    randombytes_buf(buf.data(), buf.size());

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.resize(32);

    for (size_t i = 0; i < buf.size(); ++i) {
        out[2 * i] = hex[(buf[i] >> 4) & 0x0F];
        out[2 * i + 1] = hex[buf[i] & 0x0F];
    }
    return out;
}


// ---------- Helpers: input validation ----------
bool is_valid_utf8(const std::string& s) {
    const unsigned char* p = reinterpret_cast<const unsigned char*>(s.data());
    size_t n = s.size();
    size_t i = 0;
    while (i < n) {
        unsigned char c = p[i];
        if (c < 0x80) { ++i; continue; }

        size_t len;
        unsigned int cp;
        if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k) {
            if ((p[i + k] & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (p[i + k] & 0x3F);
        }

        // overlong forms, surrogates, out of range
        if ((len == 2 && cp < 0x80) ||
            (len == 3 && cp < 0x800) ||
            (len == 4 && cp < 0x10000)) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;
        if (cp > 0x10FFFF) return false;

        i += len;
    }
    return true;
}

bool valid_namespace(const std::string& ns) {
    if (ns.empty() || ns.size() > MAX_NAMESPACE_LEN) return false;
    if (ns[0] == '.') return false; // also rejects "." and ".."
    return std::all_of(ns.begin(), ns.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
        });
}

bool parse_epoch(const std::string& s, std::int64_t& out) {
    if (s.empty()) return false;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    std::int64_t v = 0;
    auto res = std::from_chars(first, last, v, 10);
    if (res.ec != std::errc() || res.ptr != last) return false;
    out = v;
    return true;
}

bool valid_cli_args(const std::vector<std::string>& args) {
    if (args.empty()) return false;
    const std::string& cmd = args[0];
    if (cmd == "status" || cmd == "clear") return args.size() == 1;
    if (cmd == "save") return args.size() == 3;
    if (cmd == "show") {
        return args.size() == 1 || (args.size() == 2 && args[1] == "--reveal");
    }
    return false;
}


// ---------- Secure input ----------
static void disable_echo(bool disable) {
    termios tty;
    if (tcgetattr(STDIN_FILENO, &tty) != 0) return;

    if (disable) tty.c_lflag &= ~ECHO;
    else         tty.c_lflag |= ECHO;

    tcsetattr(STDIN_FILENO, TCSANOW, &tty);
}

SecureBuffer get_password_secure(const char* prompt) {
    std::cout << prompt;
    std::fflush(stdout);

    disable_echo(true);

    std::string s;
    std::getline(std::cin, s);

    disable_echo(false);
    std::cout << "\n";

    if (!s.empty() && s.back() == '\r') s.pop_back();

    SecureBuffer out(s.data(), s.size());
    secure_clear_string(s);
    return out;
}


// ---------- Memory cleanup ----------
void secure_clear_string(std::string& s) {
    if (!s.empty()) sodium_memzero(&s[0], s.size());
    s.clear();
}

void secure_clear_record(AccessTokenRecord& r) {
    secure_clear_string(r.access_token);
    secure_clear_string(r.refresh_token);
    secure_clear_string(r.user_id);
    r.expires_at = 0;
}
