#include "logging.hpp"
#include "util.hpp"

LogContext g_log_ctx;

static std::string g_audit_log_path;
static LogLevel g_min_level = LogLevel::INFO;


// ---------------- Get username ----------------
static std::string get_system_username() {
    uid_t uid = geteuid();
    struct passwd* pw = getpwuid(uid);
    if (pw && pw->pw_name) {
        return std::string(pw->pw_name);
    }
    const char* envUser = std::getenv("USER");
    if (envUser && *envUser) {
        return std::string(envUser);
    }
    return "unknown";
}


// ---------------- Global logging context init ----------------
void init_log_context() {
    g_log_ctx.userId = get_system_username();
    g_log_ctx.sessionId = generate_session_id();
    g_log_ctx.pid = static_cast<long>(getpid());
}

void set_audit_log_path(const std::string& path) {
    g_audit_log_path = path;
}

const std::string& audit_log_path() {
    return g_audit_log_path;
}

void set_audit_min_level(LogLevel lvl) {
    g_min_level = lvl;
}


// ---------------- Logging (levels) ----------------
const char* log_level_str(LogLevel lvl) {
    switch (lvl) {
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::ALERT: return "ALERT";
    default:              return "UNKNOWN";
    }
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string up = name;
    std::transform(up.begin(), up.end(), up.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (up == "INFO")  { out = LogLevel::INFO;  return true; }
    if (up == "WARN")  { out = LogLevel::WARN;  return true; }
    if (up == "ERROR") { out = LogLevel::ERROR; return true; }
    if (up == "ALERT") { out = LogLevel::ALERT; return true; }
    return false;
}

void audit_log_level(
    LogLevel lvl,
    const std::string& entry,
    const std::string& event,
    const std::string& outcome
)
{
    if (static_cast<int>(lvl) < static_cast<int>(g_min_level)) {
        return;
    }

    const char* path = (!g_audit_log_path.empty()
        ? g_audit_log_path.c_str()
        : AUDIT_LOG);

    FILE* f = std::fopen(path, "a");
    if (!f) {
        std::fprintf(stderr, "[audit-fail] %s: %s\n",
            log_level_str(lvl),
            entry.c_str());
        return;
    }

    fchmod(fileno(f), S_IRUSR | S_IWUSR);

    // timestamp
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);

    char tbuf[64];
    if (std::strftime(tbuf, sizeof(tbuf), "%Y-%m-%d %H:%M:%S", &tm) == 0) {
        std::strncpy(tbuf, "0000-00-00 00:00:00", sizeof(tbuf));
        tbuf[sizeof(tbuf) - 1] = '\0';
    }

    // keep one entry per line
    auto sanitize = [](const std::string& s) {
        std::string r = s;
        for (char& c : r) {
            if (c == '\n' || c == '\r') c = ' ';
        }
        return r;
        };

    std::string s_entry = sanitize(entry);
    std::string s_event = sanitize(event);
    std::string s_outcome = sanitize(outcome);

    // timestamp | level | user | pid | session | event | outcome | message
    std::fprintf(
        f,
        "%s | %s | user=%s | pid=%ld | session=%s | event=%s | outcome=%s | %s\n",
        tbuf,
        log_level_str(lvl),
        g_log_ctx.userId.empty() ? "unknown" : g_log_ctx.userId.c_str(),
        g_log_ctx.pid,
        g_log_ctx.sessionId.c_str(),
        s_event.c_str(),
        s_outcome.c_str(),
        s_entry.c_str()
    );

    std::fflush(f);
    fsync(fileno(f));
    std::fclose(f);
}
