#include "file_store.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "util.hpp"

// -------- Escaping --------
std::string escape_str(const std::string& s) {
    std::string r; r.reserve(s.size());
    for (unsigned char c : s) {
        if (c == '\n') { r += "\\n"; }
        else if (c == '\t') { r += "\\t"; }
        else if (c == '\\') { r += "\\\\"; }
        else r.push_back(c);
    }
    return r;
}

std::string unescape_str(const std::string& x) {
    std::string r; r.reserve(x.size());
    for (size_t i = 0; i < x.size(); ++i) {
        if (x[i] == '\\' && i + 1 < x.size()) {
            if (x[i + 1] == 'n') { r.push_back('\n'); ++i; }
            else if (x[i + 1] == 't') { r.push_back('\t'); ++i; }
            else if (x[i + 1] == '\\') { r.push_back('\\'); ++i; }
            else r.push_back(x[i]);
        }
        else r.push_back(x[i]);
    }
    return r;
}


// ----------- Serialize entries to text ------------
std::string serialize_entries(const std::map<std::string, std::string>& m) {
    std::ostringstream oss;
    for (const auto& p : m) {
        oss << escape_str(p.first) << '\t' << escape_str(p.second) << '\n';
    }
    return oss.str();
}


// ----------- Deserialize text to entries ------------
std::map<std::string, std::string> deserialize_entries(const std::string& s) {
    std::map<std::string, std::string> m;
    std::istringstream iss(s);
    std::string line;

    while (std::getline(iss, line)) {
        if (line.empty()) continue;

        size_t tab = line.find('\t');
        if (tab == std::string::npos || tab == 0) {
            // malformed line -> skip and log
            audit_log_level(LogLevel::WARN,
                "deserialize_entries: skipped malformed line",
                "store_module",
                "failure");
            continue;
        }

        m[unescape_str(line.substr(0, tab))] = unescape_str(line.substr(tab + 1));
    }

    return m;
}


// ---------- Path helpers ----------
bool ensure_dir_exists(const std::string& path, mode_t mode) {
    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        if (!S_ISDIR(st.st_mode)) {
            audit_log_level(LogLevel::ERROR,
                path + " exists but is not a directory",
                "store_module",
                "failure");
            return false;
        }
        if ((st.st_mode & 0777) != mode) {
            chmod(path.c_str(), mode);
        }
        return true;
    }
    if (mkdir(path.c_str(), mode) != 0) {
        if (errno != EEXIST) {
            audit_log_level(LogLevel::ERROR,
                "Failed to create directory " + path + ": " + strerror(errno),
                "store_module",
                "failure");
            return false;
        }
    }
    return true;
}


// -------- Ownership and permission checks ----------
bool check_file_ownership_and_perms(const std::string& path, bool allow_missing) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT && allow_missing) return true;
        audit_log_level(LogLevel::ERROR,
            "stat failed on " + path,
            "store_module",
            "failure");
        return false;
    }
    uid_t uid = geteuid();
    if (st.st_uid != uid) {
        audit_log_level(LogLevel::ERROR,
            "File ownership violation: " + path,
            "store_module",
            "failure");
        return false;
    }
    mode_t perms = st.st_mode & 0777;
    // No group/other access allowed
    if ((perms & 0077) != 0) {
        audit_log_level(LogLevel::ERROR,
            "Insecure file permissions on: " + path,
            "store_module",
            "failure");
        return false;
    }
    return true;
}


// -------- Atomic file write helper --------
bool atomic_write_file(const std::string& path, const byte* buf, size_t len) {
    if (!buf && len != 0) return false;
    if (len > MAX_STORE_FILE_SIZE) {
        audit_log_level(LogLevel::ERROR,
            "atomic_write_file: attempt to write huge file",
            "store_module",
            "failure");
        return false;
    }

    std::string tmpl = path + ".tmpXXXXXX";
    std::vector<char> temp(tmpl.begin(), tmpl.end());
    temp.push_back('\0');

    int fd = mkostemp(temp.data(), O_CLOEXEC);
    if (fd < 0) {
        audit_log_level(LogLevel::ERROR,
            "atomic_write_file: mkostemp failed",
            "store_module",
            "failure");
        return false;
    }
    // set perms to 0600
    if (fchmod(fd, S_IRUSR | S_IWUSR) != 0) {
        audit_log_level(LogLevel::ERROR,
            "atomic_write_file: fchmod failed",
            "store_module",
            "failure");
        close(fd);
        unlink(temp.data());
        return false;
    }
    size_t off = 0;
    while (off < len) {
        ssize_t w = write(fd, buf + off, len - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            audit_log_level(LogLevel::ERROR,
                "atomic_write_file: write failed",
                "store_module",
                "failure");
            close(fd);
            unlink(temp.data());
            return false;
        }
        off += static_cast<size_t>(w);
    }
    if (fsync(fd) != 0) {
        audit_log_level(LogLevel::ERROR,
            "atomic_write_file: fsync failed",
            "store_module",
            "failure");
        close(fd);
        unlink(temp.data());
        return false;
    }
    if (close(fd) != 0) {
        audit_log_level(LogLevel::WARN,
            "atomic_write_file: close failed",
            "store_module",
            "failure");
    }
    if (rename(temp.data(), path.c_str()) != 0) {
        audit_log_level(LogLevel::ERROR,
            "atomic_write_file: rename failed",
            "store_module",
            "failure");
        unlink(temp.data());
        return false;
    }
    return true;
}


// -------- Secure deletion --------
void secure_delete_file(const char* path) {
    if (!path) return;
    struct stat st;
    if (lstat(path, &st) != 0) {
        return; // nothing to delete
    }

    if (S_ISLNK(st.st_mode)) {
        audit_log_level(LogLevel::WARN,
            std::string("secure_delete_file: refused to delete symlink: ") + path,
            "store_module",
            "failure");
        return;
    }

    if (st.st_uid != geteuid()) {
        audit_log_level(LogLevel::WARN,
            "secure_delete_file: refused, wrong owner",
            "store_module",
            "failure");
        return;
    }

    FILE* f = fopen(path, "r+");
    if (!f) {
        std::remove(path);
        return;
    }

    long lsz = st.st_size;
    if (lsz > 0 && (unsigned long)lsz <= MAX_STORE_FILE_SIZE) {
        rewind(f);
        std::vector<byte> zeros((size_t)lsz, 0);
        (void)fwrite(zeros.data(), 1, zeros.size(), f);
        fflush(f);
        fsync(fileno(f));
    }

    fclose(f);
    std::remove(path);
}


// -------- FileStore --------
FileStore::FileStore(const std::string& root_dir)
    : root_(root_dir)
{
    if (root_.empty()) {
        throw StoreError("FileStore: empty root directory");
    }
    while (root_.size() > 1 && root_.back() == '/') root_.pop_back();

    if (!ensure_dir_exists(root_, S_IRWXU)) {
        throw StoreError("FileStore: cannot create root directory " + root_);
    }
}

std::string FileStore::path_for(const std::string& ns) const {
    if (!valid_namespace(ns)) {
        audit_log_level(LogLevel::WARN,
            "FileStore: rejected namespace name",
            "store_module",
            "failure");
        throw StoreError("invalid namespace name: " + ns);
    }
    return root_ + "/" + ns + STORE_FILE_EXT;
}

std::map<std::string, std::string> FileStore::read_entries(const std::string& ns) const {
    const std::string path = path_for(ns);

    if (!check_file_ownership_and_perms(path, true)) {
        throw StoreError("store file fails ownership/permission check: " + path);
    }

    FILE* f = fopen(path.c_str(), "rb");
    if (!f) {
        if (errno == ENOENT) return {};
        audit_log_level(LogLevel::ERROR,
            "FileStore: fopen failed on " + path,
            "store_module",
            "failure");
        throw StoreError("cannot open store file: " + path);
    }

    if (fseek(f, 0, SEEK_END) != 0) {
        fclose(f);
        throw StoreError("fseek end failed: " + path);
    }
    long sz = ftell(f);
    if (sz < 0) {
        fclose(f);
        throw StoreError("ftell failed: " + path);
    }
    if ((unsigned long)sz > MAX_STORE_FILE_SIZE) {
        fclose(f);
        audit_log_level(LogLevel::WARN,
            "Store file too large or corrupt: " + path,
            "store_module",
            "failure");
        throw StoreError("store file too large: " + path);
    }
    if (fseek(f, 0, SEEK_SET) != 0) {
        fclose(f);
        throw StoreError("fseek set failed: " + path);
    }

    std::string content;
    content.resize(static_cast<size_t>(sz));
    if (sz > 0) {
        size_t r = fread(&content[0], 1, content.size(), f);
        if (r != content.size()) {
            fclose(f);
            audit_log_level(LogLevel::ERROR,
                "fread failed on store file " + path,
                "store_module",
                "failure");
            throw StoreError("read failed: " + path);
        }
    }
    fclose(f);

    return deserialize_entries(content);
}

std::optional<std::string> FileStore::get(const std::string& ns,
    const std::string& key) const
{
    auto entries = read_entries(ns);
    auto it = entries.find(key);
    if (it == entries.end()) return std::nullopt;
    return it->second;
}

void FileStore::apply(const std::string& ns, const StoreBatch& batch) {
    const std::string path = path_for(ns);
    // an empty key would serialize to a line deserialize_entries() drops
    for (const StoreOp& op : batch.ops()) {
        if (op.key.empty()) {
            audit_log_level(LogLevel::WARN,
                "FileStore: empty key rejected for " + ns,
                "store_module",
                "failure");
            throw StoreError("empty key in batch for " + ns);
        }
    }
    auto entries = read_entries(ns);
    apply_batch_to_map(batch, entries);

    if (entries.empty()) {
        secure_delete_file(path.c_str());
        struct stat st;
        if (lstat(path.c_str(), &st) == 0) {
            throw StoreError("could not remove empty store file: " + path);
        }
        return;
    }

    std::string content = serialize_entries(entries);
    bool ok = atomic_write_file(path,
        reinterpret_cast<const byte*>(content.data()),
        content.size());
    secure_clear_string(content);
    if (!ok) {
        throw StoreError("atomic write failed: " + path);
    }
}
