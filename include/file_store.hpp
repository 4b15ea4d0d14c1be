#pragma once
#include "kv_store.hpp"

// One owner-only file per namespace under root_dir:
//   <root_dir>/<ns>.kv, lines of "key<TAB>escaped-value"
// Every apply() rewrites the file atomically (temp file + fsync + rename).
class FileStore : public KeyValueStore {
public:
    // Creates root_dir (0700) if missing; throws StoreError otherwise.
    explicit FileStore(const std::string& root_dir);

    std::optional<std::string> get(const std::string& ns,
        const std::string& key) const override;

    void apply(const std::string& ns, const StoreBatch& batch) override;

    const std::string& root() const { return root_; }
    std::string path_for(const std::string& ns) const;

private:
    std::string root_;

    std::map<std::string, std::string> read_entries(const std::string& ns) const;
};

// -------- Entry file format --------
std::string escape_str(const std::string& s);
std::string unescape_str(const std::string& x);
std::string serialize_entries(const std::map<std::string, std::string>& m);
std::map<std::string, std::string> deserialize_entries(const std::string& s);

// -------- File helpers --------
bool ensure_dir_exists(const std::string& path, mode_t mode);
bool check_file_ownership_and_perms(const std::string& path, bool allow_missing);
bool atomic_write_file(const std::string& path, const byte* buf, size_t len);
void secure_delete_file(const char* path);
