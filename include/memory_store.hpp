#pragma once
#include "kv_store.hpp"

// In-process store. apply() edits a copy and swaps it in.
class MemoryStore : public KeyValueStore {
public:
    std::optional<std::string> get(const std::string& ns,
        const std::string& key) const override;

    bool contains(const std::string& ns,
        const std::string& key) const override;

    void apply(const std::string& ns, const StoreBatch& batch) override;

    // Number of keys held under ns
    size_t size(const std::string& ns) const;

    // Next n apply() calls throw StoreError without touching any data
    void fail_next_applies(size_t n) { fail_applies_ = n; }
    void fail_next_apply() { fail_next_applies(1); }

    size_t apply_count() const { return apply_count_; }

private:
    std::map<std::string, std::map<std::string, std::string>> data_;
    size_t fail_applies_ = 0;
    size_t apply_count_ = 0;
};
