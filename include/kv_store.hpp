#pragma once
#include "tokenvault_common.hpp"

// -------- Store batch --------
// Ordered put/remove operations committed together by KeyValueStore::apply.
struct StoreOp {
    enum class Kind { Put, Remove };
    Kind kind;
    std::string key;
    std::string value; // unused for Remove
};

class StoreBatch {
public:
    StoreBatch& put(const std::string& key, const std::string& value) {
        ops_.push_back(StoreOp{ StoreOp::Kind::Put, key, value });
        return *this;
    }

    StoreBatch& remove(const std::string& key) {
        ops_.push_back(StoreOp{ StoreOp::Kind::Remove, key, std::string() });
        return *this;
    }

    const std::vector<StoreOp>& ops() const { return ops_; }
    bool empty() const { return ops_.empty(); }

    // Wipes queued values (they are ciphertext, but may be large).
    void clear() {
        for (auto& op : ops_) {
            if (!op.value.empty()) sodium_memzero(&op.value[0], op.value.size());
        }
        ops_.clear();
    }

private:
    std::vector<StoreOp> ops_;
};

// Applies a batch to a plain key -> value map
inline void apply_batch_to_map(const StoreBatch& batch,
    std::map<std::string, std::string>& entries)
{
    for (const auto& op : batch.ops()) {
        if (op.kind == StoreOp::Kind::Put) {
            entries[op.key] = op.value;
        }
        else {
            entries.erase(op.key);
        }
    }
}

// -------- Namespaced text key-value store --------
// Failures raise StoreError. Removing an absent key is not an error.
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual std::optional<std::string> get(const std::string& ns,
        const std::string& key) const = 0;

    virtual bool contains(const std::string& ns,
        const std::string& key) const
    {
        return get(ns, key).has_value();
    }

    // All operations of the batch take effect together or not at all.
    virtual void apply(const std::string& ns, const StoreBatch& batch) = 0;

    void put(const std::string& ns, const std::string& key, const std::string& value) {
        StoreBatch b;
        b.put(key, value);
        apply(ns, b);
    }

    void remove(const std::string& ns, const std::string& key) {
        StoreBatch b;
        b.remove(key);
        apply(ns, b);
    }
};
