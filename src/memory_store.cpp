#include "memory_store.hpp"
#include "errors.hpp"
#include "logging.hpp"

std::optional<std::string> MemoryStore::get(const std::string& ns,
    const std::string& key) const
{
    auto nit = data_.find(ns);
    if (nit == data_.end()) return std::nullopt;
    auto kit = nit->second.find(key);
    if (kit == nit->second.end()) return std::nullopt;
    return kit->second;
}

bool MemoryStore::contains(const std::string& ns, const std::string& key) const {
    auto nit = data_.find(ns);
    return nit != data_.end() && nit->second.count(key) != 0;
}

void MemoryStore::apply(const std::string& ns, const StoreBatch& batch) {
    ++apply_count_;
    if (fail_applies_ > 0) {
        --fail_applies_;
        audit_log_level(LogLevel::WARN,
            "MemoryStore: injected apply failure for " + ns,
            "store_module",
            "failure");
        throw StoreError("injected store failure");
    }

    auto it = data_.find(ns);
    std::map<std::string, std::string> next =
        (it != data_.end()) ? it->second : std::map<std::string, std::string>();
    apply_batch_to_map(batch, next);

    if (next.empty()) {
        data_.erase(ns);
    }
    else {
        data_[ns].swap(next);
    }
}

size_t MemoryStore::size(const std::string& ns) const {
    auto it = data_.find(ns);
    return it == data_.end() ? 0 : it->second.size();
}
