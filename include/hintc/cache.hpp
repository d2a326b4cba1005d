// Compilation cache: (specification identity, scope, strategy) -> compiled checker
#pragma once
#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include "hintc/synth.hpp"

namespace hintc {

struct CacheStats {
    size_t compilations = 0; // actual compilations, one per key
    size_t hits = 0;         // lookups served from the cache
    size_t entries = 0;
};

// Process-scoped cache handed by reference to every compile. Entries are never evicted.
// Lookups take a shared lock; a miss compiles under a single compile mutex, so a key is
// compiled at most once even when several threads miss on it together.
// Compile errors are not cached: a later call compiles again and raises again.
class CheckerCache {
public:
    CheckerCache() = default;
    CheckerCache(const CheckerCache&) = delete;
    CheckerCache& operator=(const CheckerCache&) = delete;

    CheckerPtr get_or_compile(const node_ptr& raw, ScopePtr scope, const CheckConf& conf = {});
    // Already compiled checker for the key, or nullptr.
    CheckerPtr find(const node_ptr& raw, const ScopePtr& scope, Strategy strategy) const;

    CacheStats stats() const;
    size_t size() const;

private:
    CheckerPtr lookup(const CheckerKey& key) const;

    mutable std::shared_mutex mu_;
    std::mutex compile_mu_;
    std::unordered_map<CheckerKey, CheckerPtr, CheckerKeyHash> entries_;
    std::atomic<size_t> compilations_{0};
    mutable std::atomic<size_t> hits_{0};
};

} // namespace hintc
