#include "hintc/cache.hpp"
#include "hintc/errors.hpp"
#include <cstdio>

namespace hintc {

CheckerPtr CheckerCache::lookup(const CheckerKey& key) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = entries_.find(key);
    return it==entries_.end() ? nullptr : it->second;
}

CheckerPtr CheckerCache::find(const node_ptr& raw, const ScopePtr& scope, Strategy strategy) const {
    const ScopePtr& s = scope ? scope : builtin_scope();
    return lookup(CheckerKey{raw.get(), s.get(), strategy});
}

CheckerPtr CheckerCache::get_or_compile(const node_ptr& raw, ScopePtr scope, const CheckConf& conf){
    if(!raw) throw unsupported_specification("null specification");
    if(!scope) scope = builtin_scope();
    CheckerKey key{raw.get(), scope.get(), conf.strategy};

    if(CheckerPtr hit = lookup(key)){
        hits_.fetch_add(1, std::memory_order_relaxed);
        return hit;
    }

    std::lock_guard<std::mutex> compiling(compile_mu_);
    // another thread may have published while we waited
    if(CheckerPtr hit = lookup(key)){
        hits_.fetch_add(1, std::memory_order_relaxed);
        return hit;
    }
    CheckerPtr compiled = Synthesizer::compile(raw, scope, conf);
    compilations_.fetch_add(1, std::memory_order_relaxed);
    {
        std::unique_lock<std::shared_mutex> lock(mu_);
        entries_.emplace(key, compiled);
    }
    if(conf.debug)
        std::fprintf(stderr, "[dbg][cache] published %s (%s), %zu entries\n",
            to_string(raw).c_str(), strategy_name(conf.strategy), size());
    return compiled;
}

CacheStats CheckerCache::stats() const {
    CacheStats s;
    s.compilations = compilations_.load(std::memory_order_relaxed);
    s.hits = hits_.load(std::memory_order_relaxed);
    s.entries = size();
    return s;
}

size_t CheckerCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return entries_.size();
}

} // namespace hintc
