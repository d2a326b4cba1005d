// Code synthesizer: reduced SpecTree -> sampling checker closure
#pragma once
#include <functional>
#include <memory>
#include <vector>
#include <cstddef>
#include "hintc/value.hpp"
#include "hintc/scope.hpp"
#include "hintc/spec.hpp"
#include "hintc/conf.hpp"

namespace hintc {

using CheckFn = std::function<bool(const node_ptr&)>;

// Identity of a compilation: the raw specification object, the scope it resolves in, and the
// strategy. Structurally equal specifications held by different nodes are different keys.
struct CheckerKey {
    const node* spec{nullptr};
    const HintScope* scope{nullptr};
    Strategy strategy{Strategy::O1};
    bool operator==(const CheckerKey& o) const { return spec==o.spec && scope==o.scope && strategy==o.strategy; }
};

struct CheckerKeyHash {
    size_t operator()(const CheckerKey& k) const {
        size_t h = std::hash<const void*>{}(k.spec);
        h ^= std::hash<const void*>{}(k.scope) + 0x9e3779b97f4a7c15ull + (h<<6) + (h>>2);
        return h ^ (static_cast<size_t>(k.strategy) << 1);
    }
};

// Synthesized checker plus everything the violation reporter needs. Immutable once built;
// keeps the raw specification and the scope alive so the key stays unique.
class CompiledChecker {
public:
    CompiledChecker(const CompiledChecker&) = delete;
    CompiledChecker& operator=(const CompiledChecker&) = delete;

    // O(1) per call under O0/O1. `value` must not be null. Never throws for
    // non-conforming values; exceptions from host predicates propagate.
    bool check(const node_ptr& value) const { return root_(value); }
    bool operator()(const node_ptr& value) const { return root_(value); }

    const SpecTree& tree() const { return tree_; }
    const HintScope& scope() const { return *scope_; }
    const ScopePtr& scope_ptr() const { return scope_; }
    const node_ptr& spec() const { return spec_; }
    const CheckerKey& key() const { return key_; }
    Strategy strategy() const { return key_.strategy; }
    // True when no code was generated for the root (Ignorable root, or checking disabled).
    bool accepts_everything() const { return trivial_; }

private:
    friend class Synthesizer;
    CompiledChecker(SpecTree tree, node_ptr spec, ScopePtr scope, Strategy strategy)
        : tree_(std::move(tree)), spec_(std::move(spec)), scope_(std::move(scope)),
          key_{spec_.get(), scope_.get(), strategy} {}

    SpecTree tree_;
    node_ptr spec_;
    ScopePtr scope_;
    CheckerKey key_;
    CheckFn root_;
    bool trivial_{false};
    std::vector<CheckFn> slots_; // back-edge targets, indexed by NodeId
};

using CheckerPtr = std::shared_ptr<const CompiledChecker>;

class Synthesizer {
public:
    // Reduce `raw` in `scope` and synthesize its checker. Not cached.
    static CheckerPtr compile(const node_ptr& raw, ScopePtr scope, const CheckConf& conf);

private:
    explicit Synthesizer(CompiledChecker& out);
    CheckFn emit(NodeId id);
    CheckFn emit_node(NodeId id);
    CheckFn emit_union(const SpecNode& n);
    CheckFn emit_container(const SpecNode& n);
    int cost(NodeId id) const;
    bool ignorable(NodeId id) const;

    CompiledChecker& out_;
    const ClassTable* classes_;
    Strategy strategy_;
    std::vector<CheckFn> fns_;
    std::vector<char> done_;
    std::vector<char> active_;
    std::vector<char> lazy_;
};

// Uniform index in [0, n) from the calling thread's generator. n must be > 0.
size_t sample_index(size_t n);

// nil, bool, int, float, string, keyword or symbol: values hashed in constant time.
bool is_scalar(const node& v);

// Elements of a list, vector or set value; nullptr for anything else.
const std::vector<node_ptr>* elements_of(const node& v);

} // namespace hintc
