// Reducer: raw specification -> canonical, cycle-safe SpecTree
#pragma once
#include <string>
#include <unordered_map>
#include "hintc/value.hpp"
#include "hintc/scope.hpp"
#include "hintc/spec.hpp"
#include "hintc/desugar.hpp"
#include "hintc/classify.hpp"

namespace hintc {

// Each raw sub-specification is desugared, classified and reduced bottom-up into one arena.
// Forward references to a definition that is still being reduced become back-edges onto the
// definition's root; such a cycle must pass through at least one container.
class Reducer {
public:
    Reducer(const HintScope& scope, const Desugarer& sugar = Desugarer::standard(), bool debug = false)
        : scope_(scope), sugar_(sugar), debug_(debug) {}

    // Throws unsupported_specification, unresolved_forward_reference, malformed_container_arity.
    SpecTree reduce(const node_ptr& raw);

private:
    struct Pending {
        NodeId placeholder;
        int container_depth; // depth at which the definition started
        bool referenced{false};
    };

    NodeId build(const node_ptr& raw);
    NodeId build_union(const node_ptr& raw, const Classification& c);
    NodeId build_container(const node_ptr& raw, const Classification& c);
    NodeId build_literal(const node_ptr& raw, const Classification& c);
    NodeId resolve(const std::string& name);
    NodeId resolve_definition(const std::string& name, const node_ptr& def);
    NodeId atomic(ClassId cls, const node_ptr& origin);
    void flatten_unions(NodeId root);

    bool same(NodeId a, NodeId b) const;
    bool is_back_edge(NodeId id) const;

    const HintScope& scope_;
    const Desugarer& sugar_;
    bool debug_;
    SpecTree tree_;
    std::unordered_map<std::string, Pending> pending_;
    std::unordered_map<std::string, NodeId> resolved_;
    int container_depth_ = 0;
};

// Convenience wrapper: Reducer(scope).reduce(raw).
SpecTree reduce(const node_ptr& raw, const HintScope& scope, bool debug = false);

} // namespace hintc
