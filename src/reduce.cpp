#include "hintc/reduce.hpp"
#include "hintc/hint_parser.hpp"
#include "hintc/errors.hpp"
#include <unordered_set>
#include <algorithm>
#include <cstdio>

namespace hintc {

namespace {

size_t edit_distance(const std::string& a, const std::string& b){
    std::vector<size_t> prev(b.size()+1), cur(b.size()+1);
    for(size_t j=0;j<=b.size();++j) prev[j]=j;
    for(size_t i=1;i<=a.size();++i){
        cur[0]=i;
        for(size_t j=1;j<=b.size();++j)
            cur[j] = std::min({prev[j]+1, cur[j-1]+1, prev[j-1] + (a[i-1]==b[j-1] ? 0 : 1)});
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

std::string did_you_mean(const std::string& name, const HintScope& scope){
    std::string best;
    size_t best_d = 3; // only suggest close names
    for(auto& cand : scope.all_names()){
        size_t d = edit_distance(name, cand);
        if(d < best_d){ best_d = d; best = cand; }
    }
    return best.empty() ? std::string() : " (did you mean '" + best + "'?)";
}

} // namespace

SpecTree Reducer::reduce(const node_ptr& raw){
    tree_ = SpecTree{};
    pending_.clear();
    resolved_.clear();
    container_depth_ = 0;
    NodeId root = build(raw);
    tree_.set_root(root);
    flatten_unions(root);

    // every reachable node is resolved and well-formed
    std::unordered_set<NodeId> seen;
    std::vector<NodeId> work{root};
    while(!work.empty()){
        NodeId id = work.back(); work.pop_back();
        if(!seen.insert(id).second) continue;
        const SpecNode& n = tree_.at(id);
        if(n.sign==Sign::Forward)
            throw unresolved_forward_reference(n.name, "forward reference '" + n.name + "' was never resolved");
        tree_.validate_arity(id);
        for(NodeId c : n.children) work.push_back(c);
    }
    return std::move(tree_);
}

// A union alternative that was a pending definition's placeholder may have become a union
// itself once the definition finished; splice such alternatives into their parent.
void Reducer::flatten_unions(NodeId root){
    std::unordered_set<NodeId> seen;
    std::vector<NodeId> work{root};
    while(!work.empty()){
        NodeId id = work.back(); work.pop_back();
        if(!seen.insert(id).second) continue;
        if(tree_.at(id).sign==Sign::Union){
            std::vector<NodeId> flat;
            std::unordered_set<NodeId> spliced{id};
            std::vector<NodeId> pending(tree_.at(id).children.rbegin(), tree_.at(id).children.rend());
            while(!pending.empty()){
                NodeId c = pending.back(); pending.pop_back();
                const SpecNode& alt = tree_.at(c);
                if(alt.sign==Sign::Union){
                    if(spliced.insert(c).second) pending.insert(pending.end(), alt.children.rbegin(), alt.children.rend());
                    continue;
                }
                if(std::find(flat.begin(), flat.end(), c)==flat.end()) flat.push_back(c);
            }
            if(flat.size()!=tree_.at(id).children.size() && debug_)
                std::fprintf(stderr, "[dbg][reduce] union node %u flattened to %zu alternatives\n", id, flat.size());
            tree_.at(id).children = std::move(flat);
        }
        for(NodeId c : tree_.at(id).children) work.push_back(c);
    }
}

NodeId Reducer::atomic(ClassId cls, const node_ptr& origin){
    if(cls==class_id(Builtin::Any)) return tree_.add_ignorable(origin);
    return tree_.add_atomic(cls, origin);
}

NodeId Reducer::build(const node_ptr& raw){
    node_ptr form = sugar_.expand(raw);
    Classification c = classify(form, scope_);
    switch(c.sign){
        case Sign::Ignorable: return tree_.add_ignorable(form);
        case Sign::Atomic: return atomic(c.cls, form);
        case Sign::Union: return build_union(form, c);
        case Sign::Container: return build_container(form, c);
        case Sign::Literal: return build_literal(form, c);
        case Sign::Predicate: {
            SpecNode n;
            n.sign = Sign::Predicate;
            n.predicate = c.predicate;
            n.name = c.name;
            n.origin = form;
            return tree_.add(std::move(n));
        }
        case Sign::Forward: return resolve(c.name);
    }
    throw unsupported_specification("unclassifiable specification: " + to_string(form));
}

bool Reducer::is_back_edge(NodeId id) const {
    return tree_.at(id).sign==Sign::Forward;
}

// Structural equality of reduced nodes. Definitions and back-edges compare by identity.
bool Reducer::same(NodeId a, NodeId b) const {
    if(a==b) return true;
    const SpecNode& x = tree_.at(a);
    const SpecNode& y = tree_.at(b);
    if(is_back_edge(a) || is_back_edge(b)) return false;
    if(!x.def_name.empty() || !y.def_name.empty()) return false;
    if(x.sign!=y.sign) return false;
    auto same_children = [&]{
        if(x.children.size()!=y.children.size()) return false;
        for(size_t i=0;i<x.children.size();++i) if(!same(x.children[i], y.children[i])) return false;
        return true;
    };
    switch(x.sign){
        case Sign::Ignorable: return true;
        case Sign::Atomic: return x.cls==y.cls;
        case Sign::Literal:
            if(x.values.size()!=y.values.size()) return false;
            for(size_t i=0;i<x.values.size();++i) if(!equal(x.values[i], y.values[i])) return false;
            return true;
        case Sign::Predicate:
            // named scope predicates share one node; host functions that merely share a name do not
            return x.predicate.get()==y.predicate.get();
        case Sign::Container: return x.cls==y.cls && x.arity==y.arity && same_children();
        case Sign::Union: return same_children();
        case Sign::Forward: return false;
    }
    return false;
}

NodeId Reducer::build_union(const node_ptr& raw, const Classification& c){
    std::vector<NodeId> flat;
    bool ignorable = false;
    for(auto& arg : c.args){
        NodeId id = build(arg); // keep going after an Ignorable so bad alternatives still raise
        const SpecNode& n = tree_.at(id);
        if(n.sign==Sign::Ignorable) ignorable = true;
        else if(n.sign==Sign::Union) flat.insert(flat.end(), n.children.begin(), n.children.end());
        else flat.push_back(id);
    }
    if(ignorable) return tree_.add_ignorable(raw);

    // `nothing` never matches; it only survives as the sole alternative
    const ClassId nothing = class_id(Builtin::Nothing);
    std::vector<NodeId> alts;
    for(NodeId id : flat){
        const SpecNode& n = tree_.at(id);
        if(n.sign==Sign::Atomic && n.cls==nothing) continue;
        alts.push_back(id);
    }
    if(alts.empty()) return tree_.add_atomic(nothing, raw);

    // merge literal alternatives into the first one, then drop duplicates
    std::vector<NodeId> out;
    NodeId merged_literal = 0;
    bool has_literal = false;
    std::vector<node_ptr> literal_values;
    for(NodeId id : alts){
        const SpecNode& n = tree_.at(id);
        if(n.sign==Sign::Literal && n.def_name.empty()){
            if(!has_literal){ has_literal = true; merged_literal = id; out.push_back(id); }
            literal_values.insert(literal_values.end(), n.values.begin(), n.values.end());
            continue;
        }
        bool dup = false;
        for(NodeId o : out) if(same(o, id)){ dup = true; break; }
        if(!dup) out.push_back(id);
    }
    if(has_literal && literal_values.size()!=tree_.at(merged_literal).values.size()){
        Classification lit;
        lit.sign = Sign::Literal;
        lit.args = std::move(literal_values);
        node_ptr origin = tree_.at(merged_literal).origin;
        NodeId fresh = build_literal(origin, lit);
        std::replace(out.begin(), out.end(), merged_literal, fresh);
    }
    if(out.size()==1) return out.front();

    SpecNode u;
    u.sign = Sign::Union;
    u.children = std::move(out);
    u.origin = raw;
    return tree_.add(std::move(u));
}

NodeId Reducer::build_container(const node_ptr& raw, const Classification& c){
    std::vector<NodeId> children;
    ++container_depth_;
    for(auto& arg : c.args) children.push_back(build(arg));
    --container_depth_;

    bool all_ignorable = std::all_of(children.begin(), children.end(),
        [&](NodeId id){ return tree_.at(id).sign==Sign::Ignorable; });
    // A fixed vector keeps its length check; tagged classes and homogeneous containers do not need one.
    if(all_ignorable && !(c.arity==Arity::Fixed && c.cls==class_id(Builtin::Vector)))
        return atomic(c.cls, raw);

    SpecNode n;
    n.sign = Sign::Container;
    n.cls = c.cls;
    n.arity = c.arity;
    n.children = std::move(children);
    n.origin = raw;
    NodeId id = tree_.add(std::move(n));
    tree_.validate_arity(id);
    return id;
}

NodeId Reducer::build_literal(const node_ptr& raw, const Classification& c){
    SpecNode n;
    n.sign = Sign::Literal;
    n.origin = raw;
    std::unordered_set<node_ptr, node_hash, node_equal> seen;
    for(auto& v : c.args)
        if(seen.insert(v).second) n.values.push_back(v);
    return tree_.add(std::move(n));
}

NodeId Reducer::resolve(const std::string& name){
    auto done = resolved_.find(name);
    if(done!=resolved_.end()) return done->second;

    auto p = pending_.find(name);
    if(p!=pending_.end()){
        if(p->second.container_depth==container_depth_)
            throw unresolved_forward_reference(name, "'" + name + "' refers back to itself without passing through a container");
        p->second.referenced = true;
        if(debug_) std::fprintf(stderr, "[dbg][reduce] back-edge to '%s' (node %u)\n", name.c_str(), p->second.placeholder);
        return p->second.placeholder;
    }

    if(const node_ptr* def = scope_.find_definition(name)) return resolve_definition(name, *def);

    if(!is_bare_name(name)){
        if(debug_) std::fprintf(stderr, "[dbg][reduce] parsing hint string \"%s\"\n", name.c_str());
        return build(parse_hint(name));
    }
    // bare names outside the scope may still be spellings of builtins (None, Any, str, ...)
    node_ptr bare = parse_hint(name);
    if(classify(bare, scope_).sign==Sign::Forward)
        throw unresolved_forward_reference(name, "'" + name + "' does not name a class, predicate or definition"
            + did_you_mean(name, scope_));
    return build(bare);
}

NodeId Reducer::resolve_definition(const std::string& name, const node_ptr& def){
    SpecNode ph;
    ph.sign = Sign::Forward;
    ph.name = name;
    ph.origin = def;
    NodeId placeholder = tree_.add(std::move(ph));
    pending_[name] = Pending{placeholder, container_depth_};
    if(debug_) std::fprintf(stderr, "[dbg][reduce] resolving '%s' at depth %d\n", name.c_str(), container_depth_);

    NodeId result = build(def);
    bool referenced = pending_[name].referenced;
    pending_.erase(name);

    if(is_back_edge(result)){
        // `B = A` while A is still pending: B is an alias of A's placeholder
        resolved_[name] = result;
        return result;
    }
    SpecNode copy = tree_.at(result);
    copy.def_name = name;
    tree_.at(placeholder) = std::move(copy);
    resolved_[name] = placeholder;
    if(debug_) std::fprintf(stderr, "[dbg][reduce] '%s' -> node %u (%s%s)\n", name.c_str(), placeholder,
        sign_name(tree_.at(placeholder).sign), referenced ? ", recursive" : "");
    return placeholder;
}

SpecTree reduce(const node_ptr& raw, const HintScope& scope, bool debug){
    Reducer r(scope, Desugarer::standard(), debug);
    return r.reduce(raw);
}

} // namespace hintc
