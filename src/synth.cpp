#include "hintc/synth.hpp"
#include "hintc/reduce.hpp"
#include "hintc/errors.hpp"
#include <random>
#include <algorithm>
#include <unordered_set>
#include <cstdio>

namespace hintc {

size_t sample_index(size_t n){
    thread_local std::minstd_rand rng{std::random_device{}()};
    return std::uniform_int_distribution<size_t>(0, n-1)(rng);
}

bool is_scalar(const node& v){
    switch(v.data.index()){
        case 0: case 1: case 2: case 3: case 4: case 5: case 6: return true;
    }
    return false;
}

const std::vector<node_ptr>* elements_of(const node& v){
    if(auto l = std::get_if<list>(&v.data)) return &l->elems;
    if(auto vec = std::get_if<vector_t>(&v.data)) return &vec->elems;
    if(auto s = std::get_if<set>(&v.data)) return &s->elems;
    return nullptr;
}

Synthesizer::Synthesizer(CompiledChecker& out)
    : out_(out), classes_(&out.scope().classes()), strategy_(out.strategy()) {
    size_t n = out.tree().size();
    fns_.resize(n);
    done_.assign(n, 0);
    active_.assign(n, 0);
    lazy_.assign(n, 0);
    out_.slots_.resize(n);
}

namespace {

struct SignCounts { size_t by_sign[7]{}; size_t reachable{0}; };

SignCounts count_signs(const SpecTree& t){
    SignCounts c;
    std::unordered_set<NodeId> seen;
    std::vector<NodeId> work{t.root()};
    while(!work.empty()){
        NodeId id = work.back(); work.pop_back();
        if(!seen.insert(id).second) continue;
        ++c.reachable;
        ++c.by_sign[static_cast<int>(t.at(id).sign)];
        for(NodeId ch : t.at(id).children) work.push_back(ch);
    }
    return c;
}

} // namespace

CheckerPtr Synthesizer::compile(const node_ptr& raw, ScopePtr scope, const CheckConf& conf){
    if(!scope) scope = builtin_scope();
    SpecTree tree = Reducer(*scope, Desugarer::standard(), conf.debug).reduce(raw);
    std::shared_ptr<CompiledChecker> out(new CompiledChecker(std::move(tree), raw, std::move(scope), conf.strategy));

    const SpecNode& root = out->tree().at(out->tree().root());
    if(conf.strategy==Strategy::O0 || root.sign==Sign::Ignorable){
        out->root_ = [](const node_ptr&){ return true; };
        out->trivial_ = true;
    } else {
        Synthesizer s(*out);
        out->root_ = s.emit(out->tree().root());
    }
    if(conf.debug){
        SignCounts c = count_signs(out->tree());
        std::fprintf(stderr, "[dbg][compile] %s strategy=%s nodes=%zu atomic=%zu union=%zu container=%zu literal=%zu predicate=%zu ignorable=%zu%s\n",
            out->tree().to_string(out->scope().classes()).c_str(), strategy_name(conf.strategy), c.reachable,
            c.by_sign[(int)Sign::Atomic], c.by_sign[(int)Sign::Union], c.by_sign[(int)Sign::Container],
            c.by_sign[(int)Sign::Literal], c.by_sign[(int)Sign::Predicate], c.by_sign[(int)Sign::Ignorable],
            out->trivial_ ? " (trivial)" : "");
    }
    return out;
}

CheckFn Synthesizer::emit(NodeId id){
    if(done_[id]) return fns_[id];
    if(active_[id]){
        // back-edge: resolved through the slot table once `id` is finished
        lazy_[id] = 1;
        const std::vector<CheckFn>* slots = &out_.slots_;
        return [slots, id](const node_ptr& v){ return (*slots)[id](v); };
    }
    active_[id] = 1;
    CheckFn fn = emit_node(id);
    active_[id] = 0;
    done_[id] = 1;
    fns_[id] = fn;
    if(lazy_[id]) out_.slots_[id] = fn;
    return fn;
}

bool Synthesizer::ignorable(NodeId id) const {
    return out_.tree().at(id).sign==Sign::Ignorable;
}

// Union evaluation order: cheapest first, declaration order within a cost.
int Synthesizer::cost(NodeId id) const {
    if(active_[id]) return 1;
    switch(out_.tree().at(id).sign){
        case Sign::Atomic:
        case Sign::Literal:
        case Sign::Ignorable: return 0;
        case Sign::Container:
        case Sign::Union:
        case Sign::Forward: return 1;
        case Sign::Predicate: return 2;
    }
    return 1;
}

CheckFn Synthesizer::emit_node(NodeId id){
    const SpecNode& n = out_.tree().at(id);
    const ClassTable* ct = classes_;
    switch(n.sign){
        case Sign::Ignorable:
            return [](const node_ptr&){ return true; };
        case Sign::Atomic: {
            ClassId cls = n.cls;
            return [ct, cls](const node_ptr& v){ return ct->is_instance(*v, cls); };
        }
        case Sign::Literal: {
            auto values = std::make_shared<const std::vector<node_ptr>>(n.values);
            if(values->size() <= 8)
                return [values](const node_ptr& v){
                    for(auto& x : *values) if(equal(x, v)) return true;
                    return false;
                };
            // only scalar values are hashed; a collection is compared against the collection
            // literals, which stops at the first size mismatch and never walks past a literal
            std::unordered_set<node_ptr, node_hash, node_equal> scalars;
            std::vector<node_ptr> compound;
            for(auto& x : *values){
                if(is_scalar(*x)) scalars.insert(x);
                else compound.push_back(x);
            }
            auto members = std::make_shared<const std::unordered_set<node_ptr, node_hash, node_equal>>(std::move(scalars));
            auto others = std::make_shared<const std::vector<node_ptr>>(std::move(compound));
            return [members, others](const node_ptr& v){
                if(is_scalar(*v)) return members->count(v)!=0;
                for(auto& x : *others) if(equal(x, v)) return true;
                return false;
            };
        }
        case Sign::Predicate: {
            auto f = as_native_fn(*n.predicate);
            if(!f || !f->fn) throw unsupported_specification("predicate '" + n.name + "' has no function");
            return f->fn;
        }
        case Sign::Union: return emit_union(n);
        case Sign::Container: return emit_container(n);
        case Sign::Forward:
            throw unresolved_forward_reference(n.name, "forward reference '" + n.name + "' reached synthesis unresolved");
    }
    throw unsupported_specification(std::string("cannot synthesize ") + sign_name(n.sign));
}

CheckFn Synthesizer::emit_union(const SpecNode& n){
    std::vector<NodeId> order = n.children;
    std::stable_sort(order.begin(), order.end(), [&](NodeId a, NodeId b){ return cost(a) < cost(b); });

    // all Atomic alternatives collapse into one class-set test, run first
    std::vector<ClassId> classes;
    std::vector<CheckFn> rest;
    for(NodeId c : order){
        const SpecNode& alt = out_.tree().at(c);
        if(!active_[c] && alt.sign==Sign::Atomic) classes.push_back(alt.cls);
        else rest.push_back(emit(c));
    }
    const ClassTable* ct = classes_;
    if(rest.empty())
        return [ct, classes](const node_ptr& v){
            ClassId k = ct->class_of(*v);
            for(ClassId c : classes) if(ct->is_subclass(k, c)) return true;
            return false;
        };
    return [ct, classes, rest](const node_ptr& v){
        if(!classes.empty()){
            ClassId k = ct->class_of(*v);
            for(ClassId c : classes) if(ct->is_subclass(k, c)) return true;
        }
        for(auto& f : rest) if(f(v)) return true;
        return false;
    };
}

CheckFn Synthesizer::emit_container(const SpecNode& n){
    const ClassTable* ct = classes_;
    const ClassId base = n.cls;
    const bool every = strategy_==Strategy::On;
    std::vector<CheckFn> kids;
    for(NodeId c : n.children) kids.push_back(ignorable(c) ? CheckFn() : emit(c));

    switch(n.arity){
        case Arity::Variadic: {
            CheckFn elem = kids[0];
            if(!elem) return [ct, base](const node_ptr& v){ return ct->is_instance(*v, base); };
            if(every)
                return [ct, base, elem](const node_ptr& v){
                    if(!ct->is_instance(*v, base)) return false;
                    auto xs = elements_of(*v);
                    if(!xs) return true;
                    for(auto& x : *xs) if(!elem(x)) return false;
                    return true;
                };
            return [ct, base, elem](const node_ptr& v){
                if(!ct->is_instance(*v, base)) return false;
                auto xs = elements_of(*v);
                if(!xs || xs->empty()) return true;
                return elem((*xs)[sample_index(xs->size())]);
            };
        }
        case Arity::Mapping: {
            CheckFn key = kids[0], val = kids[1];
            auto entry_ok = [key, val](const std::pair<node_ptr, node_ptr>& e){
                return (!key || key(e.first)) && (!val || val(e.second));
            };
            if(every)
                return [ct, base, entry_ok](const node_ptr& v){
                    if(!ct->is_instance(*v, base)) return false;
                    auto m = std::get_if<map>(&v->data);
                    if(!m) return true;
                    for(auto& e : m->entries) if(!entry_ok(e)) return false;
                    return true;
                };
            return [ct, base, entry_ok](const node_ptr& v){
                if(!ct->is_instance(*v, base)) return false;
                auto m = std::get_if<map>(&v->data);
                if(!m || m->entries.empty()) return true;
                return entry_ok(m->entries[sample_index(m->entries.size())]);
            };
        }
        case Arity::Fixed: break;
    }

    if(base!=class_id(Builtin::Vector)){
        // tagged class: one position, the inner form
        CheckFn inner = kids.empty() ? CheckFn() : kids[0];
        return [ct, base, inner](const node_ptr& v){
            if(!ct->is_instance(*v, base)) return false;
            auto tv = as_tagged(*v);
            return !inner || !tv || inner(tv->inner);
        };
    }

    const size_t arity = kids.size();
    bool deep = std::any_of(kids.begin(), kids.end(), [](const CheckFn& f){ return (bool)f; });
    if(!deep)
        return [arity](const node_ptr& v){
            auto vec = std::get_if<vector_t>(&v->data);
            return vec && vec->elems.size()==arity;
        };
    if(every)
        return [arity, kids](const node_ptr& v){
            auto vec = std::get_if<vector_t>(&v->data);
            if(!vec || vec->elems.size()!=arity) return false;
            for(size_t i=0;i<arity;++i) if(kids[i] && !kids[i](vec->elems[i])) return false;
            return true;
        };
    return [arity, kids](const node_ptr& v){
        auto vec = std::get_if<vector_t>(&v->data);
        if(!vec || vec->elems.size()!=arity) return false;
        size_t i = sample_index(arity);
        return !kids[i] || kids[i](vec->elems[i]);
    };
}

} // namespace hintc
