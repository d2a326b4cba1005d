#pragma once
#include "hintc/value.hpp"
#include <unordered_map>
#include <unordered_set>
#include <functional>
#include <optional>

namespace hintc {

// Sugar expansion over raw specifications, run ahead of classification.
//
// Macros: signature std::optional<node_ptr>(const list& form)
//   Keyed by the head symbol of a list form. Return std::nullopt when the form does not apply
//   (e.g. wrong arity); the form is then left for the classifier to accept or reject.
//   A returned form is expanded again, so macros can expand to macros.
// Quoting heads: lists whose arguments are data rather than specifications (`literal`, `ref`,
//   `satisfies`) are never expanded below their head.
//
// Expansion copies the forms it rewrites; the caller's raw specification is never mutated,
// so its identity stays valid as a cache key.
class Desugarer {
public:
    using MacroFn = std::function<std::optional<node_ptr>(const list&)>;

    Desugarer& add_macro(std::string name, MacroFn fn){ macros_[std::move(name)] = std::move(fn); return *this; }
    Desugarer& add_quoting(std::string head){ quoting_.insert(std::move(head)); return *this; }
    bool has_macro(const std::string& name) const { return macros_.count(name)!=0; }

    node_ptr expand(const node_ptr& n) const { return expand_impl(n); }

    // Macros every compilation uses: nullable, one-of, and the bare container heads.
    static const Desugarer& standard();

private:
    std::unordered_map<std::string, MacroFn> macros_;
    std::unordered_set<std::string> quoting_{"literal", "ref", "satisfies"};

    static constexpr int max_expansions = 64;

    static const std::string* head_name(const node_ptr& n){
        auto l = as_list(*n);
        if(!l || l->elems.empty()) return nullptr;
        auto s = as_symbol(*l->elems[0]);
        return s ? &s->name : nullptr;
    }

    node_ptr expand_impl(const node_ptr& n) const {
        if(!n || !is_list(*n)) return n; // atoms, sets (literal shorthand), tagged refs: untouched
        node_ptr current = n;
        int rounds = 0;
        while(const std::string* head = head_name(current)){
            auto it = macros_.find(*head);
            if(it==macros_.end()) break;
            auto replaced = it->second(std::get<list>(current->data));
            if(!replaced) break;
            if(++rounds > max_expansions)
                throw parse_error("macro expansion of '" + *head + "' does not terminate");
            current = *replaced;
            if(!is_list(*current)) return current;
        }
        const std::string* head = head_name(current);
        if(head && quoting_.count(*head)) return current;
        const auto& elems = std::get<list>(current->data).elems;
        std::vector<node_ptr> out;
        out.reserve(elems.size());
        bool changed = false;
        for(size_t i=0;i<elems.size();++i){
            auto ch = i==0 ? elems[i] : expand_impl(elems[i]);
            changed = changed || ch.get()!=elems[i].get();
            out.push_back(std::move(ch));
        }
        if(!changed) return current;
        auto copy = std::make_shared<node>();
        copy->metadata = current->metadata;
        copy->data = list{std::move(out)};
        return copy;
    }
};

// Helper to construct a list form: (head args...)
inline node_ptr build_form(const std::string& head_symbol, std::vector<node_ptr> args){
    list l; l.elems.reserve(args.size()+1);
    l.elems.push_back(n_sym(head_symbol));
    for(auto& a : args) l.elems.push_back(std::move(a));
    return std::make_shared<node>(node{ std::move(l), {} });
}

inline const Desugarer& Desugarer::standard(){
    static const Desugarer d = []{
        Desugarer s;
        s.add_quoting("one-of");
        s.add_macro("nullable", [](const list& form)->std::optional<node_ptr>{
            if(form.elems.size()!=2) return std::nullopt;
            return build_form("optional", {form.elems[1]});
        });
        s.add_macro("one-of", [](const list& form)->std::optional<node_ptr>{
            return build_form("literal", std::vector<node_ptr>(form.elems.begin()+1, form.elems.end()));
        });
        for(const char* base : {"list", "vector", "set"}){
            std::string target = std::string(base) + "-of";
            s.add_macro(base, [target](const list& form)->std::optional<node_ptr>{
                if(form.elems.size()!=2) return std::nullopt;
                return build_form(target, {form.elems[1]});
            });
        }
        s.add_macro("map", [](const list& form)->std::optional<node_ptr>{
            if(form.elems.size()!=3) return std::nullopt;
            return build_form("map-of", {form.elems[1], form.elems[2]});
        });
        return s;
    }();
    return d;
}

} // namespace hintc
