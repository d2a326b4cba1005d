#include "hintc/scope.hpp"
#include "hintc/errors.hpp"

namespace hintc {

void HintScope::ensure_fresh(const std::string& name) const {
    if(name.empty()) throw hint_error(codes::name_clash, "empty name");
    // `object` is the sentinel spelling of `any`
    if(name == "object" || has_name(name)) throw hint_error(codes::name_clash, "name '" + name + "' is already defined in this scope");
}

bool HintScope::has_name(const std::string& name) const {
    return classes_.lookup(name).has_value() || predicates_.count(name) || definitions_.count(name);
}

ClassId HintScope::define_class(const std::string& name, const std::vector<std::string>& parents){
    ensure_fresh(name);
    return classes_.define_class(name, parents);
}

void HintScope::define_predicate(const std::string& name, PredicateFn fn){
    ensure_fresh(name);
    if(!fn) throw hint_error(codes::name_clash, "predicate '" + name + "' has no function");
    predicates_.emplace(name, n_fn(name, std::move(fn)));
}

void HintScope::define(const std::string& name, node_ptr raw){
    ensure_fresh(name);
    if(!raw) throw hint_error(codes::unsupported, "definition '" + name + "' has no specification");
    definitions_.emplace(name, std::move(raw));
}

void HintScope::define(const std::string& name, std::string_view edn_text){
    define(name, parse(edn_text));
}

const node_ptr* HintScope::find_predicate(const std::string& name) const {
    auto it = predicates_.find(name);
    return it == predicates_.end() ? nullptr : &it->second;
}

const node_ptr* HintScope::find_definition(const std::string& name) const {
    auto it = definitions_.find(name);
    return it == definitions_.end() ? nullptr : &it->second;
}

std::vector<std::string> HintScope::all_names() const {
    std::vector<std::string> out;
    for(ClassId id=0; id<classes_.size(); ++id) out.push_back(classes_.name(id));
    for(auto& kv : predicates_) out.push_back(kv.first);
    for(auto& kv : definitions_) out.push_back(kv.first);
    return out;
}

ScopePtr builtin_scope(){
    static const ScopePtr scope = std::make_shared<const HintScope>();
    return scope;
}

} // namespace hintc
